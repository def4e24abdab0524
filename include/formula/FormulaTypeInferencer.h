#ifndef FORMULA_TYPE_INFERENCER_H
#define FORMULA_TYPE_INFERENCER_H

#include "data/DataTable.h"
#include <QVariant>
#include <QVector>

/**
 * @brief Heuristic column type for a set of sampled formula results
 *
 * Nulls are ignored. Checks run in a fixed order, first match wins:
 *   1. every value numeric          → Number
 *   2. every value exactly 0 or 1   → Boolean
 *   3. every value a parseable date → Date
 *   4. otherwise (or no values)     → String
 *
 * Engine results are always double, so 0/1 outputs classify as Number;
 * the Boolean branch only fires for native bool values passed through
 * from row data.
 */
class FormulaTypeInferencer {
public:
    static ColumnType classify(const QVector<QVariant> &values);

private:
    static bool isZeroOrOne(const QVariant &value);
    static bool isDateLike(const QVariant &value);
};

#endif // FORMULA_TYPE_INFERENCER_H
