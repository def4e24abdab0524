#ifndef FORMULA_VALIDATOR_H
#define FORMULA_VALIDATOR_H

#include "data/DataTable.h"
#include "formula/FormulaAST.h"
#include <QStringList>

// Structural checks on a parsed formula. Never evaluates anything.
class FormulaValidator {
public:
    // Every column reference must resolve against `columns`.
    // On failure *errorMsg is "Unknown column: <name>" for the first miss.
    static bool checkColumns(const FormulaNode &root,
                             const QVector<TableColumn> &columns,
                             QString *errorMsg = nullptr);

    // Distinct column names as written, in first-occurrence order
    static QStringList referencedColumns(const FormulaNode &root);

private:
    static void collectColumnRefs(const FormulaNode &node, QStringList &out);
};

#endif // FORMULA_VALIDATOR_H
