#ifndef FORMULA_COERCION_H
#define FORMULA_COERCION_H

/**
 * @file FormulaCoercion.h
 * @brief Loose conversions between formula values
 *
 * Formula values are QVariant: an invalid variant is null, engine-produced
 * numbers are double, text is QString. Row data may also carry bool,
 * integer and QDate/QDateTime variants.
 */

#include <QDateTime>
#include <QString>
#include <QVariant>

namespace FormulaCoercion {

bool isNull(const QVariant &value);

// int/double/qlonglong ... (bool is not a number)
bool isNumber(const QVariant &value);

// null → 0, bool → 1/0, text → leading float after stripping "$ , %" and
// whitespace ("$1,200.50" → 1200.5, "12abc" → 12, "abc" → 0). Never NaN.
double toNumber(const QVariant &value);

// null → false, number → != 0, text → not "", "false", "0", "no"
bool toBool(const QVariant &value);

// null → "", 6.0 → "6", 3.14 → "3.14", true → "true", dates → ISO
QString toText(const QVariant &value);

// Number formatting used by toText()
QString formatNumber(double value);

// QDate/QDateTime pass through, text is parsed leniently, others invalid
QDateTime toDate(const QVariant &value);

// Loose equality used by "=", "<>" and SWITCH: numeric when either side
// is a number, otherwise exact text comparison
bool looselyEqual(const QVariant &left, const QVariant &right);

} // namespace FormulaCoercion

#endif // FORMULA_COERCION_H
