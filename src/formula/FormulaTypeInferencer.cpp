#include "formula/FormulaTypeInferencer.h"
#include "formula/FormulaCoercion.h"
#include "utils/DateUtils.h"
#include <algorithm>

using namespace FormulaCoercion;

bool FormulaTypeInferencer::isZeroOrOne(const QVariant &value) {
  if (value.userType() == QMetaType::Bool)
    return true;
  if (!isNumber(value))
    return false;
  const double d = value.toDouble();
  return d == 0.0 || d == 1.0;
}

bool FormulaTypeInferencer::isDateLike(const QVariant &value) {
  switch (value.userType()) {
  case QMetaType::QDate:
  case QMetaType::QDateTime:
    return true;
  case QMetaType::QString:
    return DateUtils::parseLenient(value.toString()).isValid();
  default:
    return false;
  }
}

ColumnType FormulaTypeInferencer::classify(const QVector<QVariant> &values) {
  QVector<QVariant> present;
  for (const QVariant &v : values) {
    if (!isNull(v))
      present.append(v);
  }
  if (present.isEmpty())
    return ColumnType::String;

  if (std::all_of(present.begin(), present.end(),
                  [](const QVariant &v) { return isNumber(v); }))
    return ColumnType::Number;
  if (std::all_of(present.begin(), present.end(), isZeroOrOne))
    return ColumnType::Boolean;
  if (std::all_of(present.begin(), present.end(), isDateLike))
    return ColumnType::Date;
  return ColumnType::String;
}
