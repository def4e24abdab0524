#include "formula/FormulaFunctions.h"
#include <QHash>

namespace {

using Id = FormulaFunctionId;
using Cat = FunctionCategory;

const FormulaFunctionInfo kFunctions[] = {
    {"SUM", Id::Sum, Cat::Aggregation},
    {"AVG", Id::Avg, Cat::Aggregation},
    {"COUNT", Id::Count, Cat::Aggregation},
    {"MIN", Id::Min, Cat::Aggregation},
    {"MAX", Id::Max, Cat::Aggregation},
    {"DISTINCT", Id::Distinct, Cat::Aggregation},

    {"IF", Id::If, Cat::Conditional},
    {"SWITCH", Id::Switch, Cat::Conditional},
    {"COALESCE", Id::Coalesce, Cat::Conditional},

    {"CONCATENATE", Id::Concatenate, Cat::Text},
    {"CONCAT", Id::Concatenate, Cat::Text},
    {"LEFT", Id::Left, Cat::Text},
    {"RIGHT", Id::Right, Cat::Text},
    {"MID", Id::Mid, Cat::Text},
    {"LEN", Id::Len, Cat::Text},
    {"UPPER", Id::Upper, Cat::Text},
    {"LOWER", Id::Lower, Cat::Text},
    {"TRIM", Id::Trim, Cat::Text},
    {"REPLACE", Id::Replace, Cat::Text},
    {"SUBSTITUTE", Id::Substitute, Cat::Text},

    {"ROUND", Id::Round, Cat::Math},
    {"FLOOR", Id::Floor, Cat::Math},
    {"CEIL", Id::Ceil, Cat::Math},
    {"CEILING", Id::Ceil, Cat::Math},
    {"ABS", Id::Abs, Cat::Math},
    {"POWER", Id::Power, Cat::Math},
    {"POW", Id::Power, Cat::Math},
    {"SQRT", Id::Sqrt, Cat::Math},
    {"MOD", Id::Mod, Cat::Math},
    {"LOG", Id::Log, Cat::Math},
    {"LOG10", Id::Log10, Cat::Math},
    {"EXP", Id::Exp, Cat::Math},

    {"YEAR", Id::Year, Cat::Date},
    {"MONTH", Id::Month, Cat::Date},
    {"DAY", Id::Day, Cat::Date},
    {"TODAY", Id::Today, Cat::Date},
    {"NOW", Id::Now, Cat::Date},
    {"DATEDIFF", Id::DateDiff, Cat::Date},
    {"DATEADD", Id::DateAdd, Cat::Date},

    {"TEXT", Id::Text, Cat::TypeConversion},
    {"VALUE", Id::Value, Cat::TypeConversion},
    {"INT", Id::Int, Cat::TypeConversion},
    {"FLOAT", Id::Float, Cat::TypeConversion},

    {"AND", Id::And, Cat::Logical},
    {"OR", Id::Or, Cat::Logical},
    {"NOT", Id::Not, Cat::Logical},
    {"TRUE", Id::True, Cat::Logical},
    {"FALSE", Id::False, Cat::Logical},
};

const QHash<QString, const FormulaFunctionInfo *> &functionIndex() {
  static const QHash<QString, const FormulaFunctionInfo *> index = [] {
    QHash<QString, const FormulaFunctionInfo *> h;
    for (const FormulaFunctionInfo &info : kFunctions)
      h.insert(QString::fromLatin1(info.name), &info);
    return h;
  }();
  return index;
}

} // namespace

const FormulaFunctionInfo *FormulaFunctions::find(const QString &name) {
  return functionIndex().value(name.toUpper(), nullptr);
}

bool FormulaFunctions::isAggregate(FormulaFunctionId id) {
  switch (id) {
  case Id::Sum:
  case Id::Avg:
  case Id::Count:
  case Id::Min:
  case Id::Max:
  case Id::Distinct:
    return true;
  default:
    return false;
  }
}

QStringList FormulaFunctions::names() {
  QStringList result;
  for (const FormulaFunctionInfo &info : kFunctions)
    result.append(QString::fromLatin1(info.name));
  return result;
}

QStringList FormulaFunctions::names(FunctionCategory category) {
  QStringList result;
  for (const FormulaFunctionInfo &info : kFunctions) {
    if (info.category == category)
      result.append(QString::fromLatin1(info.name));
  }
  return result;
}

QString FormulaFunctions::categoryName(FunctionCategory category) {
  switch (category) {
  case Cat::Aggregation:
    return "aggregation";
  case Cat::Conditional:
    return "conditional";
  case Cat::Text:
    return "text";
  case Cat::Math:
    return "math";
  case Cat::Date:
    return "date";
  case Cat::TypeConversion:
    return "type conversion";
  case Cat::Logical:
    return "logical";
  }
  return {};
}
