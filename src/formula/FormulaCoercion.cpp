#include "formula/FormulaCoercion.h"
#include "utils/DateUtils.h"
#include <QDate>
#include <QRegularExpression>
#include <QTime>
#include <cmath>
#include <cstdlib>

namespace FormulaCoercion {

bool isNull(const QVariant &value) {
  return !value.isValid() || value.userType() == QMetaType::Nullptr;
}

bool isNumber(const QVariant &value) {
  switch (value.userType()) {
  case QMetaType::Double:
  case QMetaType::Float:
  case QMetaType::Int:
  case QMetaType::UInt:
  case QMetaType::Long:
  case QMetaType::ULong:
  case QMetaType::LongLong:
  case QMetaType::ULongLong:
  case QMetaType::Short:
  case QMetaType::UShort:
    return true;
  default:
    return false;
  }
}

double toNumber(const QVariant &value) {
  if (isNull(value))
    return 0.0;
  if (value.userType() == QMetaType::Bool)
    return value.toBool() ? 1.0 : 0.0;
  if (isNumber(value)) {
    double d = value.toDouble();
    return std::isnan(d) ? 0.0 : d;
  }

  static const QRegularExpression stripChars("[$,%\\s]");
  static const QRegularExpression leadingFloat(
      "^[+-]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][+-]?\\d+)?");

  QString text = toText(value);
  text.remove(stripChars);
  QRegularExpressionMatch match = leadingFloat.match(text);
  if (!match.hasMatch())
    return 0.0;

  bool ok = false;
  double d = match.captured(0).toDouble(&ok);
  if (!ok || std::isnan(d))
    return 0.0;
  return d;
}

bool toBool(const QVariant &value) {
  if (isNull(value))
    return false;
  if (value.userType() == QMetaType::Bool)
    return value.toBool();
  if (isNumber(value))
    return value.toDouble() != 0.0;
  if (value.userType() == QMetaType::QString) {
    const QString lower = value.toString().toLower();
    return !lower.isEmpty() && lower != "false" && lower != "0" &&
           lower != "no";
  }
  return true;
}

QString formatNumber(double value) {
  if (std::isnan(value))
    return "NaN";
  if (std::isinf(value))
    return value > 0 ? "Infinity" : "-Infinity";
  if (value == 0.0)
    return "0";
  if (value == std::floor(value) && std::fabs(value) < 1e15)
    return QString::number(static_cast<qint64>(value));

  // Shortest significant digits that read back to the same double:
  // "d.ddde±x" → digits "dddd", exponent x
  const double magnitude = std::fabs(value);
  QString scientific;
  for (int precision = 0; precision <= 16; ++precision) {
    scientific = QString::number(magnitude, 'e', precision);
    if (scientific.toDouble() == magnitude)
      break;
  }
  const int ePos = scientific.indexOf('e');
  QString digits = scientific.left(ePos).remove('.');
  while (digits.length() > 1 && digits.endsWith('0'))
    digits.chop(1);
  const int exponent = scientific.mid(ePos + 1).toInt();

  // Fixed notation for 1e-7 < |value| < 1e21, exponent notation otherwise
  const int count = static_cast<int>(digits.length());
  const int point = exponent + 1; // digits before the decimal point
  QString text;
  if (point >= count && point <= 21) {
    text = digits + QString(point - count, '0');
  } else if (point > 0 && point <= 21) {
    text = digits.left(point) + '.' + digits.mid(point);
  } else if (point > -6 && point <= 0) {
    text = "0." + QString(-point, '0') + digits;
  } else {
    text = digits.left(1);
    if (count > 1)
      text += '.' + digits.mid(1);
    text += QString("e%1%2").arg(exponent < 0 ? '-' : '+').arg(std::abs(exponent));
  }
  return value < 0 ? '-' + text : text;
}

QString toText(const QVariant &value) {
  if (isNull(value))
    return QString("");

  switch (value.userType()) {
  case QMetaType::QString:
    return value.toString();
  case QMetaType::Bool:
    return value.toBool() ? "true" : "false";
  case QMetaType::QDate:
    return value.toDate().toString(Qt::ISODate);
  case QMetaType::QDateTime:
    return DateUtils::toIsoTimestamp(value.toDateTime());
  default:
    break;
  }
  if (isNumber(value))
    return formatNumber(value.toDouble());
  return value.toString();
}

QDateTime toDate(const QVariant &value) {
  if (isNull(value))
    return {};

  switch (value.userType()) {
  case QMetaType::QDateTime:
    return value.toDateTime().toUTC();
  case QMetaType::QDate:
    return QDateTime(value.toDate(), QTime(0, 0), Qt::UTC);
  case QMetaType::QString:
    return DateUtils::parseLenient(value.toString());
  default:
    return {};
  }
}

bool looselyEqual(const QVariant &left, const QVariant &right) {
  if (isNumber(left) || isNumber(right))
    return toNumber(left) == toNumber(right);
  return toText(left) == toText(right);
}

} // namespace FormulaCoercion
