#include "utils/DateUtils.h"
#include <QDate>
#include <QLocale>
#include <QRegularExpression>
#include <QTime>

// Month names for DDMMMYYYY format
const QStringList DateUtils::MONTH_NAMES = {"",    "JAN", "FEB", "MAR", "APR",
                                            "MAY", "JUN", "JUL", "AUG", "SEP",
                                            "OCT", "NOV", "DEC"};

const QStringList DateUtils::FORMATS = {
    "yyyy-MM-dd HH:mm:ss.zzz", "yyyy-MM-dd HH:mm:ss", "yyyy-MM-dd HH:mm",
    "yyyy/MM/dd HH:mm:ss",     "yyyy/M/d",            "M/d/yyyy HH:mm:ss",
    "M/d/yyyy H:mm",           "M/d/yyyy",            "MMM d, yyyy",
    "MMMM d, yyyy",            "MMM d yyyy",          "d MMM yyyy",
    "d MMMM yyyy"};

QDateTime DateUtils::asUtc(const QDateTime &dateTime) {
  if (!dateTime.isValid())
    return {};
  if (dateTime.timeSpec() == Qt::LocalTime)
    return QDateTime(dateTime.date(), dateTime.time(), Qt::UTC);
  return dateTime.toUTC();
}

QDateTime DateUtils::parseLenient(const QString &input) {
  const QString text = input.trimmed();
  if (text.isEmpty())
    return {};

  // ===== FORMAT 1: ISO 8601 (date-only, with 'T', with offset) =====
  if (text.at(0).isDigit() && text.contains('-')) {
    // "2024-12-26 10:30" is read as "2024-12-26T10:30"
    QString isoText = text;
    if (isoText.length() > 10 && isoText.at(10) == ' ')
      isoText[10] = 'T';
    QDateTime iso = QDateTime::fromString(isoText, Qt::ISODateWithMs);
    if (iso.isValid())
      return asUtc(iso);
    QDate isoDate = QDate::fromString(text, Qt::ISODate);
    if (isoDate.isValid())
      return QDateTime(isoDate, QTime(0, 0), Qt::UTC);
  }

  // ===== FORMAT 2: Partial ISO (e.g., "2024", "2024-12") =====
  static const QRegularExpression yearOnly("^(\\d{4})(?:-(\\d{1,2}))?$");
  QRegularExpressionMatch partial = yearOnly.match(text);
  if (partial.hasMatch()) {
    int month = partial.captured(2).isEmpty() ? 1 : partial.captured(2).toInt();
    QDate date(partial.captured(1).toInt(), month, 1);
    return date.isValid() ? QDateTime(date, QTime(0, 0), Qt::UTC) : QDateTime();
  }

  // ===== FORMAT 3: DDMMMYYYY (e.g., "26DEC2024") =====
  static const QRegularExpression ddmmmyyyy("^(\\d{1,2})([A-Za-z]{3})(\\d{4})$");
  QRegularExpressionMatch exch = ddmmmyyyy.match(text);
  if (exch.hasMatch()) {
    int monthNum = MONTH_NAMES.indexOf(exch.captured(2).toUpper());
    QDate date(exch.captured(3).toInt(), monthNum, exch.captured(1).toInt());
    if (monthNum >= 1 && date.isValid())
      return QDateTime(date, QTime(0, 0), Qt::UTC);
    return {};
  }

  // ===== FORMAT 4: M/d/yy, two-digit years map to 1950..2049 =====
  static const QRegularExpression shortYear(
      "^(\\d{1,2})/(\\d{1,2})/(\\d{2})$");
  QRegularExpressionMatch sy = shortYear.match(text);
  if (sy.hasMatch()) {
    int year = sy.captured(3).toInt();
    year += (year < 50) ? 2000 : 1900;
    QDate date(year, sy.captured(1).toInt(), sy.captured(2).toInt());
    return date.isValid() ? QDateTime(date, QTime(0, 0), Qt::UTC) : QDateTime();
  }

  // ===== FORMAT 5: RFC 2822 =====
  QDateTime rfc = QDateTime::fromString(text, Qt::RFC2822Date);
  if (rfc.isValid())
    return asUtc(rfc);

  // ===== FORMAT 6: Locale-independent explicit formats =====
  const QLocale c = QLocale::c();
  for (const QString &format : FORMATS) {
    QDateTime parsed = c.toDateTime(text, format);
    if (parsed.isValid())
      return asUtc(parsed);
  }

  return {};
}

QString DateUtils::toIsoDate(const QDateTime &dateTime) {
  return dateTime.toUTC().date().toString(Qt::ISODate);
}

QString DateUtils::toIsoTimestamp(const QDateTime &dateTime) {
  return dateTime.toUTC().toString("yyyy-MM-dd'T'HH:mm:ss.zzz'Z'");
}

bool DateUtils::isMidnight(const QDateTime &dateTime) {
  return dateTime.toUTC().time() == QTime(0, 0);
}

QDateTime DateUtils::addInterval(const QDateTime &dateTime, int amount,
                                 const QString &unit, bool *ok) {
  const QString u = unit.trimmed().toLower();
  if (ok)
    *ok = true;

  if (u.isEmpty() || u == "day" || u == "days" || u == "d")
    return dateTime.addDays(amount);
  if (u == "month" || u == "months" || u == "m")
    return dateTime.addMonths(amount);
  if (u == "year" || u == "years" || u == "y")
    return dateTime.addYears(amount);

  if (ok)
    *ok = false;
  return {};
}
