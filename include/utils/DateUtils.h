#ifndef DATE_UTILS_H
#define DATE_UTILS_H

#include <QDateTime>
#include <QString>
#include <QStringList>

/**
 * @brief Utility class for lenient date parsing and formatting
 *
 * Centralizes the date coercion used by formula date functions, the type
 * inferencer and the CSV loader. All results are in UTC; inputs without an
 * explicit offset are read as UTC.
 */
class DateUtils {
public:
  /**
   * @brief Parse a date/time string in any of the common spreadsheet forms
   *
   * Handles:
   * - ISO 8601: "2024-12-26", "2024-12-26T10:30:00", "2024-12-26T10:30:00.250Z"
   * - ISO with space: "2024-12-26 10:30:00", "2024-12-26 10:30"
   * - Slashed: "2024/12/26", "12/26/2024", "12/26/24" (month first)
   * - Month names: "Dec 26, 2024", "December 26, 2024", "26 Dec 2024"
   * - Exchange style: "26DEC2024"
   * - RFC 2822: "Thu, 26 Dec 2024 10:30:00 +0000"
   * - Partial: "2024", "2024-12"
   *
   * @return UTC date/time, or an invalid QDateTime when nothing matches
   */
  static QDateTime parseLenient(const QString &input);

  /// "2024-12-26"
  static QString toIsoDate(const QDateTime &dateTime);

  /// "2024-12-26T10:30:00.000Z"
  static QString toIsoTimestamp(const QDateTime &dateTime);

  /// True when the UTC time of day is exactly 00:00:00.000
  static bool isMidnight(const QDateTime &dateTime);

  /**
   * @brief Shift a date by a number of days, months or years
   * @param unit "day"/"days"/"d", "month"/"months"/"m", "year"/"years"/"y"
   *             (case-insensitive); empty means days
   * @param ok   set to false when the unit is not recognised
   */
  static QDateTime addInterval(const QDateTime &dateTime, int amount,
                               const QString &unit, bool *ok = nullptr);

private:
  static QDateTime asUtc(const QDateTime &dateTime);

  // Month names for DDMMMYYYY format
  static const QStringList MONTH_NAMES;
  // Fallback formats tried with QLocale::c(), in order
  static const QStringList FORMATS;
};

#endif // DATE_UTILS_H
