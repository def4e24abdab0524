#ifndef CSV_TABLE_LOADER_H
#define CSV_TABLE_LOADER_H

#include "data/DataTable.h"
#include <QString>
#include <QStringList>
#include <QVector>

/**
 * @brief Reads delimited text into a typed DataTable and writes it back
 *
 * The first record is the header. Quoted fields may contain the delimiter,
 * line breaks and doubled quotes (""). Column types are inferred from up to
 * 100 non-empty cells, trying boolean, number, date, then string; every
 * cell is then converted to its column's type (empty → null).
 */
class CsvTableLoader
{
public:
    static bool loadFile(const QString &filePath, DataTable &table,
                         QString *errorMsg = nullptr);

    static bool parse(const QString &text, DataTable &table,
                      QString *errorMsg = nullptr, QChar delimiter = ',');

    // Header of column names, then one line per row
    static QString toCsv(const DataTable &table, QChar delimiter = ',');

    static ColumnType inferColumnType(const QStringList &values);
    static QVariant parseValue(const QString &value, ColumnType type);

    // Split text into records of raw (unquoted) fields
    static QVector<QStringList> readRecords(const QString &text, QChar delimiter = ',');

private:
    // wholeField: the cleaned text must be a number end to end
    static bool parseNumber(const QString &value, double *out, bool wholeField = false);
    static QString quoteField(const QString &field, QChar delimiter);
};

#endif // CSV_TABLE_LOADER_H
