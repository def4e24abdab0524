#include "data/CsvTableLoader.h"
#include "formula/FormulaCoercion.h"
#include "utils/DateUtils.h"
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTextStream>
#include <cmath>

namespace {

const int kTypeSampleLimit = 100;

const QStringList kBooleanWords = {"true", "false", "yes", "no", "1", "0"};

bool looksLikeDate(const QString &value)
{
    static const QRegularExpression isoPrefix("^\\d{4}-\\d{2}-\\d{2}");
    static const QRegularExpression slashed("^\\d{1,2}/\\d{1,2}/\\d{2,4}");
    static const QRegularExpression dashed("^\\d{1,2}-\\d{1,2}-\\d{2,4}");

    if (!isoPrefix.match(value).hasMatch() && !slashed.match(value).hasMatch() &&
        !dashed.match(value).hasMatch())
        return false;
    return DateUtils::parseLenient(value).isValid();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// LOADING
// ═══════════════════════════════════════════════════════════════════

bool CsvTableLoader::loadFile(const QString &filePath, DataTable &table,
                              QString *errorMsg)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QString error = QString("Failed to open data file: %1 (%2)")
                            .arg(filePath, file.errorString());
        qWarning() << "[CsvTableLoader]" << error;
        if (errorMsg)
            *errorMsg = error;
        return false;
    }

    QTextStream in(&file);
    const QString text = in.readAll();
    file.close();

    if (!parse(text, table, errorMsg))
        return false;

    table.name = QFileInfo(filePath).completeBaseName();
    qDebug() << "[CsvTableLoader] Loaded" << table.rows.size() << "rows,"
             << table.columns.size() << "columns from" << filePath;
    return true;
}

bool CsvTableLoader::parse(const QString &text, DataTable &table,
                           QString *errorMsg, QChar delimiter)
{
    const QVector<QStringList> records = readRecords(text, delimiter);
    if (records.size() < 2) {
        QString error = "File contains no data";
        qWarning() << "[CsvTableLoader]" << error;
        if (errorMsg)
            *errorMsg = error;
        return false;
    }

    const QStringList header = records.first();
    const int columnCount = header.size();

    table.columns.clear();
    table.rows.clear();

    for (int c = 0; c < columnCount; ++c) {
        QStringList values;
        for (int r = 1; r < records.size(); ++r)
            values.append(records[r].value(c));

        TableColumn column;
        column.name = header[c].trimmed();
        column.id = makeColumnId(c, column.name);
        column.type = inferColumnType(values);
        table.columns.append(column);
    }

    table.rows.reserve(records.size() - 1);
    for (int r = 1; r < records.size(); ++r) {
        TableRow row;
        for (int c = 0; c < columnCount; ++c) {
            const TableColumn &column = table.columns[c];
            row.insert(column.id, parseValue(records[r].value(c), column.type));
        }
        table.rows.append(row);
    }
    return true;
}

QVector<QStringList> CsvTableLoader::readRecords(const QString &text,
                                                 QChar delimiter)
{
    QVector<QStringList> records;
    QStringList fields;
    QString field;
    bool inQuotes = false;
    bool recordHasContent = false;

    auto endField = [&]() {
        fields.append(field);
        field.clear();
    };
    auto endRecord = [&]() {
        endField();
        // Blank lines are not records
        if (recordHasContent || fields.size() > 1)
            records.append(fields);
        fields.clear();
        recordHasContent = false;
    };

    const int len = text.length();
    for (int i = 0; i < len; ++i) {
        const QChar ch = text[i];

        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < len && text[i + 1] == '"') {
                    field.append('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.append(ch);
            }
            continue;
        }

        if (ch == '"') {
            inQuotes = true;
            recordHasContent = true;
        } else if (ch == delimiter) {
            endField();
        } else if (ch == '\r') {
            if (i + 1 < len && text[i + 1] == '\n')
                ++i;
            endRecord();
        } else if (ch == '\n') {
            endRecord();
        } else {
            field.append(ch);
            recordHasContent = true;
        }
    }

    if (recordHasContent || !fields.isEmpty() || !field.isEmpty())
        endRecord();
    return records;
}

// ═══════════════════════════════════════════════════════════════════
// TYPE INFERENCE / CONVERSION
// ═══════════════════════════════════════════════════════════════════

bool CsvTableLoader::parseNumber(const QString &value, double *out, bool wholeField)
{
    static const QRegularExpression stripChars("[$,%\\s]");
    static const QRegularExpression leadingFloat(
        "^[+-]?(?:\\d+\\.?\\d*|\\.\\d+)(?:[eE][+-]?\\d+)?");

    QString cleaned = value;
    cleaned.remove(stripChars);
    QRegularExpressionMatch match = leadingFloat.match(cleaned);
    if (!match.hasMatch())
        return false;
    if (wholeField && match.capturedLength(0) != cleaned.length())
        return false;

    bool ok = false;
    const double d = match.captured(0).toDouble(&ok);
    if (!ok || !std::isfinite(d))
        return false;
    if (out)
        *out = d;
    return true;
}

ColumnType CsvTableLoader::inferColumnType(const QStringList &values)
{
    QStringList samples;
    for (const QString &v : values) {
        if (v.isEmpty())
            continue;
        samples.append(v);
        if (samples.size() >= kTypeSampleLimit)
            break;
    }
    if (samples.isEmpty())
        return ColumnType::String;

    bool allBoolean = true;
    bool allNumbers = true;
    bool allDates = true;
    for (const QString &v : samples) {
        if (!kBooleanWords.contains(v.trimmed().toLower()))
            allBoolean = false;
        if (!parseNumber(v.trimmed(), nullptr, true))
            allNumbers = false;
        if (!looksLikeDate(v.trimmed()))
            allDates = false;
    }

    if (allBoolean)
        return ColumnType::Boolean;
    if (allNumbers)
        return ColumnType::Number;
    if (allDates)
        return ColumnType::Date;
    return ColumnType::String;
}

QVariant CsvTableLoader::parseValue(const QString &value, ColumnType type)
{
    if (value.isEmpty())
        return QVariant();

    switch (type) {
    case ColumnType::Number: {
        double d = 0.0;
        if (!parseNumber(value.trimmed(), &d))
            return QVariant();
        return QVariant(d);
    }
    case ColumnType::Boolean: {
        const QString lower = value.trimmed().toLower();
        if (lower == "true" || lower == "yes" || lower == "1")
            return QVariant(true);
        if (lower == "false" || lower == "no" || lower == "0")
            return QVariant(false);
        return QVariant();
    }
    case ColumnType::Date: {
        const QDateTime dt = DateUtils::parseLenient(value);
        if (!dt.isValid())
            return QVariant();
        return QVariant(DateUtils::toIsoTimestamp(dt));
    }
    case ColumnType::String:
        break;
    }
    return QVariant(value);
}

// ═══════════════════════════════════════════════════════════════════
// WRITING
// ═══════════════════════════════════════════════════════════════════

QString CsvTableLoader::quoteField(const QString &field, QChar delimiter)
{
    if (field.contains(delimiter) || field.contains('"') || field.contains('\n') ||
        field.contains('\r')) {
        QString escaped = field;
        escaped.replace("\"", "\"\"");
        return QString("\"%1\"").arg(escaped);
    }
    return field;
}

QString CsvTableLoader::toCsv(const DataTable &table, QChar delimiter)
{
    QStringList lines;

    QStringList header;
    for (const TableColumn &column : table.columns)
        header.append(quoteField(column.name, delimiter));
    lines.append(header.join(delimiter));

    for (const TableRow &row : table.rows) {
        QStringList fields;
        for (const TableColumn &column : table.columns)
            fields.append(quoteField(FormulaCoercion::toText(row.value(column.id)),
                                     delimiter));
        lines.append(fields.join(delimiter));
    }
    return lines.join('\n');
}
