#ifndef DATA_TABLE_H
#define DATA_TABLE_H

/**
 * @file DataTable.h
 * @brief Tabular data model consumed by the formula engine
 *
 * Rows are keyed by column id. Column names are what users type inside
 * formulas; resolveColumnId() maps a typed name back to the id.
 */

#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantHash>
#include <QVector>

// ═══════════════════════════════════════════════════════════════════
// COLUMN
// ═══════════════════════════════════════════════════════════════════

enum class ColumnType {
    String,
    Number,
    Date,
    Boolean
};

QString columnTypeName(ColumnType type);

struct TableColumn {
    QString    id;              // stable key into TableRow
    QString    name;            // display name, referenced as [Name]
    ColumnType type = ColumnType::String;   // advisory only
    bool       isComputed = false;
    QString    formula;         // source text when isComputed
};

// column id → loosely typed scalar (double, QString, bool, date string, ...)
using TableRow = QVariantHash;

struct ComputedColumn {
    QString name;
    QString formula;
};

// ═══════════════════════════════════════════════════════════════════
// DATA TABLE
// ═══════════════════════════════════════════════════════════════════

struct DataTable {
    QString               name;
    QVector<TableColumn>  columns;
    QVector<TableRow>     rows;

    QStringList columnNames() const;
};

// Resolve a column reference: exact id, then exact name, then
// case-insensitive name/id. Returns an empty string when nothing matches.
QString resolveColumnId(const QVector<TableColumn> &columns,
                        const QString &name);

// "Unit Price" at index 3 → "col_3_unit_price"
QString makeColumnId(int index, const QString &name);

#endif // DATA_TABLE_H
