#include "data/DataTable.h"
#include <QRegularExpression>

QString columnTypeName(ColumnType type) {
  switch (type) {
  case ColumnType::String:
    return "string";
  case ColumnType::Number:
    return "number";
  case ColumnType::Date:
    return "date";
  case ColumnType::Boolean:
    return "boolean";
  }
  return "string";
}

QStringList DataTable::columnNames() const {
  QStringList names;
  for (const TableColumn &col : columns)
    names.append(col.name);
  return names;
}

QString resolveColumnId(const QVector<TableColumn> &columns,
                        const QString &name) {
  for (const TableColumn &col : columns) {
    if (col.id == name)
      return col.id;
  }
  for (const TableColumn &col : columns) {
    if (col.name == name)
      return col.id;
  }
  for (const TableColumn &col : columns) {
    if (col.name.compare(name, Qt::CaseInsensitive) == 0 ||
        col.id.compare(name, Qt::CaseInsensitive) == 0)
      return col.id;
  }
  return {};
}

QString makeColumnId(int index, const QString &name) {
  static const QRegularExpression nonWord("[^A-Za-z0-9_]");
  QString sanitized = name;
  sanitized.replace(nonWord, "_");
  return QString("col_%1_%2").arg(index).arg(sanitized.toLower());
}
