#include "formula/FormulaEngine.h"
#include "formula/FormulaParser.h"
#include "formula/FormulaTypeInferencer.h"
#include "formula/FormulaValidator.h"
#include <QDebug>
#include <QtConcurrent>
#include <algorithm>

namespace {

struct RowSlot {
  const TableRow *row = nullptr;
  QVariant value;
};

} // namespace

FormulaEngine::FormulaEngine(const FormulaOptions &options)
    : m_options(options), m_evaluator(options) {}

// ═══════════════════════════════════════════════════════════════════
// COMPILE
// ═══════════════════════════════════════════════════════════════════

CompileResult FormulaEngine::compile(const QString &formula) const {
  CompileResult result;
  try {
    result.ast = std::shared_ptr<const FormulaNode>(
        FormulaParser::parseFormula(formula, m_options.maxDepth));
  } catch (const std::exception &e) {
    result.ast = std::shared_ptr<const FormulaNode>(FormulaNode::number(0.0));
    result.error = QString::fromUtf8(e.what());
    if (m_options.debug)
      qDebug() << "[Formula] compile error:" << result.error << "in" << formula;
  }
  return result;
}

// ═══════════════════════════════════════════════════════════════════
// EVALUATE
// ═══════════════════════════════════════════════════════════════════

QVariant FormulaEngine::evaluate(const FormulaNode &ast, const TableRow &row,
                                 const QVector<TableColumn> &columns,
                                 const QVector<TableRow> *allRows) const {
  const EvalContext ctx{row, columns, allRows};
  return m_evaluator.evaluateOrNull(ast, ctx);
}

QVariant FormulaEngine::evaluateString(const QString &formula,
                                       const TableRow &row,
                                       const QVector<TableColumn> &columns,
                                       const QVector<TableRow> *allRows) const {
  const CompileResult compiled = compile(formula);
  if (!compiled.ok())
    return QVariant();
  return evaluate(*compiled.ast, row, columns, allRows);
}

ComputeResult FormulaEngine::computeColumn(
    const QString &formula, const QVector<TableRow> &rows,
    const QVector<TableColumn> &columns) const {
  ComputeResult result;
  const CompileResult compiled = compile(formula);
  if (!compiled.ok()) {
    result.values = QVector<QVariant>(rows.size());
    result.error = compiled.error;
    return result;
  }

  const FormulaNode &ast = *compiled.ast;
  const bool parallel = m_options.parallelThreshold > 0 &&
                        rows.size() >= m_options.parallelThreshold;

  if (!parallel) {
    result.values.reserve(rows.size());
    for (const TableRow &row : rows)
      result.values.append(evaluate(ast, row, columns, &rows));
    return result;
  }

  // Rows are independent; each worker writes only its own slot
  QVector<RowSlot> work(rows.size());
  for (int i = 0; i < rows.size(); ++i)
    work[i].row = &rows[i];

  QtConcurrent::blockingMap(work, [&](RowSlot &slot) {
    slot.value = evaluate(ast, *slot.row, columns, &rows);
  });

  result.values.reserve(work.size());
  for (const RowSlot &slot : work)
    result.values.append(slot.value);
  return result;
}

// ═══════════════════════════════════════════════════════════════════
// VALIDATE / INFER / INTROSPECT
// ═══════════════════════════════════════════════════════════════════

ValidationResult FormulaEngine::validate(
    const QString &formula, const QVector<TableColumn> &columns) const {
  ValidationResult result;
  const CompileResult compiled = compile(formula);
  if (!compiled.ok()) {
    result.valid = false;
    result.error = compiled.error;
    return result;
  }

  QString error;
  if (!FormulaValidator::checkColumns(*compiled.ast, columns, &error)) {
    result.valid = false;
    result.error = error;
  }
  return result;
}

ColumnType FormulaEngine::inferType(const QString &formula,
                                    const QVector<TableColumn> &columns,
                                    const QVector<TableRow> &sampleRows) const {
  if (sampleRows.isEmpty())
    return ColumnType::String;

  const CompileResult compiled = compile(formula);
  if (!compiled.ok())
    return ColumnType::String;

  const int count =
      std::min(m_options.sampleSize, static_cast<int>(sampleRows.size()));
  QVector<QVariant> samples;
  samples.reserve(count);
  for (int i = 0; i < count; ++i)
    samples.append(evaluate(*compiled.ast, sampleRows[i], columns));

  return FormulaTypeInferencer::classify(samples);
}

QStringList FormulaEngine::referencedColumns(const QString &formula) const {
  const CompileResult compiled = compile(formula);
  if (!compiled.ok())
    return {};
  return FormulaValidator::referencedColumns(*compiled.ast);
}

// ═══════════════════════════════════════════════════════════════════
// COMPUTED COLUMNS
// ═══════════════════════════════════════════════════════════════════

QStringList FormulaEngine::applyComputedColumns(
    DataTable &table, const QVector<ComputedColumn> &computed) const {
  QStringList errors;

  for (const ComputedColumn &def : computed) {
    TableColumn column;
    column.id = makeColumnId(static_cast<int>(table.columns.size()), def.name);
    column.name = def.name;
    column.type = inferType(def.formula, table.columns, table.rows);
    column.isComputed = true;
    column.formula = def.formula;

    const ComputeResult values =
        computeColumn(def.formula, table.rows, table.columns);
    if (!values.error.isEmpty()) {
      errors.append(QString("%1: %2").arg(def.name, values.error));
      qWarning() << "[Formula] computed column" << def.name
                 << "failed to compile:" << values.error;
    }

    table.columns.append(column);
    for (int i = 0; i < table.rows.size(); ++i)
      table.rows[i].insert(column.id, values.values.value(i));
  }
  return errors;
}
