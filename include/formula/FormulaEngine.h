#ifndef FORMULA_ENGINE_H
#define FORMULA_ENGINE_H

/**
 * @file FormulaEngine.h
 * @brief Spreadsheet-style formulas computed over table rows
 *
 * Public entry point for the formula language. Every operation is total:
 * syntax errors come back as an error string, evaluation failures as null.
 *
 * ═══════════════════════════════════════════════════════════════════
 * FORMULA SYNTAX
 * ═══════════════════════════════════════════════════════════════════
 *
 * ── Literals ──
 *   42, 3.14, .5, "text", 'text', TRUE, FALSE
 *
 * ── Column references (resolved per row by id, then name) ──
 *   [Unit Price]         → value of the "Unit Price" column
 *   Quantity             → bare identifier, same as [Quantity]
 *
 * ── Arithmetic / text ──
 *   +  -  *  /  %  ^ (left-associative)   & (concatenation)
 *
 * ── Comparison (return 1 for true, 0 for false) ──
 *   =  <>  <  >  <=  >=
 *
 * ── Logical ──
 *   [a] > 1 AND([b] < 2)     infix form, same tree as AND([a] > 1, [b] < 2)
 *   NOT(expr)
 *
 * ── Conditional ──
 *   IF(cond, then, else)  SWITCH(x, case, result, ..., [default])
 *   COALESCE(a, b, ...)
 *
 * ── Aggregates (whole table in computeColumn, current row otherwise) ──
 *   SUM AVG COUNT MIN MAX DISTINCT
 *
 * See FormulaFunctions.h for the full function list.
 *
 * ═══════════════════════════════════════════════════════════════════
 * USAGE EXAMPLE
 * ═══════════════════════════════════════════════════════════════════
 *
 *   FormulaEngine engine;
 *
 *   ComputeResult share = engine.computeColumn(
 *       "ROUND([Revenue] / SUM([Revenue]) * 100, 1)", table.rows, table.columns);
 *
 *   CompileResult tier = engine.compile("IF([Revenue]>1000,\"High\",\"Low\")");
 *   if (tier.ok())
 *       QVariant v = engine.evaluate(*tier.ast, row, table.columns);
 */

#include "data/DataTable.h"
#include "formula/FormulaAST.h"
#include "formula/FormulaEvaluator.h"
#include "formula/FormulaOptions.h"
#include <QStringList>
#include <QVariant>
#include <QVector>
#include <memory>

// ═══════════════════════════════════════════════════════════════════
// RESULTS
// ═══════════════════════════════════════════════════════════════════

struct CompileResult {
    std::shared_ptr<const FormulaNode> ast;   // literal 0 when error is set
    QString error;

    bool ok() const { return error.isEmpty(); }
};

struct ComputeResult {
    QVector<QVariant> values;   // one slot per input row, always
    QString error;              // compile error; all values null when set
};

struct ValidationResult {
    bool    valid = true;
    QString error;
};

// ═══════════════════════════════════════════════════════════════════
// FORMULA ENGINE
// ═══════════════════════════════════════════════════════════════════

class FormulaEngine {
public:
    explicit FormulaEngine(const FormulaOptions &options = FormulaOptions());
    ~FormulaEngine() = default;

    const FormulaOptions &options() const { return m_options; }

    // ── Compile ──
    CompileResult compile(const QString &formula) const;

    // ── Evaluate ──
    // allRows enables whole-table aggregates; nullptr = current row only.
    QVariant evaluate(const FormulaNode &ast, const TableRow &row,
                      const QVector<TableColumn> &columns,
                      const QVector<TableRow> *allRows = nullptr) const;
    QVariant evaluateString(const QString &formula, const TableRow &row,
                            const QVector<TableColumn> &columns,
                            const QVector<TableRow> *allRows = nullptr) const;

    // Evaluates against every row with allRows = rows.
    // values.size() == rows.size() even when the formula does not compile.
    ComputeResult computeColumn(const QString &formula,
                                const QVector<TableRow> &rows,
                                const QVector<TableColumn> &columns) const;

    // ── Validate (parse + column check, no evaluation) ──
    ValidationResult validate(const QString &formula,
                              const QVector<TableColumn> &columns) const;

    // ── Type inference over the first options().sampleSize rows ──
    ColumnType inferType(const QString &formula,
                         const QVector<TableColumn> &columns,
                         const QVector<TableRow> &sampleRows) const;

    // ── Introspection ──
    QStringList referencedColumns(const QString &formula) const;

    // Appends one computed column per entry, in order, so later formulas
    // can reference earlier ones. Returns "<name>: <error>" per failure.
    QStringList applyComputedColumns(DataTable &table,
                                     const QVector<ComputedColumn> &computed) const;

private:
    FormulaOptions   m_options;
    FormulaEvaluator m_evaluator;
};

#endif // FORMULA_ENGINE_H
