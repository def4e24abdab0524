#ifndef FORMULA_EVALUATOR_H
#define FORMULA_EVALUATOR_H

#include "data/DataTable.h"
#include "formula/FormulaAST.h"
#include "formula/FormulaOptions.h"
#include <QVariant>
#include <stdexcept>

class FormulaClock;

// ═══════════════════════════════════════════════════════════════════
// EVALUATION CONTEXT
// ═══════════════════════════════════════════════════════════════════
//
// allRows is optional: when nullptr, aggregate functions fall back to the
// current row only.

struct EvalContext {
    const TableRow              &row;
    const QVector<TableColumn>  &columns;
    const QVector<TableRow>     *allRows = nullptr;
};

class FormulaEvalError : public std::runtime_error {
public:
    explicit FormulaEvalError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

// ═══════════════════════════════════════════════════════════════════
// EVALUATOR: tree-walking interpreter
// ═══════════════════════════════════════════════════════════════════
//
// Stateless apart from its options; one instance may evaluate from
// several threads at once.

class FormulaEvaluator {
public:
    explicit FormulaEvaluator(const FormulaOptions &options = FormulaOptions());

    // Throws FormulaEvalError (unknown column, missing argument, nesting
    // too deep). Result is null, double or QString.
    QVariant evaluate(const FormulaNode &node, const EvalContext &ctx) const;

    // Same, with any failure downgraded to null
    QVariant evaluateOrNull(const FormulaNode &node,
                            const EvalContext &ctx) const;

    const FormulaOptions &options() const { return m_options; }

private:
    QVariant eval(const FormulaNode &node, const EvalContext &ctx,
                  int depth) const;
    QVariant evalColumn(const FormulaNode &node, const EvalContext &ctx) const;
    QVariant evalBinary(const FormulaNode &node, const EvalContext &ctx,
                        int depth) const;
    QVariant evalUnary(const FormulaNode &node, const EvalContext &ctx,
                       int depth) const;
    QVariant callFunction(const FormulaNode &node, const EvalContext &ctx,
                          int depth) const;
    QVariant aggregate(const FormulaNode &node, const EvalContext &ctx,
                       int depth) const;

    // Evaluates argument `index`; throws when the call has too few args
    QVariant arg(const FormulaNode &call, int index, const EvalContext &ctx,
                 int depth) const;

    const FormulaClock &clock() const;

    FormulaOptions m_options;
};

#endif // FORMULA_EVALUATOR_H
