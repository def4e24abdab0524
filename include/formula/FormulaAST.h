#ifndef FORMULA_AST_H
#define FORMULA_AST_H

#include "formula/FormulaFunctions.h"
#include <QString>
#include <memory>
#include <vector>

// ═══════════════════════════════════════════════════════════════════
// AST NODE: immutable parsed expression tree
// ═══════════════════════════════════════════════════════════════════
//
// Closed set of node kinds; the evaluator and validator switch over Kind.
// Every node exclusively owns its children.

struct FormulaNode;
using FormulaNodePtr = std::unique_ptr<const FormulaNode>;

struct FormulaNode {
    enum class Kind {
        NumberLiteral,  // number
        StringLiteral,  // text
        ColumnRef,      // text = unresolved column name / id
        BinaryOp,       // text = operator, children = { left, right }
        UnaryOp,        // text = "-" or "NOT", children = { operand }
        FunctionCall,   // text = upper-case name, function, children = args
        Conditional     // IF: children = { condition, whenTrue, whenFalse }
    };

    Kind                         kind = Kind::NumberLiteral;
    double                       number = 0.0;
    QString                      text;
    FormulaFunctionId            function = FormulaFunctionId::Sum;
    std::vector<FormulaNodePtr>  children;
    int                          height = 1;  // levels in this subtree, leaf = 1

    const FormulaNode &child(int index) const { return *children[index]; }
    int childCount() const { return static_cast<int>(children.size()); }

    // S-expression rendering: "(+ 2 (* 3 4))", "(IF (> [x] 5) "big" "small")"
    QString toString() const;

    // ── Factories ──
    static FormulaNodePtr number(double value);
    static FormulaNodePtr string(const QString &value);
    static FormulaNodePtr column(const QString &name);
    static FormulaNodePtr binary(const QString &op, FormulaNodePtr left,
                                 FormulaNodePtr right);
    static FormulaNodePtr unary(const QString &op, FormulaNodePtr operand);
    static FormulaNodePtr call(const QString &name, FormulaFunctionId id,
                               std::vector<FormulaNodePtr> args);
    static FormulaNodePtr conditional(FormulaNodePtr condition,
                                      FormulaNodePtr whenTrue,
                                      FormulaNodePtr whenFalse);
};

#endif // FORMULA_AST_H
