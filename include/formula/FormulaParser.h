#ifndef FORMULA_PARSER_H
#define FORMULA_PARSER_H

/**
 * @file FormulaParser.h
 * @brief Recursive-descent parser producing a FormulaNode tree
 *
 * Grammar (precedence low → high):
 *   expr        := or
 *   or          := and ('OR(' expr (',' expr)* ')')*
 *   and         := comparison ('AND(' expr (',' expr)* ')')*
 *   comparison  := addSub (('='|'<>'|'<'|'>'|'<='|'>=') addSub)*
 *   addSub      := mulDiv (('+'|'-'|'&') mulDiv)*
 *   mulDiv      := power (('*'|'/'|'%') power)*
 *   power       := unary ('^' unary)*            left-associative
 *   unary       := '-' unary | 'NOT(' expr ')' | primary
 *   primary     := NUMBER | STRING | COLUMN
 *                | 'IF(' expr ',' expr ',' expr ')'
 *                | FUNCTION '(' [expr (',' expr)*] ')'
 *                | '(' expr ')'
 *
 * Infix AND( / OR( fold the already-parsed left operand in as the first
 * argument, so "a AND(b)" and "AND(a, b)" produce the same tree.
 *
 * maxDepth bounds both the parse recursion and the height of the built tree
 * (a flat chain "1+1+...+1" of n terms is n levels high), using the same
 * count FormulaEvaluator applies.
 */

#include "formula/FormulaAST.h"
#include "formula/FormulaTokenizer.h"
#include <QVector>
#include <stdexcept>

// ═══════════════════════════════════════════════════════════════════
// SYNTAX ERROR
// ═══════════════════════════════════════════════════════════════════

class FormulaSyntaxError : public std::runtime_error {
public:
    FormulaSyntaxError(const QString &message, FormulaToken::Type tokenType,
                       int position)
        : std::runtime_error(message.toStdString()), m_tokenType(tokenType),
          m_position(position) {}

    FormulaToken::Type tokenType() const { return m_tokenType; }
    int position() const { return m_position; }

private:
    FormulaToken::Type m_tokenType;
    int m_position;
};

// ═══════════════════════════════════════════════════════════════════
// PARSER
// ═══════════════════════════════════════════════════════════════════

class FormulaParser {
public:
    explicit FormulaParser(const QVector<FormulaToken> &tokens,
                           int maxDepth = 200);

    // Parses one expression from the start of the token sequence; anything
    // after it is ignored. Throws FormulaSyntaxError.
    FormulaNodePtr parse();

    // tokenize + parse
    static FormulaNodePtr parseFormula(const QString &formula,
                                       int maxDepth = 200);

private:
    FormulaNodePtr parseExpr();
    FormulaNodePtr parseOr();
    FormulaNodePtr parseAnd();
    FormulaNodePtr parseComparison();
    FormulaNodePtr parseAddSub();
    FormulaNodePtr parseMulDiv();
    FormulaNodePtr parsePower();
    FormulaNodePtr parseUnary();
    FormulaNodePtr parsePrimary();

    // Infix "AND(" / "OR(": left operand becomes argument 0
    FormulaNodePtr parseInfixCall(FormulaNodePtr left);
    std::vector<FormulaNodePtr> parseArgList();

    const FormulaToken &current() const { return m_tokens[m_pos]; }
    bool atOperator(const char *op) const;
    bool atFunctionCall(const char *name) const;
    const FormulaToken &expect(FormulaToken::Type type);
    FormulaSyntaxError unexpectedToken() const;
    // Throws once the tree rooted at node exceeds m_maxDepth levels
    FormulaNodePtr bounded(FormulaNodePtr node, const FormulaToken &at) const;

    QVector<FormulaToken> m_tokens;
    int m_pos = 0;
    int m_depth = 0;
    int m_maxDepth;
};

#endif // FORMULA_PARSER_H
