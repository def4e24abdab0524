/**
 * @file FormulaTokenizer.cpp
 * @brief Lexer for the formula language
 *
 * Scan order at each position:
 *   whitespace → number → string → [column] → ( ) , → two-char operator
 *   → one-char operator → identifier → (anything else is skipped)
 */

#include "formula/FormulaTokenizer.h"
#include "formula/FormulaFunctions.h"

namespace {

bool isAsciiDigit(QChar ch) { return ch >= QLatin1Char('0') && ch <= QLatin1Char('9'); }

bool isSingleCharOperator(QChar ch) {
  switch (ch.unicode()) {
  case '+':
  case '-':
  case '*':
  case '/':
  case '%':
  case '^':
  case '&':
  case '=':
  case '<':
  case '>':
    return true;
  default:
    return false;
  }
}

} // namespace

QString FormulaToken::typeName(Type type) {
  switch (type) {
  case Number:
    return "Number";
  case String:
    return "String";
  case Function:
    return "Function";
  case Operator:
    return "Operator";
  case LParen:
    return "LParen";
  case RParen:
    return "RParen";
  case Comma:
    return "Comma";
  case ColumnRef:
    return "ColumnRef";
  case End:
    return "End";
  }
  return "Unknown";
}

bool FormulaTokenizer::isIdentStart(QChar ch) {
  return (ch >= QLatin1Char('a') && ch <= QLatin1Char('z')) ||
         (ch >= QLatin1Char('A') && ch <= QLatin1Char('Z')) ||
         ch == QLatin1Char('_');
}

bool FormulaTokenizer::isIdentChar(QChar ch) {
  return isIdentStart(ch) || isAsciiDigit(ch);
}

bool FormulaTokenizer::nextNonSpaceIs(const QString &formula, int pos,
                                      QChar expected) {
  while (pos < formula.length() && formula[pos].isSpace())
    ++pos;
  return pos < formula.length() && formula[pos] == expected;
}

QVector<FormulaToken> FormulaTokenizer::tokenize(const QString &expr) {
  QVector<FormulaToken> tokens;
  int i = 0;
  const int len = expr.length();

  while (i < len) {
    const QChar ch = expr[i];

    // Skip whitespace
    if (ch.isSpace()) {
      ++i;
      continue;
    }

    // Numbers: 123, 3.14, .5 (sign is a unary operator, no exponent)
    if (isAsciiDigit(ch) ||
        (ch == '.' && i + 1 < len && isAsciiDigit(expr[i + 1]))) {
      const int start = i;
      while (i < len && isAsciiDigit(expr[i]))
        ++i;
      if (i < len && expr[i] == '.') {
        ++i;
        while (i < len && isAsciiDigit(expr[i]))
          ++i;
      }
      QString text = expr.mid(start, i - start);
      if (text.endsWith('.'))
        text.chop(1);

      FormulaToken tok;
      tok.type = FormulaToken::Number;
      tok.numVal = text.toDouble();
      tok.position = start;
      tokens.append(tok);
      continue;
    }

    // String literal: "..." or '...', closing quote must match the opener
    if (ch == '"' || ch == '\'') {
      const int start = i;
      const QChar quote = ch;
      ++i;
      QString value;
      while (i < len && expr[i] != quote) {
        if (expr[i] == '\\' && i + 1 < len)
          ++i;
        value.append(expr[i]);
        ++i;
      }
      if (i < len)
        ++i; // closing quote

      FormulaToken tok;
      tok.type = FormulaToken::String;
      tok.strVal = value;
      tok.position = start;
      tokens.append(tok);
      continue;
    }

    // Column reference: [Column Name], raw text up to ']'
    if (ch == '[') {
      const int start = i;
      ++i;
      const int nameStart = i;
      while (i < len && expr[i] != ']')
        ++i;

      FormulaToken tok;
      tok.type = FormulaToken::ColumnRef;
      tok.strVal = expr.mid(nameStart, i - nameStart);
      tok.position = start;
      tok.bracketed = true;
      tokens.append(tok);
      if (i < len)
        ++i; // closing bracket
      continue;
    }

    if (ch == '(' || ch == ')' || ch == ',') {
      FormulaToken t;
      t.type = (ch == '(')   ? FormulaToken::LParen
               : (ch == ')') ? FormulaToken::RParen
                             : FormulaToken::Comma;
      t.strVal = ch;
      t.position = i;
      tokens.append(t);
      ++i;
      continue;
    }

    // Two-character operators
    if (i + 1 < len) {
      const QString two = expr.mid(i, 2);
      if (two == "<>" || two == "<=" || two == ">=") {
        FormulaToken tok;
        tok.type = FormulaToken::Operator;
        tok.strVal = two;
        tok.position = i;
        tokens.append(tok);
        i += 2;
        continue;
      }
    }

    // Single-character operators
    if (isSingleCharOperator(ch)) {
      FormulaToken tok;
      tok.type = FormulaToken::Operator;
      tok.strVal = ch;
      tok.position = i;
      tokens.append(tok);
      ++i;
      continue;
    }

    // Identifiers: [A-Za-z_][A-Za-z0-9_]*
    if (isIdentStart(ch)) {
      const int start = i;
      while (i < len && isIdentChar(expr[i]))
        ++i;
      const QString ident = expr.mid(start, i - start);
      const QString upper = ident.toUpper();

      FormulaToken tok;
      tok.position = start;

      // TRUE / FALSE are literals unless written as calls: TRUE()
      if ((upper == "TRUE" || upper == "FALSE") &&
          !nextNonSpaceIs(expr, i, QLatin1Char('('))) {
        tok.type = FormulaToken::Number;
        tok.numVal = (upper == "TRUE") ? 1.0 : 0.0;
      } else if (FormulaFunctions::isFunction(upper)) {
        tok.type = FormulaToken::Function;
        tok.strVal = upper;
      } else {
        // Bare identifier → bracket-free column reference
        tok.type = FormulaToken::ColumnRef;
        tok.strVal = ident;
      }
      tokens.append(tok);
      continue;
    }

    // Unknown character: skipped without a token
    ++i;
  }

  FormulaToken endTok;
  endTok.type = FormulaToken::End;
  endTok.position = len;
  tokens.append(endTok);
  return tokens;
}
