#include "formula/FormulaParser.h"

namespace {

FormulaSyntaxError tooDeep(const FormulaToken &at) {
  return FormulaSyntaxError(
      QString("Formula nested too deeply at position %1").arg(at.position),
      at.type, at.position);
}

// Bounds parse recursion; released on unwind as well
class DepthGuard {
public:
  DepthGuard(int &depth, int maxDepth, const FormulaToken &at) : m_depth(depth) {
    if (++m_depth > maxDepth) {
      --m_depth;
      throw tooDeep(at);
    }
  }
  ~DepthGuard() { --m_depth; }

private:
  int &m_depth;
};

} // namespace

FormulaParser::FormulaParser(const QVector<FormulaToken> &tokens, int maxDepth)
    : m_tokens(tokens), m_maxDepth(maxDepth) {
  if (m_tokens.isEmpty() || m_tokens.last().type != FormulaToken::End) {
    FormulaToken endTok;
    endTok.type = FormulaToken::End;
    endTok.position = m_tokens.isEmpty() ? 0 : m_tokens.last().position + 1;
    m_tokens.append(endTok);
  }
}

FormulaNodePtr FormulaParser::parseFormula(const QString &formula,
                                           int maxDepth) {
  FormulaParser parser(FormulaTokenizer::tokenize(formula), maxDepth);
  return parser.parse();
}

// ═══════════════════════════════════════════════════════════════════
// TOKEN HELPERS
// ═══════════════════════════════════════════════════════════════════

bool FormulaParser::atOperator(const char *op) const {
  return current().type == FormulaToken::Operator && current().strVal == op;
}

bool FormulaParser::atFunctionCall(const char *name) const {
  return current().type == FormulaToken::Function && current().strVal == name &&
         m_pos + 1 < m_tokens.size() &&
         m_tokens[m_pos + 1].type == FormulaToken::LParen;
}

const FormulaToken &FormulaParser::expect(FormulaToken::Type type) {
  const FormulaToken &tok = current();
  if (tok.type != type) {
    throw FormulaSyntaxError(QString("Expected %1 but got %2 at position %3")
                                 .arg(FormulaToken::typeName(type),
                                      FormulaToken::typeName(tok.type))
                                 .arg(tok.position),
                             tok.type, tok.position);
  }
  if (tok.type != FormulaToken::End)
    ++m_pos;
  return tok;
}

FormulaNodePtr FormulaParser::bounded(FormulaNodePtr node,
                                      const FormulaToken &at) const {
  if (node->height > m_maxDepth)
    throw tooDeep(at);
  return node;
}

FormulaSyntaxError FormulaParser::unexpectedToken() const {
  const FormulaToken &tok = current();
  return FormulaSyntaxError(QString("Unexpected %1 at position %2")
                                .arg(FormulaToken::typeName(tok.type))
                                .arg(tok.position),
                            tok.type, tok.position);
}

// ═══════════════════════════════════════════════════════════════════
// PARSER: recursive descent producing AST
// ═══════════════════════════════════════════════════════════════════

FormulaNodePtr FormulaParser::parse() {
  m_pos = 0;
  m_depth = 0;
  // Tokens after a complete expression are left unread: "[a] [b]" is [a]
  return parseExpr();
}

FormulaNodePtr FormulaParser::parseExpr() { return parseOr(); }

FormulaNodePtr FormulaParser::parseOr() {
  FormulaNodePtr left = parseAnd();
  while (atFunctionCall("OR"))
    left = parseInfixCall(std::move(left));
  return left;
}

FormulaNodePtr FormulaParser::parseAnd() {
  FormulaNodePtr left = parseComparison();
  while (atFunctionCall("AND"))
    left = parseInfixCall(std::move(left));
  return left;
}

FormulaNodePtr FormulaParser::parseInfixCall(FormulaNodePtr left) {
  const FormulaToken at = current();
  const QString name = at.strVal;
  const FormulaFunctionId id = name == "AND" ? FormulaFunctionId::And
                                             : FormulaFunctionId::Or;
  ++m_pos; // consume AND / OR
  expect(FormulaToken::LParen);

  std::vector<FormulaNodePtr> args;
  args.push_back(std::move(left));
  args.push_back(parseExpr());
  while (current().type == FormulaToken::Comma) {
    ++m_pos;
    args.push_back(parseExpr());
  }
  expect(FormulaToken::RParen);
  return bounded(FormulaNode::call(name, id, std::move(args)), at);
}

FormulaNodePtr FormulaParser::parseComparison() {
  FormulaNodePtr left = parseAddSub();

  while (atOperator("=") || atOperator("<>") || atOperator("<") ||
         atOperator(">") || atOperator("<=") || atOperator(">=")) {
    const FormulaToken at = current();
    ++m_pos;
    FormulaNodePtr right = parseAddSub();
    left = bounded(
        FormulaNode::binary(at.strVal, std::move(left), std::move(right)), at);
  }
  return left;
}

FormulaNodePtr FormulaParser::parseAddSub() {
  FormulaNodePtr left = parseMulDiv();

  while (atOperator("+") || atOperator("-") || atOperator("&")) {
    const FormulaToken at = current();
    ++m_pos;
    FormulaNodePtr right = parseMulDiv();
    left = bounded(
        FormulaNode::binary(at.strVal, std::move(left), std::move(right)), at);
  }
  return left;
}

FormulaNodePtr FormulaParser::parseMulDiv() {
  FormulaNodePtr left = parsePower();

  while (atOperator("*") || atOperator("/") || atOperator("%")) {
    const FormulaToken at = current();
    ++m_pos;
    FormulaNodePtr right = parsePower();
    left = bounded(
        FormulaNode::binary(at.strVal, std::move(left), std::move(right)), at);
  }
  return left;
}

FormulaNodePtr FormulaParser::parsePower() {
  FormulaNodePtr left = parseUnary();

  // 2^3^2 == (2^3)^2
  while (atOperator("^")) {
    const FormulaToken at = current();
    ++m_pos;
    FormulaNodePtr right = parseUnary();
    left = bounded(FormulaNode::binary("^", std::move(left), std::move(right)),
                   at);
  }
  return left;
}

FormulaNodePtr FormulaParser::parseUnary() {
  const FormulaToken at = current();
  DepthGuard guard(m_depth, m_maxDepth, at);

  if (atOperator("-")) {
    ++m_pos;
    return bounded(FormulaNode::unary("-", parseUnary()), at);
  }

  if (atFunctionCall("NOT")) {
    ++m_pos; // NOT
    ++m_pos; // (
    FormulaNodePtr operand = parseExpr();
    expect(FormulaToken::RParen);
    return bounded(FormulaNode::unary("NOT", std::move(operand)), at);
  }

  return parsePrimary();
}

FormulaNodePtr FormulaParser::parsePrimary() {
  const FormulaToken tok = current();

  switch (tok.type) {
  case FormulaToken::Number:
    ++m_pos;
    return FormulaNode::number(tok.numVal);

  case FormulaToken::String:
    ++m_pos;
    return FormulaNode::string(tok.strVal);

  case FormulaToken::ColumnRef:
    ++m_pos;
    return FormulaNode::column(tok.strVal);

  case FormulaToken::LParen: {
    ++m_pos; // consume '('
    FormulaNodePtr inner = parseExpr();
    expect(FormulaToken::RParen);
    return inner;
  }

  case FormulaToken::Function: {
    ++m_pos; // consume name
    expect(FormulaToken::LParen);

    // IF is always exactly three arguments
    if (tok.strVal == "IF") {
      FormulaNodePtr condition = parseExpr();
      expect(FormulaToken::Comma);
      FormulaNodePtr whenTrue = parseExpr();
      expect(FormulaToken::Comma);
      FormulaNodePtr whenFalse = parseExpr();
      expect(FormulaToken::RParen);
      return bounded(FormulaNode::conditional(std::move(condition),
                                              std::move(whenTrue),
                                              std::move(whenFalse)),
                     tok);
    }

    const FormulaFunctionInfo *info = FormulaFunctions::find(tok.strVal);
    if (!info) {
      throw FormulaSyntaxError(QString("Unknown function %1 at position %2")
                                   .arg(tok.strVal)
                                   .arg(tok.position),
                               tok.type, tok.position);
    }
    std::vector<FormulaNodePtr> args = parseArgList();
    expect(FormulaToken::RParen);
    return bounded(FormulaNode::call(tok.strVal, info->id, std::move(args)),
                   tok);
  }

  case FormulaToken::Operator:
  case FormulaToken::RParen:
  case FormulaToken::Comma:
  case FormulaToken::End:
    break;
  }
  throw unexpectedToken();
}

std::vector<FormulaNodePtr> FormulaParser::parseArgList() {
  std::vector<FormulaNodePtr> args;
  if (current().type == FormulaToken::RParen)
    return args;

  args.push_back(parseExpr());
  while (current().type == FormulaToken::Comma) {
    ++m_pos;
    args.push_back(parseExpr());
  }
  return args;
}
