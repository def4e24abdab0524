#include "formula/FormulaAST.h"
#include "formula/FormulaCoercion.h"
#include <QStringList>
#include <algorithm>
#include <memory>

namespace {

std::unique_ptr<FormulaNode> makeNode(FormulaNode::Kind kind) {
  auto node = std::make_unique<FormulaNode>();
  node->kind = kind;
  return node;
}

void adopt(FormulaNode &node, FormulaNodePtr child) {
  node.height = std::max(node.height, child->height + 1);
  node.children.push_back(std::move(child));
}

QString quoted(const QString &text) {
  QString escaped = text;
  escaped.replace("\\", "\\\\");
  escaped.replace("\"", "\\\"");
  return QString("\"%1\"").arg(escaped);
}

} // namespace

FormulaNodePtr FormulaNode::number(double value) {
  auto node = makeNode(Kind::NumberLiteral);
  node->number = value;
  return FormulaNodePtr(std::move(node));
}

FormulaNodePtr FormulaNode::string(const QString &value) {
  auto node = makeNode(Kind::StringLiteral);
  node->text = value;
  return FormulaNodePtr(std::move(node));
}

FormulaNodePtr FormulaNode::column(const QString &name) {
  auto node = makeNode(Kind::ColumnRef);
  node->text = name;
  return FormulaNodePtr(std::move(node));
}

FormulaNodePtr FormulaNode::binary(const QString &op, FormulaNodePtr left,
                                   FormulaNodePtr right) {
  auto node = makeNode(Kind::BinaryOp);
  node->text = op;
  adopt(*node, std::move(left));
  adopt(*node, std::move(right));
  return FormulaNodePtr(std::move(node));
}

FormulaNodePtr FormulaNode::unary(const QString &op, FormulaNodePtr operand) {
  auto node = makeNode(Kind::UnaryOp);
  node->text = op;
  adopt(*node, std::move(operand));
  return FormulaNodePtr(std::move(node));
}

FormulaNodePtr FormulaNode::call(const QString &name, FormulaFunctionId id,
                                 std::vector<FormulaNodePtr> args) {
  auto node = makeNode(Kind::FunctionCall);
  node->text = name;
  node->function = id;
  for (FormulaNodePtr &arg : args)
    adopt(*node, std::move(arg));
  return FormulaNodePtr(std::move(node));
}

FormulaNodePtr FormulaNode::conditional(FormulaNodePtr condition,
                                        FormulaNodePtr whenTrue,
                                        FormulaNodePtr whenFalse) {
  auto node = makeNode(Kind::Conditional);
  node->text = "IF";
  node->function = FormulaFunctionId::If;
  adopt(*node, std::move(condition));
  adopt(*node, std::move(whenTrue));
  adopt(*node, std::move(whenFalse));
  return FormulaNodePtr(std::move(node));
}

QString FormulaNode::toString() const {
  switch (kind) {
  case Kind::NumberLiteral:
    return FormulaCoercion::formatNumber(number);
  case Kind::StringLiteral:
    return quoted(text);
  case Kind::ColumnRef:
    return QString("[%1]").arg(text);
  case Kind::BinaryOp:
  case Kind::UnaryOp:
  case Kind::FunctionCall:
  case Kind::Conditional: {
    QStringList parts;
    parts << text;
    for (const FormulaNodePtr &c : children)
      parts << c->toString();
    return QString("(%1)").arg(parts.join(' '));
  }
  }
  return {};
}
