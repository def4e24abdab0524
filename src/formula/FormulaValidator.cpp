#include "formula/FormulaValidator.h"

void FormulaValidator::collectColumnRefs(const FormulaNode &node,
                                         QStringList &out) {
  switch (node.kind) {
  case FormulaNode::Kind::ColumnRef:
    out.append(node.text);
    return;
  case FormulaNode::Kind::NumberLiteral:
  case FormulaNode::Kind::StringLiteral:
    return;
  case FormulaNode::Kind::BinaryOp:
  case FormulaNode::Kind::UnaryOp:
  case FormulaNode::Kind::FunctionCall:
  case FormulaNode::Kind::Conditional:
    for (const FormulaNodePtr &child : node.children)
      collectColumnRefs(*child, out);
    return;
  }
}

bool FormulaValidator::checkColumns(const FormulaNode &root,
                                    const QVector<TableColumn> &columns,
                                    QString *errorMsg) {
  QStringList refs;
  collectColumnRefs(root, refs);
  for (const QString &name : refs) {
    if (resolveColumnId(columns, name).isEmpty()) {
      if (errorMsg)
        *errorMsg = QString("Unknown column: %1").arg(name);
      return false;
    }
  }
  return true;
}

QStringList FormulaValidator::referencedColumns(const FormulaNode &root) {
  QStringList refs;
  collectColumnRefs(root, refs);
  refs.removeDuplicates();
  return refs;
}
