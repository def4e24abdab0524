/**
 * @file FormulaEvaluator.cpp
 * @brief Tree-walking evaluation of FormulaNode against a table row
 *
 * Values are QVariant: null (invalid), double or QString. Comparisons and
 * logical functions return 1.0 / 0.0 rather than bool.
 */

#include "formula/FormulaEvaluator.h"
#include "formula/FormulaClock.h"
#include "formula/FormulaCoercion.h"
#include "utils/DateUtils.h"
#include <QDebug>
#include <QSet>
#include <algorithm>
#include <climits>
#include <cmath>

using namespace FormulaCoercion;

namespace {

using Id = FormulaFunctionId;

QVariant boolResult(bool value) { return QVariant(value ? 1.0 : 0.0); }

// Character count / index from a formula number, truncated toward zero
int toCount(double value) {
  if (std::isnan(value))
    return 0;
  const double limit = INT_MAX / 2;
  value = std::max(-limit, std::min(limit, value));
  return static_cast<int>(value);
}

// Power-of-ten rounding shared by ROUND / FLOOR / CEIL
template <typename Fn>
double scaled(double value, double decimals, Fn round) {
  const double factor = std::pow(10.0, decimals);
  return round(value * factor) / factor;
}

bool isBlank(const QVariant &value) {
  return isNull(value) ||
         (value.userType() == QMetaType::QString && value.toString().isEmpty());
}

} // namespace

FormulaEvaluator::FormulaEvaluator(const FormulaOptions &options)
    : m_options(options) {}

const FormulaClock &FormulaEvaluator::clock() const {
  return m_options.clock ? *m_options.clock : FormulaClock::system();
}

QVariant FormulaEvaluator::evaluate(const FormulaNode &node,
                                    const EvalContext &ctx) const {
  return eval(node, ctx, 0);
}

QVariant FormulaEvaluator::evaluateOrNull(const FormulaNode &node,
                                          const EvalContext &ctx) const {
  try {
    return eval(node, ctx, 0);
  } catch (const std::exception &e) {
    if (m_options.debug)
      qDebug() << "[Formula] evaluation error:" << e.what();
    return QVariant();
  }
}

// ═══════════════════════════════════════════════════════════════════
// AST EVALUATOR
// ═══════════════════════════════════════════════════════════════════

QVariant FormulaEvaluator::eval(const FormulaNode &node, const EvalContext &ctx,
                                int depth) const {
  // depth counts levels above this node; a leaf of an n-level tree sits at
  // n - 1, matching the height limit FormulaParser enforces
  if (depth >= m_options.maxDepth)
    throw FormulaEvalError("Formula nested too deeply");

  switch (node.kind) {
  case FormulaNode::Kind::NumberLiteral:
    return QVariant(node.number);

  case FormulaNode::Kind::StringLiteral:
    return QVariant(node.text);

  case FormulaNode::Kind::ColumnRef:
    return evalColumn(node, ctx);

  case FormulaNode::Kind::BinaryOp:
    return evalBinary(node, ctx, depth);

  case FormulaNode::Kind::UnaryOp:
    return evalUnary(node, ctx, depth);

  case FormulaNode::Kind::Conditional:
    // Only the taken branch is evaluated
    return toBool(eval(node.child(0), ctx, depth + 1))
               ? eval(node.child(1), ctx, depth + 1)
               : eval(node.child(2), ctx, depth + 1);

  case FormulaNode::Kind::FunctionCall:
    return callFunction(node, ctx, depth);
  }
  throw FormulaEvalError("Unknown node kind");
}

QVariant FormulaEvaluator::evalColumn(const FormulaNode &node,
                                      const EvalContext &ctx) const {
  const QString id = resolveColumnId(ctx.columns, node.text);
  if (id.isEmpty())
    throw FormulaEvalError(QString("Unknown column: %1").arg(node.text));
  return ctx.row.value(id);
}

QVariant FormulaEvaluator::evalBinary(const FormulaNode &node,
                                      const EvalContext &ctx, int depth) const {
  const QVariant left = eval(node.child(0), ctx, depth + 1);
  const QVariant right = eval(node.child(1), ctx, depth + 1);
  const QString &op = node.text;

  if (op == "&")
    return QVariant(toText(left) + toText(right));
  if (op == "=")
    return boolResult(looselyEqual(left, right));
  if (op == "<>")
    return boolResult(!looselyEqual(left, right));

  const double l = toNumber(left);
  const double r = toNumber(right);

  if (op == "+")
    return QVariant(l + r);
  if (op == "-")
    return QVariant(l - r);
  if (op == "*")
    return QVariant(l * r);
  if (op == "/")
    return QVariant(l / r); // IEEE: x/0 → ±inf, 0/0 → NaN
  if (op == "%")
    return QVariant(std::fmod(l, r));
  if (op == "^")
    return QVariant(std::pow(l, r));
  if (op == "<")
    return boolResult(l < r);
  if (op == ">")
    return boolResult(l > r);
  if (op == "<=")
    return boolResult(l <= r);
  if (op == ">=")
    return boolResult(l >= r);

  throw FormulaEvalError(QString("Unknown operator: %1").arg(op));
}

QVariant FormulaEvaluator::evalUnary(const FormulaNode &node,
                                     const EvalContext &ctx, int depth) const {
  const QVariant operand = eval(node.child(0), ctx, depth + 1);
  if (node.text == "-")
    return QVariant(-toNumber(operand));
  if (node.text == "NOT")
    return boolResult(!toBool(operand));
  throw FormulaEvalError(QString("Unknown operator: %1").arg(node.text));
}

QVariant FormulaEvaluator::arg(const FormulaNode &call, int index,
                               const EvalContext &ctx, int depth) const {
  if (index >= call.childCount()) {
    throw FormulaEvalError(
        QString("%1: missing argument %2").arg(call.text).arg(index + 1));
  }
  return eval(call.child(index), ctx, depth + 1);
}

// ═══════════════════════════════════════════════════════════════════
// AGGREGATES: re-evaluate the argument once per row of allRows
// ═══════════════════════════════════════════════════════════════════

QVariant FormulaEvaluator::aggregate(const FormulaNode &node,
                                     const EvalContext &ctx, int depth) const {
  const Id id = node.function;

  // Single-row fallback
  if (!ctx.allRows) {
    if (id == Id::Count || id == Id::Distinct)
      return QVariant(1.0);
    return arg(node, 0, ctx, depth);
  }

  const QVector<TableRow> &rows = *ctx.allRows;
  if (id == Id::Count && node.childCount() == 0)
    return QVariant(static_cast<double>(rows.size()));
  if (node.childCount() == 0)
    throw FormulaEvalError(QString("%1: missing argument 1").arg(node.text));

  const FormulaNode &expr = node.child(0);
  auto valueAt = [&](const TableRow &row) {
    const EvalContext rowCtx{row, ctx.columns, ctx.allRows};
    return eval(expr, rowCtx, depth + 1);
  };

  switch (id) {
  case Id::Sum:
  case Id::Avg: {
    double sum = 0.0;
    for (const TableRow &row : rows)
      sum += toNumber(valueAt(row));
    if (id == Id::Sum)
      return QVariant(sum);
    if (rows.isEmpty())
      return QVariant();
    return QVariant(sum / rows.size());
  }
  case Id::Count: {
    int count = 0;
    for (const TableRow &row : rows) {
      if (!isBlank(valueAt(row)))
        ++count;
    }
    return QVariant(static_cast<double>(count));
  }
  case Id::Min:
  case Id::Max: {
    if (rows.isEmpty())
      return QVariant();
    double best = toNumber(valueAt(rows.first()));
    for (int i = 1; i < rows.size(); ++i) {
      const double v = toNumber(valueAt(rows[i]));
      best = (id == Id::Min) ? std::min(best, v) : std::max(best, v);
    }
    return QVariant(best);
  }
  case Id::Distinct: {
    QSet<QString> seen;
    bool sawNull = false;
    for (const TableRow &row : rows) {
      const QVariant v = valueAt(row);
      if (isNull(v))
        sawNull = true;
      else
        seen.insert(toText(v));
    }
    return QVariant(static_cast<double>(seen.size() + (sawNull ? 1 : 0)));
  }
  default:
    break;
  }
  throw FormulaEvalError(QString("Not an aggregate: %1").arg(node.text));
}

// ═══════════════════════════════════════════════════════════════════
// BUILT-IN FUNCTIONS
// ═══════════════════════════════════════════════════════════════════

QVariant FormulaEvaluator::callFunction(const FormulaNode &node,
                                        const EvalContext &ctx,
                                        int depth) const {
  auto a = [&](int index) { return arg(node, index, ctx, depth); };
  auto num = [&](int index) { return toNumber(a(index)); };
  auto text = [&](int index) { return toText(a(index)); };
  auto optionalNum = [&](int index, double fallback) {
    return index < node.childCount() ? num(index) : fallback;
  };

  switch (node.function) {
  // ── Aggregation ──
  case Id::Sum:
  case Id::Avg:
  case Id::Count:
  case Id::Min:
  case Id::Max:
  case Id::Distinct:
    return aggregate(node, ctx, depth);

  // ── Conditional ──
  case Id::Switch: {
    const QVariant subject = a(0);
    const int n = node.childCount();
    for (int i = 1; i < n - 1; i += 2) {
      if (looselyEqual(subject, a(i)))
        return a(i + 1);
    }
    if (n % 2 == 0)
      return a(n - 1); // default
    return QVariant();
  }

  case Id::Coalesce:
    for (int i = 0; i < node.childCount(); ++i) {
      const QVariant v = a(i);
      if (!isBlank(v))
        return v;
    }
    return QVariant();

  // ── Text ──
  case Id::Concatenate: {
    QString result;
    for (int i = 0; i < node.childCount(); ++i)
      result += text(i);
    return QVariant(result);
  }
  case Id::Left: {
    const QString s = text(0);
    return QVariant(s.left(std::max(toCount(num(1)), 0)));
  }
  case Id::Right: {
    const QString s = text(0);
    return QVariant(s.right(std::max(toCount(num(1)), 0)));
  }
  case Id::Mid: {
    const QString s = text(0);
    const int length = static_cast<int>(s.length());
    const int start = std::max(0, std::min(toCount(num(1)) - 1, length));
    const int count = std::max(toCount(num(2)), 0);
    return QVariant(s.mid(start, count));
  }
  case Id::Len:
    return QVariant(static_cast<double>(text(0).length()));
  case Id::Upper:
    return QVariant(text(0).toUpper());
  case Id::Lower:
    return QVariant(text(0).toLower());
  case Id::Trim:
    return QVariant(text(0).trimmed());
  case Id::Replace: {
    const QString s = text(0);
    const int length = static_cast<int>(s.length());
    const int start = std::max(0, std::min(toCount(num(1)) - 1, length));
    const int count = std::max(toCount(num(2)), 0);
    const QString replacement = text(3);
    const int tail = std::min(length, start + count);
    return QVariant(s.left(start) + replacement + s.mid(tail));
  }
  case Id::Substitute: {
    QString s = text(0);
    const QString find = text(1);
    const QString replacement = text(2);
    if (find.isEmpty()) {
      // Replacement goes between every pair of characters
      QStringList chars;
      for (const QChar ch : s)
        chars << QString(ch);
      return QVariant(chars.join(replacement));
    }
    return QVariant(s.replace(find, replacement));
  }

  // ── Math ──
  case Id::Round:
    return QVariant(scaled(num(0), optionalNum(1, 0.0),
                           [](double x) { return std::floor(x + 0.5); }));
  case Id::Floor:
    return QVariant(scaled(num(0), optionalNum(1, 0.0),
                           [](double x) { return std::floor(x); }));
  case Id::Ceil:
    return QVariant(scaled(num(0), optionalNum(1, 0.0),
                           [](double x) { return std::ceil(x); }));
  case Id::Abs:
    return QVariant(std::fabs(num(0)));
  case Id::Power:
    return QVariant(std::pow(num(0), num(1)));
  case Id::Sqrt:
    return QVariant(std::sqrt(num(0)));
  case Id::Mod:
    return QVariant(std::fmod(num(0), num(1)));
  case Id::Log:
    return QVariant(std::log(num(0)));
  case Id::Log10:
    return QVariant(std::log10(num(0)));
  case Id::Exp:
    return QVariant(std::exp(num(0)));

  // ── Date ──
  case Id::Year:
  case Id::Month:
  case Id::Day: {
    const QDateTime dt = toDate(a(0));
    if (!dt.isValid())
      return QVariant();
    const QDate d = dt.date();
    const int part = node.function == Id::Year    ? d.year()
                     : node.function == Id::Month ? d.month()
                                                  : d.day();
    return QVariant(static_cast<double>(part));
  }
  case Id::Today:
    return QVariant(DateUtils::toIsoDate(clock().now()));
  case Id::Now:
    return QVariant(DateUtils::toIsoTimestamp(clock().now()));
  case Id::DateDiff: {
    const QDateTime start = toDate(a(0));
    const QDateTime end = toDate(a(1));
    if (!start.isValid() || !end.isValid())
      return QVariant();
    const double days = start.msecsTo(end) / 86400000.0;
    return QVariant(std::floor(days));
  }
  case Id::DateAdd: {
    const QDateTime dt = toDate(a(0));
    const int amount = toCount(num(1));
    const QString unit = node.childCount() > 2 ? text(2) : QString();
    if (!dt.isValid())
      return QVariant();
    bool ok = false;
    const QDateTime shifted = DateUtils::addInterval(dt, amount, unit, &ok);
    if (!ok)
      throw FormulaEvalError(QString("DATEADD: unknown unit '%1'").arg(unit));
    return QVariant(DateUtils::isMidnight(shifted)
                        ? DateUtils::toIsoDate(shifted)
                        : DateUtils::toIsoTimestamp(shifted));
  }

  // ── Type conversion ──
  case Id::Text:
    return QVariant(text(0));
  case Id::Value:
  case Id::Float:
    return QVariant(num(0));
  case Id::Int:
    return QVariant(std::floor(num(0)));

  // ── Logical ── (every argument is evaluated)
  case Id::And: {
    bool all = true;
    for (int i = 0; i < node.childCount(); ++i)
      all = toBool(a(i)) && all;
    return boolResult(all);
  }
  case Id::Or: {
    bool any = false;
    for (int i = 0; i < node.childCount(); ++i)
      any = toBool(a(i)) || any;
    return boolResult(any);
  }
  case Id::True:
    return QVariant(1.0);
  case Id::False:
    return QVariant(0.0);

  // Parsed into Conditional / UnaryOp nodes, never FunctionCall
  case Id::If:
  case Id::Not:
    break;
  }
  throw FormulaEvalError(QString("Unknown function: %1").arg(node.text));
}
