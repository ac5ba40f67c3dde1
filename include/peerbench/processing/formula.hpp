#pragma once
/**
 * @file formula.hpp
 * @brief KPI formula expressions over named line-item aggregates
 *
 * A formula is a small arithmetic expression whose operands are aggregate
 * names (sums of matching line items) and numeric constants:
 * - Binary ops: +, -, *, /
 * - Unary ops: -, abs()
 *
 * Evaluation never throws for data problems. A missing aggregate yields
 * InsufficientData and an exactly-zero denominator yields ZeroDenominator;
 * both surface as a null KPI value.
 */

#include "peerbench/core/types.hpp"
#include <cmath>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerbench {

// ============================================================================
// KPI Result
// ============================================================================

enum class KpiStatus {
  Ok,
  InsufficientData, ///< A referenced aggregate had no contributing rows
  ZeroDenominator,  ///< Division by exactly zero
  Unmapped          ///< KPI has no source mapping
};

const char *to_string(KpiStatus status);

/**
 * @brief Outcome of one KPI computation
 */
struct KpiResult {
  double value;
  KpiStatus status;

  KpiResult() : value(0.0), status(KpiStatus::InsufficientData) {}

  bool ok() const { return status == KpiStatus::Ok; }

  /// Value for the kpi_values table (null unless Ok)
  KpiValue as_value() const {
    return ok() ? KpiValue(value) : KpiValue(std::nullopt);
  }

  static KpiResult of(double v) {
    KpiResult r;
    r.value = v;
    r.status = KpiStatus::Ok;
    return r;
  }

  static KpiResult null(KpiStatus status) {
    KpiResult r;
    r.status = status;
    return r;
  }
};

/// Resolved aggregate: sum of the matching rows and how many rows matched
struct AggregateValue {
  double sum = 0.0;
  size_t count = 0;
};

using AggregateValues = std::unordered_map<std::string, AggregateValue>;

namespace expr {

class FormulaNode;
using ExprPtr = std::shared_ptr<const FormulaNode>;

enum class NodeType { AGGREGATE, CONSTANT, BINARY_OP, UNARY_OP };

/**
 * @brief Base class for formula nodes
 */
class FormulaNode {
public:
  virtual ~FormulaNode() = default;

  virtual NodeType node_type() const = 0;
  virtual KpiResult evaluate(const AggregateValues &values) const = 0;
  virtual void collect_dependencies(std::vector<std::string> &out) const = 0;
  virtual std::string to_string() const = 0;

  /// Aggregate names referenced by the formula, deduplicated, in order
  std::vector<std::string> get_dependencies() const;
};

/**
 * @brief Aggregate reference node
 */
class AggregateNode : public FormulaNode {
public:
  explicit AggregateNode(std::string name) : name_(std::move(name)) {}

  NodeType node_type() const override { return NodeType::AGGREGATE; }

  KpiResult evaluate(const AggregateValues &values) const override {
    auto it = values.find(name_);
    if (it == values.end() || it->second.count == 0) {
      return KpiResult::null(KpiStatus::InsufficientData);
    }
    return KpiResult::of(it->second.sum);
  }

  void collect_dependencies(std::vector<std::string> &out) const override {
    out.push_back(name_);
  }

  std::string to_string() const override { return name_; }

  const std::string &name() const { return name_; }

private:
  std::string name_;
};

/**
 * @brief Constant value node
 */
class ConstantNode : public FormulaNode {
public:
  explicit ConstantNode(double value) : value_(value) {}

  NodeType node_type() const override { return NodeType::CONSTANT; }

  KpiResult evaluate(const AggregateValues &) const override {
    return KpiResult::of(value_);
  }

  void collect_dependencies(std::vector<std::string> &) const override {}

  std::string to_string() const override;

  double value() const { return value_; }

private:
  double value_;
};

/**
 * @brief Binary operation node
 */
class BinaryOpNode : public FormulaNode {
public:
  enum class Op { ADD, SUB, MUL, DIV };

  BinaryOpNode(ExprPtr left, ExprPtr right, Op op)
      : left_(std::move(left)), right_(std::move(right)), op_(op) {}

  NodeType node_type() const override { return NodeType::BINARY_OP; }

  KpiResult evaluate(const AggregateValues &values) const override {
    KpiResult l = left_->evaluate(values);
    if (!l.ok()) {
      return l;
    }
    KpiResult r = right_->evaluate(values);
    if (!r.ok()) {
      return r;
    }

    switch (op_) {
    case Op::ADD:
      return KpiResult::of(l.value + r.value);
    case Op::SUB:
      return KpiResult::of(l.value - r.value);
    case Op::MUL:
      return KpiResult::of(l.value * r.value);
    case Op::DIV:
      if (r.value == 0.0) {
        return KpiResult::null(KpiStatus::ZeroDenominator);
      }
      return KpiResult::of(l.value / r.value);
    }
    return KpiResult::null(KpiStatus::InsufficientData);
  }

  void collect_dependencies(std::vector<std::string> &out) const override {
    left_->collect_dependencies(out);
    right_->collect_dependencies(out);
  }

  std::string to_string() const override {
    static const char *op_strs[] = {"+", "-", "*", "/"};
    return "(" + left_->to_string() + " " + op_strs[static_cast<int>(op_)] +
           " " + right_->to_string() + ")";
  }

private:
  ExprPtr left_, right_;
  Op op_;
};

/**
 * @brief Unary operation node
 */
class UnaryOpNode : public FormulaNode {
public:
  enum class Op { NEG, ABS };

  UnaryOpNode(ExprPtr operand, Op op) : operand_(std::move(operand)), op_(op) {}

  NodeType node_type() const override { return NodeType::UNARY_OP; }

  KpiResult evaluate(const AggregateValues &values) const override {
    KpiResult v = operand_->evaluate(values);
    if (!v.ok()) {
      return v;
    }
    return KpiResult::of(op_ == Op::NEG ? -v.value : std::abs(v.value));
  }

  void collect_dependencies(std::vector<std::string> &out) const override {
    operand_->collect_dependencies(out);
  }

  std::string to_string() const override {
    return std::string(op_ == Op::NEG ? "-" : "abs") + "(" +
           operand_->to_string() + ")";
  }

private:
  ExprPtr operand_;
  Op op_;
};

// Factory functions for creating nodes
inline ExprPtr make_aggregate(const std::string &name) {
  return std::make_shared<AggregateNode>(name);
}

inline ExprPtr make_constant(double value) {
  return std::make_shared<ConstantNode>(value);
}

/// Returns nullptr for an unknown operator
ExprPtr make_binary(ExprPtr left, ExprPtr right, const std::string &op);

/// Returns nullptr for an unknown operator
ExprPtr make_unary(ExprPtr operand, const std::string &op);

/**
 * @brief Parse formula text
 *
 * Grammar:
 *   expr    := term (('+' | '-') term)*
 *   term    := factor (('*' | '/') factor)*
 *   factor  := NUMBER | NAME | NAME '(' expr ')' | '(' expr ')' | '-' factor
 *
 * Names start with a letter or '_' and may contain letters, digits, '_'
 * and '.'. The only function is abs().
 *
 * @throws std::invalid_argument with the failing position on syntax errors
 */
ExprPtr parse_formula(const std::string &text);

} // namespace expr
} // namespace peerbench
