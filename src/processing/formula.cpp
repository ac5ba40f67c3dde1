/**
 * @file formula.cpp
 * @brief Recursive-descent parser for KPI formulas
 */

#include "peerbench/processing/formula.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace peerbench {

const char *to_string(KpiStatus status) {
  switch (status) {
  case KpiStatus::Ok:
    return "ok";
  case KpiStatus::InsufficientData:
    return "insufficient_data";
  case KpiStatus::ZeroDenominator:
    return "zero_denominator";
  case KpiStatus::Unmapped:
    return "unmapped";
  }
  return "unknown";
}

namespace expr {

std::vector<std::string> FormulaNode::get_dependencies() const {
  std::vector<std::string> all;
  collect_dependencies(all);

  std::vector<std::string> unique;
  for (auto &name : all) {
    if (std::find(unique.begin(), unique.end(), name) == unique.end()) {
      unique.push_back(std::move(name));
    }
  }
  return unique;
}

std::string ConstantNode::to_string() const {
  std::ostringstream oss;
  oss << value_;
  return oss.str();
}

ExprPtr make_binary(ExprPtr left, ExprPtr right, const std::string &op) {
  BinaryOpNode::Op op_enum;
  if (op == "+")
    op_enum = BinaryOpNode::Op::ADD;
  else if (op == "-")
    op_enum = BinaryOpNode::Op::SUB;
  else if (op == "*")
    op_enum = BinaryOpNode::Op::MUL;
  else if (op == "/")
    op_enum = BinaryOpNode::Op::DIV;
  else
    return nullptr;

  return std::make_shared<BinaryOpNode>(std::move(left), std::move(right),
                                        op_enum);
}

ExprPtr make_unary(ExprPtr operand, const std::string &op) {
  UnaryOpNode::Op op_enum;
  if (op == "-" || op == "neg")
    op_enum = UnaryOpNode::Op::NEG;
  else if (op == "abs")
    op_enum = UnaryOpNode::Op::ABS;
  else
    return nullptr;

  return std::make_shared<UnaryOpNode>(std::move(operand), op_enum);
}

// ============================================================================
// Parser
// ============================================================================

namespace {

class FormulaParser {
public:
  explicit FormulaParser(const std::string &text) : text_(text), pos_(0) {}

  ExprPtr parse() {
    ExprPtr root = parse_expr();
    skip_whitespace();
    if (pos_ != text_.size()) {
      fail("unexpected '" + std::string(1, text_[pos_]) + "'");
    }
    return root;
  }

private:
  ExprPtr parse_expr() {
    ExprPtr left = parse_term();
    while (true) {
      skip_whitespace();
      if (peek() != '+' && peek() != '-') {
        return left;
      }
      std::string op(1, text_[pos_++]);
      left = make_binary(std::move(left), parse_term(), op);
    }
  }

  ExprPtr parse_term() {
    ExprPtr left = parse_factor();
    while (true) {
      skip_whitespace();
      if (peek() != '*' && peek() != '/') {
        return left;
      }
      std::string op(1, text_[pos_++]);
      left = make_binary(std::move(left), parse_factor(), op);
    }
  }

  ExprPtr parse_factor() {
    skip_whitespace();
    char c = peek();

    if (c == '-') {
      ++pos_;
      return make_unary(parse_factor(), "-");
    }

    if (c == '(') {
      ++pos_;
      ExprPtr inner = parse_expr();
      expect(')');
      return inner;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
      return parse_number();
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      std::string name = parse_name();
      skip_whitespace();
      if (peek() == '(') {
        ++pos_;
        ExprPtr argument = parse_expr();
        expect(')');
        ExprPtr call = make_unary(std::move(argument), name);
        if (!call) {
          fail("unknown function '" + name + "'");
        }
        return call;
      }
      return make_aggregate(name);
    }

    if (c == '\0') {
      fail("unexpected end of formula");
    }
    fail("unexpected '" + std::string(1, c) + "'");
    return nullptr;
  }

  ExprPtr parse_number() {
    const char *begin = text_.c_str() + pos_;
    char *end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
      fail("invalid number");
    }
    pos_ += static_cast<size_t>(end - begin);
    return make_constant(value);
  }

  std::string parse_name() {
    size_t start = pos_;
    while (pos_ < text_.size()) {
      unsigned char c = static_cast<unsigned char>(text_[pos_]);
      if (std::isalnum(c) || c == '_' || c == '.') {
        ++pos_;
      } else {
        break;
      }
    }
    return text_.substr(start, pos_ - start);
  }

  void expect(char c) {
    skip_whitespace();
    if (peek() != c) {
      fail("expected '" + std::string(1, c) + "'");
    }
    ++pos_;
  }

  char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  void skip_whitespace() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  [[noreturn]] void fail(const std::string &message) const {
    throw std::invalid_argument("Formula '" + text_ + "' at position " +
                                std::to_string(pos_) + ": " + message);
  }

  const std::string &text_;
  size_t pos_;
};

} // namespace

ExprPtr parse_formula(const std::string &text) {
  return FormulaParser(text).parse();
}

} // namespace expr
} // namespace peerbench
