#pragma once

#include "statexpr/nodes/ValueNode.hpp"

namespace statexpr {

enum class Operator { Add, Sub, Mul, Div };

const char* symbol(Operator op);

// Applies one of the four arithmetic operators to the results of two
// children. Division by zero raises ArithmeticError.
class BinaryNode final : public ValueNode {
public:
  BinaryNode(Operator op, NodePtr lhs, NodePtr rhs);

  double evaluate(const Dump& dump) override;
  std::string describe() const override;
  void reset() override;

  Operator op() const { return op_; }
  const ValueNode& lhs() const { return *lhs_; }
  const ValueNode& rhs() const { return *rhs_; }

private:
  Operator op_;
  NodePtr lhs_;
  NodePtr rhs_;
};

} // namespace statexpr
