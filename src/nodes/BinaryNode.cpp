#include "statexpr/nodes/BinaryNode.hpp"
#include "statexpr/nodes/Math.hpp"
#include "statexpr/Errors.hpp"

namespace statexpr {

const char* symbol(Operator op) {
  switch (op) {
    case Operator::Add: return "+";
    case Operator::Sub: return "-";
    case Operator::Mul: return "*";
    case Operator::Div: return "/";
  }
  return "?";
}

BinaryNode::BinaryNode(Operator op, NodePtr lhs, NodePtr rhs)
  : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs))
{
  if (!lhs_ || !rhs_) throw TypeError(std::string("operator '") + symbol(op) + "': missing operand");
}

double BinaryNode::evaluate(const Dump& dump) {
  const double l = lhs_->evaluate(dump);
  const double r = rhs_->evaluate(dump);
  switch (op_) {
    case Operator::Add: return l + r;
    case Operator::Sub: return l - r;
    case Operator::Mul: return l * r;
    case Operator::Div: return math::divide(l, r);
  }
  return 0.0;
}

std::string BinaryNode::describe() const {
  return "(" + lhs_->describe() + " " + symbol(op_) + " " + rhs_->describe() + ")";
}

void BinaryNode::reset() {
  lhs_->reset();
  rhs_->reset();
}

} // namespace statexpr
