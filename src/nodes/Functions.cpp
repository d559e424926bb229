#include "statexpr/nodes/Functions.hpp"
#include "statexpr/nodes/Math.hpp"
#include "statexpr/Errors.hpp"

namespace statexpr {

FunctionNode::FunctionNode(std::string name, NodePtr param)
  : name_(std::move(name))
{
  if (!param) throw TypeError(name_ + ": null parameter");
  params_.push_back(std::move(param));
  args_.reserve(1);
}

double FunctionNode::evaluate(const Dump& dump) {
  args_.clear();
  for (auto& p : params_) args_.push_back(p->evaluate(dump));
  return apply(args_);
}

std::string FunctionNode::describe() const {
  std::string out = name_ + "(";
  for (std::size_t i = 0; i < params_.size(); ++i) {
    if (i) out += ",";
    out += params_[i]->describe();
  }
  return out + ")";
}

void FunctionNode::reset() {
  for (auto& p : params_) p->reset();
  resetState();
}

// ---- Accumulate ----

Accumulate::Accumulate(NodePtr param, double start)
  : FunctionNode("Accumulate", std::move(param)), start_(start), total_(start) {}

std::string Accumulate::describe() const {
  if (start_ == 0.0) return FunctionNode::describe();
  return name() + "(" + param(0).describe() + ", start=" + formatNumber(start_) + ")";
}

double Accumulate::apply(const std::vector<double>& args) {
  total_ += args[0];
  return total_;
}

// ---- Means ----

double ArithmeticMean::apply(const std::vector<double>& args) {
  sum_ += args[0];
  ++count_;
  return sum_ / static_cast<double>(count_);
}

double GeometricMean::apply(const std::vector<double>& args) {
  const double product = product_ * args[0];
  const double mean = math::nthRoot(product, static_cast<double>(count_ + 1));
  product_ = product;
  ++count_;
  return mean;
}

double HarmonicMean::apply(const std::vector<double>& args) {
  const double recip = math::divide(1.0, args[0]);
  recipSum_ += recip;
  ++count_;
  return math::divide(static_cast<double>(count_), recipSum_);
}

} // namespace statexpr
