#pragma once

#include <string>
#include <vector>

#include "statexpr/nodes/ValueNode.hpp"

namespace statexpr {

/**
 * Base for function nodes. evaluate() evaluates every parameter left to
 * right and hands the results to apply(). Most functions are cumulative:
 * apply() folds the new values into private state and returns the current
 * value of the function over everything seen since construction or the
 * last reset().
 *
 * reset() resets the parameters first, then calls resetState(). Derived
 * classes must initialise their state to exactly what resetState() sets.
 */
class FunctionNode : public ValueNode {
public:
  double evaluate(const Dump& dump) final;
  std::string describe() const override;
  void reset() final;

  const std::string& name() const { return name_; }
  std::size_t arity() const { return params_.size(); }

protected:
  FunctionNode(std::string name, NodePtr param);

  virtual double apply(const std::vector<double>& args) = 0;
  virtual void resetState() {}

  const ValueNode& param(std::size_t i) const { return *params_[i]; }

private:
  std::string name_;
  std::vector<NodePtr> params_;
  std::vector<double> args_;
};

// Running total, starting at `start`.
class Accumulate final : public FunctionNode {
public:
  explicit Accumulate(NodePtr param, double start = 0.0);

  std::string describe() const override;
  double start() const { return start_; }

protected:
  double apply(const std::vector<double>& args) override;
  void resetState() override { total_ = start_; }

private:
  double start_;
  double total_;
};

class ArithmeticMean final : public FunctionNode {
public:
  explicit ArithmeticMean(NodePtr param) : FunctionNode("ArithmeticMean", std::move(param)) {}

protected:
  double apply(const std::vector<double>& args) override;
  void resetState() override { sum_ = 0.0; count_ = 0; }

private:
  double sum_ = 0.0;
  std::size_t count_ = 0;
};

// Running geometric mean: (x1 * ... * xn)^(1/n). An input that makes the
// product negative raises ArithmeticError and leaves the state untouched.
class GeometricMean final : public FunctionNode {
public:
  explicit GeometricMean(NodePtr param) : FunctionNode("GeometricMean", std::move(param)) {}

protected:
  double apply(const std::vector<double>& args) override;
  void resetState() override { product_ = 1.0; count_ = 0; }

private:
  double product_ = 1.0;
  std::size_t count_ = 0;
};

// Running harmonic mean: n / (1/x1 + ... + 1/xn). A zero input raises
// ArithmeticError and leaves the state untouched.
class HarmonicMean final : public FunctionNode {
public:
  explicit HarmonicMean(NodePtr param) : FunctionNode("HarmonicMean", std::move(param)) {}

protected:
  double apply(const std::vector<double>& args) override;
  void resetState() override { recipSum_ = 0.0; count_ = 0; }

private:
  double recipSum_ = 0.0;
  std::size_t count_ = 0;
};

} // namespace statexpr
