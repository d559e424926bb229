#pragma once

#include <cstddef>
#include <deque>
#include <string>

#include "statexpr/nodes/Functions.hpp"

namespace statexpr {

/**
 * Base for functions over the most recent `length` values of a parameter.
 * The window is kept oldest-first. Until `length` values have been seen it
 * holds only those values; it is never padded.
 */
class SlidingWindowNode : public FunctionNode {
public:
  std::string describe() const override;

  std::size_t length() const { return length_; }
  const std::deque<double>& window() const { return window_; }

protected:
  SlidingWindowNode(std::string name, NodePtr param, std::size_t length);

  double apply(const std::vector<double>& args) final;
  void resetState() final { window_.clear(); }

  // Value of the function for a non-empty window.
  virtual double evalWindow(const std::deque<double>& window) const = 0;

private:
  std::size_t length_;
  std::deque<double> window_;
};

class SlidingSum final : public SlidingWindowNode {
public:
  SlidingSum(NodePtr param, std::size_t length)
    : SlidingWindowNode("SlidingSum", std::move(param), length) {}

protected:
  double evalWindow(const std::deque<double>& window) const override;
};

class SlidingArithmeticMean final : public SlidingWindowNode {
public:
  SlidingArithmeticMean(NodePtr param, std::size_t length)
    : SlidingWindowNode("SlidingArithmeticMean", std::move(param), length) {}

protected:
  double evalWindow(const std::deque<double>& window) const override;
};

class SlidingGeometricMean final : public SlidingWindowNode {
public:
  SlidingGeometricMean(NodePtr param, std::size_t length)
    : SlidingWindowNode("SlidingGeometricMean", std::move(param), length) {}

protected:
  double evalWindow(const std::deque<double>& window) const override;
};

// A zero anywhere in the window raises ArithmeticError.
class SlidingHarmonicMean final : public SlidingWindowNode {
public:
  SlidingHarmonicMean(NodePtr param, std::size_t length)
    : SlidingWindowNode("SlidingHarmonicMean", std::move(param), length) {}

protected:
  double evalWindow(const std::deque<double>& window) const override;
};

} // namespace statexpr
