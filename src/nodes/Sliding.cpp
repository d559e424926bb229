#include "statexpr/nodes/Sliding.hpp"
#include "statexpr/nodes/Math.hpp"
#include "statexpr/Errors.hpp"

#include <numeric>

namespace statexpr {

SlidingWindowNode::SlidingWindowNode(std::string name, NodePtr param, std::size_t length)
  : FunctionNode(std::move(name), std::move(param)), length_(length)
{
  if (length_ == 0) throw BuildError(this->name() + ": length must be positive");
}

std::string SlidingWindowNode::describe() const {
  return name() + "(" + param(0).describe() + ", length=" + std::to_string(length_) + ")";
}

double SlidingWindowNode::apply(const std::vector<double>& args) {
  window_.push_back(args[0]);
  while (window_.size() > length_) window_.pop_front();
  return evalWindow(window_);
}

double SlidingSum::evalWindow(const std::deque<double>& window) const {
  return std::accumulate(window.begin(), window.end(), 0.0);
}

double SlidingArithmeticMean::evalWindow(const std::deque<double>& window) const {
  const double s = std::accumulate(window.begin(), window.end(), 0.0);
  return s / static_cast<double>(window.size());
}

double SlidingGeometricMean::evalWindow(const std::deque<double>& window) const {
  double p = 1.0;
  for (double v : window) p *= v;
  return math::nthRoot(p, static_cast<double>(window.size()));
}

double SlidingHarmonicMean::evalWindow(const std::deque<double>& window) const {
  double r = 0.0;
  for (double v : window) r += math::divide(1.0, v);
  return math::divide(static_cast<double>(window.size()), r);
}

} // namespace statexpr
