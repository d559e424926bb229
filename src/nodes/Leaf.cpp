#include "statexpr/nodes/Leaf.hpp"
#include "statexpr/nodes/Math.hpp"

namespace statexpr {

std::string FieldValue::describe() const {
  if (default_) return "FieldValue(" + quote(name_) + ", default=" + formatNumber(*default_) + ")";
  return "FieldValue(" + quote(name_) + ")";
}

DerivedRatio::DerivedRatio(std::string base,
                           std::string numeratorSuffix,
                           std::string denominatorSuffix,
                           std::optional<double> def,
                           std::string label)
  : base_(std::move(base)),
    numSuffix_(std::move(numeratorSuffix)),
    denSuffix_(std::move(denominatorSuffix)),
    default_(def),
    label_(std::move(label)) {}

double DerivedRatio::evaluate(const Dump& dump) {
  const double den = dump.lookup(denominatorField());
  // An idle interval may not record the numerator at all.
  if (den == 0.0 && default_) return *default_;
  const double num = dump.lookup(numeratorField());
  return math::divide(num, den);
}

std::string DerivedRatio::describe() const {
  std::string out;
  if (!label_.empty()) {
    out = label_ + "(" + quote(base_);
  } else {
    out = "DerivedRatio(" + quote(base_) + ", " + quote(numSuffix_) + ", " + quote(denSuffix_);
  }
  if (default_) out += ", default=" + formatNumber(*default_);
  return out + ")";
}

NodePtr makeIpc(const std::string& cpu, std::optional<double> def) {
  return std::make_unique<DerivedRatio>(cpu, ".committedInsts", ".numCycles", def, "IPC");
}

NodePtr makeCpi(const std::string& cpu, std::optional<double> def) {
  return std::make_unique<DerivedRatio>(cpu, ".numCycles", ".committedInsts", def, "CPI");
}

} // namespace statexpr
