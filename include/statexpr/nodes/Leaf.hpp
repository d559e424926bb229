#pragma once

#include <optional>
#include <string>

#include "statexpr/nodes/ValueNode.hpp"

namespace statexpr {

class Constant final : public ValueNode {
public:
  explicit Constant(double value) : value_(value) {}

  double evaluate(const Dump&) override { return value_; }
  std::string describe() const override { return formatNumber(value_); }

  double value() const { return value_; }

private:
  double value_;
};

/**
 * Value of a named field in the dump. Without a default, a missing field
 * raises FieldNotFound (from the dump itself).
 */
class FieldValue final : public ValueNode {
public:
  explicit FieldValue(std::string name, std::optional<double> def = std::nullopt)
    : name_(std::move(name)), default_(def) {}

  double evaluate(const Dump& dump) override { return dump.lookup(name_, default_); }
  std::string describe() const override;

  const std::string& name() const { return name_; }
  const std::optional<double>& defaultValue() const { return default_; }

private:
  std::string name_;
  std::optional<double> default_;
};

/**
 * Ratio of two fields sharing a common prefix, e.g. instructions per cycle:
 *   lookup(base + numeratorSuffix) / lookup(base + denominatorSuffix)
 *
 * A zero denominator is an expected situation (a CPU that was idle for the
 * whole interval), so it yields the configured default instead of raising,
 * and the numerator is not looked up. Without a default the ArithmeticError
 * propagates. Otherwise both fields must be present (FieldNotFound).
 */
class DerivedRatio final : public ValueNode {
public:
  DerivedRatio(std::string base,
               std::string numeratorSuffix,
               std::string denominatorSuffix,
               std::optional<double> def = std::nullopt,
               std::string label = {});

  double evaluate(const Dump& dump) override;
  std::string describe() const override;

  const std::string& base() const { return base_; }
  std::string numeratorField() const { return base_ + numSuffix_; }
  std::string denominatorField() const { return base_ + denSuffix_; }

private:
  std::string base_;
  std::string numSuffix_;
  std::string denSuffix_;
  std::optional<double> default_;
  std::string label_;   // short form used by describe(), e.g. "IPC"
};

// committedInsts / numCycles of the CPU rooted at `cpu`.
NodePtr makeIpc(const std::string& cpu, std::optional<double> def = std::nullopt);
// numCycles / committedInsts of the CPU rooted at `cpu`.
NodePtr makeCpi(const std::string& cpu, std::optional<double> def = std::nullopt);

} // namespace statexpr
