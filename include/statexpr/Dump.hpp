#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "statexpr/Errors.hpp"

namespace statexpr {

// One statistics dump: a snapshot of named counters taken at the end of a
// simulated interval. Implementations must make lookup cheap and free of
// side effects; nodes never hold on to a dump past a single evaluate().
class Dump {
public:
  virtual ~Dump() = default;

  // Returns the value of `name`, or `def` when the field is absent.
  // Throws FieldNotFound when the field is absent and `def` is empty.
  virtual double lookup(const std::string& name, const std::optional<double>& def) const = 0;

  double lookup(const std::string& name) const { return lookup(name, std::nullopt); }
};

// Dump backed by a hash map. Used by tests and by callers that assemble
// records themselves.
class MapDump final : public Dump {
public:
  MapDump() = default;
  MapDump(std::initializer_list<std::pair<const std::string, double>> values)
    : values_(values) {}

  using Dump::lookup;
  double lookup(const std::string& name, const std::optional<double>& def) const override;

  void set(const std::string& name, double value) { values_[name] = value; }
  bool contains(const std::string& name) const { return values_.count(name) != 0; }
  std::size_t size() const { return values_.size(); }

private:
  std::unordered_map<std::string, double> values_;
};

// Lets drivers accept sources yielding dumps by value or through pointers.
inline const Dump& asDump(const Dump& d) { return d; }
template <class T>
const Dump& asDump(const std::unique_ptr<T>& p) {
  if (!p) throw TypeError("null dump");
  return *p;
}
template <class T>
const Dump& asDump(const std::shared_ptr<T>& p) {
  if (!p) throw TypeError("null dump");
  return *p;
}

} // namespace statexpr
