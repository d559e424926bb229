#include "statexpr/Dump.hpp"
#include "statexpr/Errors.hpp"

namespace statexpr {

double MapDump::lookup(const std::string& name, const std::optional<double>& def) const {
  auto it = values_.find(name);
  if (it != values_.end()) return it->second;
  if (def) return *def;
  throw FieldNotFound(name);
}

} // namespace statexpr
