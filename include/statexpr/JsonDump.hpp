#pragma once

#include <memory>
#include <optional>
#include <string>

#include <rapidjson/document.h>

#include "statexpr/Dump.hpp"

namespace statexpr {

// Dump backed by a JSON object such as
//   {"sim_seconds": 0.5, "system": {"cpu": {"numCycles": 1000}}}
// A dotted name is first looked up as a flat key, then by walking nested
// objects one segment at a time. Non-numeric values count as absent.
// Copies share the parsed document.
class JsonDump final : public Dump {
public:
  // Throws Error if `text` is not a JSON object.
  static JsonDump parse(const std::string& text);

  explicit JsonDump(std::shared_ptr<const rapidjson::Document> doc);

  using Dump::lookup;
  double lookup(const std::string& name, const std::optional<double>& def) const override;

private:
  const rapidjson::Value* find(const std::string& name) const;

  std::shared_ptr<const rapidjson::Document> doc_;
};

} // namespace statexpr
