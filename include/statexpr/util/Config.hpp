#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "statexpr/Report.hpp"

namespace statexpr {
namespace util {

// Report and logging settings, loadable from a "key=value" file.
class Config {
public:
  // Construct with the report defaults.
  Config() = default;

  // Simple "key=value" per line, '#' or ';' start comments, unknown keys
  // ignored. Returns false if the file cannot be read. Throws ConfigError
  // for a known key with an invalid value.
  bool loadFromFile(const std::string& path);

  // Same format, from a string.
  void loadFromText(const std::string& text);

  // Applies one setting. Returns false if the key is unknown.
  bool set(const std::string& key, const std::string& value);

  ReportOptions reportOptions() const;
  void applyLogging(Logger& log = logger()) const;

  // --- Window ---
  std::size_t start = 0;
  std::size_t step  = 1;
  std::optional<std::size_t> limit;
  std::size_t trim  = 0;

  // --- Output ---
  std::string separator = ":";
  bool lastOnly = false;
  bool header   = true;
  ErrorPolicy onError = ErrorPolicy::Abort;

  // --- Logging ---
  LogLevel logLevel = LogLevel::Info;
  bool logJson = false;
  std::string logFile;            // empty -> stderr

private:
  void parseLine(const std::string& line);

  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string strip(const std::string& s);
};

} // namespace util
} // namespace statexpr
