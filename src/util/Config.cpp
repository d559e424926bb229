#include "statexpr/util/Config.hpp"
#include "statexpr/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>

namespace statexpr {
namespace util {

namespace {

[[noreturn]] void badValue(const std::string& key, const std::string& value) {
  throw ConfigError("config: invalid value for '" + key + "': '" + value + "'");
}

std::size_t toSize(const std::string& key, const std::string& value) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) badValue(key, value);
  char* end = nullptr;
  errno = 0;
  unsigned long long v = std::strtoull(value.c_str(), &end, 10);
  if (*end != '\0' || errno == ERANGE) badValue(key, value);
  return static_cast<std::size_t>(v);
}

long long toSigned(const std::string& key, const std::string& value) {
  if (value.empty()) badValue(key, value);
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str() || *end != '\0' || errno == ERANGE) badValue(key, value);
  return v;
}

bool toBool(const std::string& key, const std::string& value) {
  std::string x = value;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (x == "1" || x == "true"  || x == "yes" || x == "on")  return true;
  if (x == "0" || x == "false" || x == "no"  || x == "off") return false;
  badValue(key, value);
}

} // namespace

std::string Config::strip(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = strip(line.substr(0, pos));
  v = strip(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::set(const std::string& key, const std::string& val) {
  if      (key == "start")     start = toSize(key, val);
  else if (key == "step")      { step = toSize(key, val); if (step == 0) badValue(key, val); }
  else if (key == "limit")     limit = (val.empty() || val == "none") ? std::nullopt
                                                                      : std::optional<std::size_t>(toSize(key, val));
  else if (key == "trim")      trim = toSize(key, val);
  else if (key == "stop") {
    // Slice-style bound: negative trims, non-negative limits.
    const long long s = toSigned(key, val);
    if (s < 0) { trim = static_cast<std::size_t>(0ULL - static_cast<unsigned long long>(s)); limit.reset(); }
    else       { limit = static_cast<std::size_t>(s); trim = 0; }
  }
  else if (key == "separator") separator = (val == "\\t") ? std::string("\t") : val;
  else if (key == "lastOnly")  lastOnly = toBool(key, val);
  else if (key == "header")    header = toBool(key, val);
  else if (key == "onError")   onError = parseErrorPolicy(val);
  else if (key == "logLevel")  logLevel = parseLevel(val);
  else if (key == "logJson")   logJson = toBool(key, val);
  else if (key == "logFile")   logFile = val;
  else return false;
  return true;
}

void Config::parseLine(const std::string& raw) {
  std::string line = raw;
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

  auto s = strip(line);
  if (s.empty()) return;
  if (s[0] == '#' || s[0] == ';') return; // comment

  std::string key, val;
  if (!parseLineKV(s, key, val)) return;

  if (!set(key, val)) {
    logger().log(LogLevel::Debug, "config: unknown key ignored", {{"key", key}});
  }
}

bool Config::loadFromFile(const std::string& path) {
  std::unique_ptr<FILE, int (*)(FILE*)> f(std::fopen(path.c_str(), "rb"), &std::fclose);
  if (!f) return false;

  std::string line;
  char tmp[1024];
  while (std::fgets(tmp, sizeof(tmp), f.get())) {
    line += tmp;
    // Long lines arrive in several chunks.
    if (line.back() != '\n' && !std::feof(f.get())) continue;
    parseLine(line);
    line.clear();
  }
  if (!line.empty()) parseLine(line);
  return true;
}

void Config::loadFromText(const std::string& text) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) parseLine(line);
}

ReportOptions Config::reportOptions() const {
  ReportOptions o;
  o.window.start = start;
  o.window.step  = step;
  o.window.limit = limit;
  o.window.trim  = trim;
  o.separator = separator;
  o.lastOnly  = lastOnly;
  o.header    = header;
  o.onError   = onError;
  o.window.validate();
  return o;
}

void Config::applyLogging(Logger& log) const {
  log.setLevel(logLevel);
  log.setFormatJson(logJson);
  if (!log.setFile(logFile)) {
    log.log(LogLevel::Warn, "cannot open log file, using stderr", {{"path", logFile}});
  }
}

} // namespace util
} // namespace statexpr
