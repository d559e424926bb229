#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "statexpr/nodes/ValueNode.hpp"

namespace statexpr {

// Arguments of one `Name(arg, ..., key=value)` call in an expression.
// Constructors read them through the take*() accessors, which accept a
// parameter either by position or by keyword, then call done() to reject
// anything left over. All failures are BuildErrors pointing at the call.
class CallArgs {
public:
  CallArgs(std::string callee, std::size_t offset) : callee_(std::move(callee)), offset_(offset) {}

  void addPositional(Operand value) { positional_.push_back(std::move(value)); }
  void addKeyword(const std::string& key, Operand value);

  const std::string& callee() const { return callee_; }
  std::size_t offset() const { return offset_; }
  std::size_t positionalCount() const { return positional_.size(); }
  bool hasKeyword(const std::string& key) const;
  bool hasAnyKeyword() const { return !keywords_.empty(); }

  NodePtr takeNode(std::size_t index, const char* key);
  std::string takeString(std::size_t index, const char* key);
  double takeNumber(std::size_t index, const char* key);
  std::optional<double> takeOptionalNumber(std::size_t index, const char* key);
  // Positive integer, e.g. a window length.
  std::size_t takeCount(std::size_t index, const char* key);

  void done();

private:
  Operand* find(std::size_t index, const char* key, bool required);
  [[noreturn]] void fail(const std::string& msg) const;

  std::string callee_;
  std::size_t offset_;
  std::vector<Operand> positional_;
  std::vector<std::pair<std::string, Operand>> keywords_;
  std::unordered_set<std::string> usedKeys_;
  std::size_t positionalSeen_ = 0;
};

// Explicit name -> constructor mapping. The builder resolves identifiers
// against a Registry and nothing else.
class Registry {
public:
  using Factory = std::function<NodePtr(CallArgs&)>;

  // Adds or replaces `name`.
  void add(const std::string& name, Factory f);

  const Factory* find(const std::string& name) const;
  bool contains(const std::string& name) const { return find(name) != nullptr; }
  std::size_t size() const { return map_.size(); }

  // Sorted list of registered names.
  std::vector<std::string> names() const;

  // Every concrete node type of the library, plus the short aliases.
  // Built once, on first use, and never modified afterwards.
  static const Registry& defaults();

private:
  std::unordered_map<std::string, Factory> map_;
};

} // namespace statexpr
