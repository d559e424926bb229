#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace statexpr {

// Base of every failure raised by the library. Callers that only care
// whether an evaluation step failed can catch this; the subclasses let a
// driver tell the kinds apart (abort on one, skip a record on another).
struct Error : std::runtime_error { using std::runtime_error::runtime_error; };

// A dump does not contain the requested field and no default was given.
class FieldNotFound : public Error {
public:
  explicit FieldNotFound(const std::string& field)
    : Error("field not found: '" + field + "'"), field_(field) {}

  const std::string& field() const { return field_; }

private:
  std::string field_;
};

// Division by zero, or a root/mean that is undefined for the inputs seen.
struct ArithmeticError : Error { using Error::Error; };

// Operand that is neither a node, a field name nor a number.
struct TypeError : Error { using Error::Error; };

// Unknown name or malformed expression text. `offset` is the character
// position in the expression where the problem was detected, or npos when
// the failure is not tied to a position (e.g. a bad argument value).
class BuildError : public Error {
public:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  explicit BuildError(const std::string& msg, std::size_t offset = npos)
    : Error(offset == npos ? msg : msg + " (at offset " + std::to_string(offset) + ")"),
      offset_(offset) {}

  std::size_t offset() const { return offset_; }

private:
  std::size_t offset_;
};

// Invalid iterator/report option or configuration value.
struct ConfigError : Error { using Error::Error; };

} // namespace statexpr
