#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace statexpr {

struct Failure {
  std::string message;
  std::size_t where = static_cast<std::size_t>(-1);

  std::string describe() const {
    if (where == static_cast<std::size_t>(-1)) return message;
    return std::to_string(where) + ": " + message;
  }
};

template <typename T>
class Result {
public:
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Failure& error) : _value(error) {}
  Result(Failure&& error) : _value(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Failure& error() const { return std::get<Failure>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }

private:
  std::variant<T, Failure> _value;
};

} // namespace statexpr
