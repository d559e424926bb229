#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace statexpr {

enum class TokKind {
  Ident,
  Number,
  String,

  Plus, Minus, Star, Slash,
  LParen, RParen,
  Comma,
  Assign,
  End,
};

const char* tokName(TokKind k);

struct Token {
  TokKind kind{TokKind::End};
  std::string text{};       // Ident name / String contents
  double number{0.0};       // Number
  std::size_t offset{0};    // position of the first character
};

// Splits an expression into tokens. Strings may be quoted with ' or " and
// accept \\ and \<quote> escapes. Throws BuildError on any other input.
class Lexer {
public:
  explicit Lexer(std::string_view s) : s_(s) {}
  Token next();

private:
  void skip_ws();
  bool is_end() const { return i_ >= s_.size(); }
  Token lexString(char quote);

  std::string_view s_;
  std::size_t i_{0};
};

} // namespace statexpr
