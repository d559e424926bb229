#include "statexpr/Lexer.hpp"
#include "statexpr/Errors.hpp"

#include <cctype>
#include <cstdlib>

namespace statexpr {

const char* tokName(TokKind k) {
  switch (k) {
    case TokKind::Ident:  return "identifier";
    case TokKind::Number: return "number";
    case TokKind::String: return "string";
    case TokKind::Plus:   return "'+'";
    case TokKind::Minus:  return "'-'";
    case TokKind::Star:   return "'*'";
    case TokKind::Slash:  return "'/'";
    case TokKind::LParen: return "'('";
    case TokKind::RParen: return "')'";
    case TokKind::Comma:  return "','";
    case TokKind::Assign: return "'='";
    case TokKind::End:    return "end of input";
  }
  return "token";
}

static bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
static bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

void Lexer::skip_ws() {
  while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::lexString(char quote) {
  const std::size_t start = i_++;
  Token t{TokKind::String};
  t.offset = start;
  while (true) {
    if (is_end()) throw BuildError("unterminated string literal", start);
    char c = s_[i_++];
    if (c == quote) break;
    if (c == '\\') {
      if (is_end()) throw BuildError("unterminated string literal", start);
      char e = s_[i_++];
      if (e != '\\' && e != '"' && e != '\'')
        throw BuildError(std::string("unsupported escape '\\") + e + "'", i_ - 2);
      c = e;
    }
    t.text += c;
  }
  return t;
}

Token Lexer::next() {
  skip_ws();
  if (is_end()) return {TokKind::End, {}, 0.0, i_};

  const std::size_t at = i_;
  char c = s_[i_];

  switch (c) {
    case '+': ++i_; return {TokKind::Plus,   {}, 0.0, at};
    case '-': ++i_; return {TokKind::Minus,  {}, 0.0, at};
    case '*': ++i_; return {TokKind::Star,   {}, 0.0, at};
    case '/': ++i_; return {TokKind::Slash,  {}, 0.0, at};
    case '(': ++i_; return {TokKind::LParen, {}, 0.0, at};
    case ')': ++i_; return {TokKind::RParen, {}, 0.0, at};
    case ',': ++i_; return {TokKind::Comma,  {}, 0.0, at};
    case '=': ++i_; return {TokKind::Assign, {}, 0.0, at};
    case '"':
    case '\'':
      return lexString(c);
    default: break;
  }

  if (is_ident_start(c)) {
    ++i_;
    while (!is_end() && is_ident_char(s_[i_])) ++i_;
    Token t{TokKind::Ident};
    t.text = std::string(s_.substr(at, i_ - at));
    t.offset = at;
    return t;
  }

  if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
    // strtod needs a terminated buffer; copy the longest candidate run.
    std::size_t j = i_;
    while (j < s_.size() && (std::isalnum(static_cast<unsigned char>(s_[j])) || s_[j] == '.' ||
                             ((s_[j] == '+' || s_[j] == '-') && j > i_ &&
                              (s_[j-1] == 'e' || s_[j-1] == 'E')))) ++j;
    const std::string lit(s_.substr(i_, j - i_));
    char* end = nullptr;
    double v = std::strtod(lit.c_str(), &end);
    if (end != lit.c_str() + lit.size()) throw BuildError("invalid number '" + lit + "'", at);
    i_ = j;
    Token t{TokKind::Number};
    t.number = v;
    t.offset = at;
    return t;
  }

  throw BuildError(std::string("unexpected character '") + c + "'", at);
}

} // namespace statexpr
