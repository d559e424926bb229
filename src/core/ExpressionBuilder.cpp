#include "statexpr/ExpressionBuilder.hpp"
#include "statexpr/Errors.hpp"
#include "statexpr/Lexer.hpp"
#include "statexpr/nodes/BinaryNode.hpp"
#include "statexpr/nodes/Leaf.hpp"
#include "statexpr/util/Logger.hpp"

namespace statexpr {

namespace {

// Deepest nesting of parentheses, calls and unary minus accepted.
constexpr int kMaxDepth = 256;

class Parser {
public:
  Parser(std::string_view text, const Registry& registry, const Registry* extra)
    : lex_(text), registry_(registry), extra_(extra) { advance(); }

  NodePtr parse() {
    if (cur_.kind == TokKind::End) throw BuildError("empty expression", cur_.offset);
    Operand v = expr();
    if (cur_.kind != TokKind::End) unexpected("end of input");
    return box(std::move(v));
  }

private:
  void advance() { cur_ = lex_.next(); }

  [[noreturn]] void unexpected(const char* wanted) const {
    throw BuildError(std::string("expected ") + wanted + ", got " + tokName(cur_.kind), cur_.offset);
  }

  void expect(TokKind k) {
    if (cur_.kind != k) unexpected(tokName(k));
    advance();
  }

  class DepthGuard {
  public:
    explicit DepthGuard(Parser& p) : p_(p) {
      if (++p_.depth_ > kMaxDepth) {
        --p_.depth_;
        throw BuildError("expression nested too deeply", p_.cur_.offset);
      }
    }
    ~DepthGuard() { --p_.depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

  private:
    Parser& p_;
  };

  Operand expr() {
    DepthGuard guard(*this);
    Operand lhs = term();
    while (cur_.kind == TokKind::Plus || cur_.kind == TokKind::Minus) {
      const bool add = cur_.kind == TokKind::Plus;
      advance();
      Operand rhs = term();
      lhs = add ? std::move(lhs) + std::move(rhs) : std::move(lhs) - std::move(rhs);
    }
    return lhs;
  }

  Operand term() {
    Operand lhs = unary();
    while (cur_.kind == TokKind::Star || cur_.kind == TokKind::Slash) {
      const bool mul = cur_.kind == TokKind::Star;
      advance();
      Operand rhs = unary();
      lhs = mul ? std::move(lhs) * std::move(rhs) : std::move(lhs) / std::move(rhs);
    }
    return lhs;
  }

  // Negative literals fold into the constant; anything else becomes (0 - x).
  Operand unary() {
    if (cur_.kind != TokKind::Minus) return primary();
    DepthGuard guard(*this);
    advance();
    Operand v = unary();
    if (v.isNumber()) return Operand(-v.number());
    return Operand(0.0) - std::move(v);
  }

  Operand primary() {
    switch (cur_.kind) {
      case TokKind::Number: {
        double v = cur_.number;
        advance();
        return Operand(v);
      }
      case TokKind::String: {
        std::string s = std::move(cur_.text);
        advance();
        return Operand(std::move(s));
      }
      case TokKind::LParen: {
        advance();
        Operand v = expr();
        expect(TokKind::RParen);
        return v;
      }
      case TokKind::Ident:
        return call();
      default:
        unexpected("operand");
    }
  }

  const Registry::Factory& resolve(const Token& id) const {
    if (extra_) {
      if (auto* f = extra_->find(id.text)) return *f;
    }
    if (auto* f = registry_.find(id.text)) return *f;
    throw BuildError("unknown name '" + id.text + "'", id.offset);
  }

  Operand call() {
    Token id = std::move(cur_);
    const Registry::Factory& factory = resolve(id);
    advance();
    if (cur_.kind != TokKind::LParen)
      throw BuildError("'" + id.text + "' must be called with arguments", cur_.offset);
    advance();

    CallArgs args(id.text, id.offset);
    if (cur_.kind != TokKind::RParen) {
      while (true) {
        argument(args);
        if (cur_.kind == TokKind::Comma) { advance(); continue; }
        break;
      }
    }
    expect(TokKind::RParen);

    NodePtr node = factory(args);
    if (!node) throw BuildError("'" + id.text + "' produced no node", id.offset);
    return Operand(std::move(node));
  }

  void argument(CallArgs& args) {
    // IDENT '=' starts a keyword argument; needs one token of lookahead.
    if (cur_.kind == TokKind::Ident) {
      Token id = cur_;
      Lexer save = lex_;
      advance();
      if (cur_.kind == TokKind::Assign) {
        advance();
        args.addKeyword(id.text, expr());
        return;
      }
      lex_ = save;
      cur_ = std::move(id);
    }
    if (args.hasAnyKeyword()) {
      throw BuildError("positional argument follows keyword argument", cur_.offset);
    }
    args.addPositional(expr());
  }

  Lexer lex_;
  Token cur_;
  const Registry& registry_;
  const Registry* extra_;
  int depth_ = 0;
};

} // namespace

NodePtr ExpressionBuilder::build(std::string_view expression, const Registry* extraNames) const {
  Parser p(expression, registry_, extraNames);
  NodePtr root = p.parse();

  auto& log = util::logger();
  if (log.enabled(util::LogLevel::Debug)) {
    log.log(util::LogLevel::Debug, "expression built", {{"expr", root->describe()}});
  }
  return root;
}

Result<NodePtr> ExpressionBuilder::tryBuild(std::string_view expression, const Registry* extraNames) const {
  try {
    return build(expression, extraNames);
  } catch (const BuildError& e) {
    return Failure{e.what(), e.offset()};
  }
}

NodePtr build(std::string_view expression, const Registry* extraNames) {
  return ExpressionBuilder().build(expression, extraNames);
}

} // namespace statexpr
