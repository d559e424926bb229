#pragma once

#include <string_view>

#include "statexpr/Registry.hpp"
#include "statexpr/Result.hpp"
#include "statexpr/nodes/ValueNode.hpp"

namespace statexpr {

/**
 * Turns expression text into a node tree.
 *
 * Grammar:
 *   expr    := term (('+' | '-') term)*
 *   term    := unary (('*' | '/') unary)*
 *   unary   := '-' unary | primary
 *   primary := NUMBER | STRING | IDENT '(' [arg (',' arg)*] ')' | '(' expr ')'
 *   arg     := IDENT '=' expr | expr
 *
 * A quoted string used as an operand is a field lookup ("a" + 1 is
 * FieldValue("a") + 1); as a call argument it is passed to the constructor
 * as is. Identifiers are resolved against the extra names first, then the
 * builder's registry; there is nothing else an expression can reach.
 * Every failure is a BuildError raised before any dump is evaluated.
 */
class ExpressionBuilder {
public:
  explicit ExpressionBuilder(const Registry& registry = Registry::defaults())
    : registry_(registry) {}

  NodePtr build(std::string_view expression, const Registry* extraNames = nullptr) const;

  // Non-throwing variant for build errors; the failure carries the offset.
  Result<NodePtr> tryBuild(std::string_view expression, const Registry* extraNames = nullptr) const;

private:
  const Registry& registry_;
};

// Builds against Registry::defaults().
NodePtr build(std::string_view expression, const Registry* extraNames = nullptr);

} // namespace statexpr
