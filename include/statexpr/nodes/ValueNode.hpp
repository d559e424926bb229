// include/statexpr/nodes/ValueNode.hpp
#pragma once

#include <memory>
#include <string>
#include <variant>

#include "statexpr/Dump.hpp"

namespace statexpr {

// A unit of an expression tree. evaluate() maps one dump to a number;
// stateful nodes fold every dump they have seen into their result, so a
// tree must only ever be fed a single stream, in order. A node owns its
// children exclusively.
class ValueNode {
public:
  ValueNode() = default;
  virtual ~ValueNode() = default;

  ValueNode(const ValueNode&) = delete;
  ValueNode& operator=(const ValueNode&) = delete;

  virtual double evaluate(const Dump& dump) = 0;

  // Stable text form mirroring the tree structure, e.g. "(A + B)".
  virtual std::string describe() const = 0;

  // Restore the state of a freshly constructed node (children first).
  virtual void reset() {}
};

using NodePtr = std::unique_ptr<ValueNode>;

// Something that can take part in arithmetic: an already built node, a
// field name (looked up in each dump) or a numeric constant. An empty
// operand is representable so that callers handing over untyped values
// get a TypeError from box() instead of undefined behaviour.
class Operand {
public:
  Operand() = default;
  Operand(NodePtr node) : v_(std::move(node)) {}
  Operand(std::string field) : v_(std::move(field)) {}
  Operand(const char* field) { if (field) v_ = std::string(field); }
  Operand(double constant) : v_(constant) {}
  Operand(int constant) : v_(static_cast<double>(constant)) {}

  bool empty()    const { return std::holds_alternative<std::monostate>(v_); }
  bool isNode()   const { return std::holds_alternative<NodePtr>(v_); }
  bool isString() const { return std::holds_alternative<std::string>(v_); }
  bool isNumber() const { return std::holds_alternative<double>(v_); }

  const std::string& string() const { return std::get<std::string>(v_); }
  double number() const { return std::get<double>(v_); }

  // Short name of the held alternative, for error messages.
  const char* kind() const;

  friend NodePtr box(Operand operand);

private:
  std::variant<std::monostate, NodePtr, std::string, double> v_;
};

// Wrap an operand into a node: strings become FieldValue lookups, numbers
// become Constants, nodes pass through. Throws TypeError for anything else.
NodePtr box(Operand operand);

NodePtr operator+(Operand lhs, Operand rhs);
NodePtr operator-(Operand lhs, Operand rhs);
NodePtr operator*(Operand lhs, Operand rhs);
NodePtr operator/(Operand lhs, Operand rhs);

// Shortest text that reads back as the same double ("2", "0.5", "1e-09").
std::string formatNumber(double value);

// Double-quoted form used by describe() for names.
std::string quote(const std::string& s);

} // namespace statexpr
