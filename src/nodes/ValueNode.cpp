#include "statexpr/nodes/ValueNode.hpp"
#include "statexpr/nodes/BinaryNode.hpp"
#include "statexpr/nodes/Leaf.hpp"
#include "statexpr/Errors.hpp"

#include <charconv>

namespace statexpr {

const char* Operand::kind() const {
  switch (v_.index()) {
    case 0: return "empty";
    case 1: return std::get<NodePtr>(v_) ? "node" : "null node";
    case 2: return "string";
    case 3: return "number";
  }
  return "unknown";
}

NodePtr box(Operand operand) {
  if (auto* node = std::get_if<NodePtr>(&operand.v_)) {
    if (!*node) throw TypeError("cannot use a null node as an operand");
    return std::move(*node);
  }
  if (auto* field = std::get_if<std::string>(&operand.v_)) {
    return std::make_unique<FieldValue>(std::move(*field));
  }
  if (auto* constant = std::get_if<double>(&operand.v_)) {
    return std::make_unique<Constant>(*constant);
  }
  throw TypeError("illegal operand type: expected node, string or number");
}

NodePtr operator+(Operand lhs, Operand rhs) {
  return std::make_unique<BinaryNode>(Operator::Add, box(std::move(lhs)), box(std::move(rhs)));
}

NodePtr operator-(Operand lhs, Operand rhs) {
  return std::make_unique<BinaryNode>(Operator::Sub, box(std::move(lhs)), box(std::move(rhs)));
}

NodePtr operator*(Operand lhs, Operand rhs) {
  return std::make_unique<BinaryNode>(Operator::Mul, box(std::move(lhs)), box(std::move(rhs)));
}

NodePtr operator/(Operand lhs, Operand rhs) {
  return std::make_unique<BinaryNode>(Operator::Div, box(std::move(lhs)), box(std::move(rhs)));
}

std::string formatNumber(double value) {
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), value);
  return std::string(buf, res.ptr);
}

std::string quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';
  for (char c : s) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
  return out;
}

} // namespace statexpr
