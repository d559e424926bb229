#include "statexpr/Registry.hpp"
#include "statexpr/Errors.hpp"
#include "statexpr/nodes/BinaryNode.hpp"
#include "statexpr/nodes/Functions.hpp"
#include "statexpr/nodes/Leaf.hpp"
#include "statexpr/nodes/Sliding.hpp"

#include <algorithm>
#include <cmath>

namespace statexpr {

// ----------------- CallArgs -----------------

void CallArgs::addKeyword(const std::string& key, Operand value) {
  if (hasKeyword(key)) fail("duplicate keyword argument '" + key + "'");
  keywords_.emplace_back(key, std::move(value));
}

bool CallArgs::hasKeyword(const std::string& key) const {
  return std::any_of(keywords_.begin(), keywords_.end(),
                     [&](const auto& kv){ return kv.first == key; });
}

void CallArgs::fail(const std::string& msg) const {
  throw BuildError(callee_ + ": " + msg, offset_);
}

Operand* CallArgs::find(std::size_t index, const char* key, bool required) {
  positionalSeen_ = std::max(positionalSeen_, index + 1);

  Operand* byKey = nullptr;
  for (auto& kv : keywords_) {
    if (kv.first == key) { byKey = &kv.second; break; }
  }
  const bool byPos = index < positional_.size();

  if (byKey && byPos) fail(std::string("got multiple values for argument '") + key + "'");
  if (byKey) {
    usedKeys_.insert(key);
    return byKey;
  }
  if (byPos) return &positional_[index];
  if (required) fail(std::string("missing argument '") + key + "'");
  return nullptr;
}

NodePtr CallArgs::takeNode(std::size_t index, const char* key) {
  Operand* v = find(index, key, true);
  return box(std::move(*v));
}

std::string CallArgs::takeString(std::size_t index, const char* key) {
  Operand* v = find(index, key, true);
  if (!v->isString()) fail(std::string("argument '") + key + "' must be a string, got " + v->kind());
  return v->string();
}

double CallArgs::takeNumber(std::size_t index, const char* key) {
  Operand* v = find(index, key, true);
  if (!v->isNumber()) fail(std::string("argument '") + key + "' must be a number, got " + v->kind());
  return v->number();
}

std::optional<double> CallArgs::takeOptionalNumber(std::size_t index, const char* key) {
  Operand* v = find(index, key, false);
  if (!v) return std::nullopt;
  if (!v->isNumber()) fail(std::string("argument '") + key + "' must be a number, got " + v->kind());
  return v->number();
}

std::size_t CallArgs::takeCount(std::size_t index, const char* key) {
  const double n = takeNumber(index, key);
  if (!(n >= 1.0) || !std::isfinite(n) || std::floor(n) != n)
    fail(std::string("argument '") + key + "' must be a positive integer");
  return static_cast<std::size_t>(n);
}

void CallArgs::done() {
  if (positional_.size() > positionalSeen_) {
    fail("takes " + std::to_string(positionalSeen_) + " positional argument(s), got " +
         std::to_string(positional_.size()));
  }
  for (const auto& kv : keywords_) {
    if (!usedKeys_.count(kv.first)) fail("unexpected keyword argument '" + kv.first + "'");
  }
}

// ----------------- Registry -----------------

void Registry::add(const std::string& name, Factory f) {
  map_[name] = std::move(f);
}

const Registry::Factory* Registry::find(const std::string& name) const {
  auto it = map_.find(name);
  return it == map_.end() ? nullptr : &it->second;
}

std::vector<std::string> Registry::names() const {
  std::vector<std::string> out;
  out.reserve(map_.size());
  for (const auto& kv : map_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

namespace {

Registry::Factory binary(Operator op) {
  return [op](CallArgs& a) -> NodePtr {
    auto lhs = a.takeNode(0, "lhs");
    auto rhs = a.takeNode(1, "rhs");
    a.done();
    return std::make_unique<BinaryNode>(op, std::move(lhs), std::move(rhs));
  };
}

template <class Fn>
Registry::Factory unary() {
  return [](CallArgs& a) -> NodePtr {
    auto param = a.takeNode(0, "param");
    a.done();
    return std::make_unique<Fn>(std::move(param));
  };
}

template <class Fn>
Registry::Factory sliding() {
  return [](CallArgs& a) -> NodePtr {
    auto param = a.takeNode(0, "param");
    auto length = a.takeCount(1, "length");
    a.done();
    return std::make_unique<Fn>(std::move(param), length);
  };
}

Registry makeDefaults() {
  Registry r;

  r.add("Add", binary(Operator::Add));
  r.add("Sub", binary(Operator::Sub));
  r.add("Mul", binary(Operator::Mul));
  r.add("Div", binary(Operator::Div));

  r.add("Constant", [](CallArgs& a) -> NodePtr {
    double c = a.takeNumber(0, "constant");
    a.done();
    return std::make_unique<Constant>(c);
  });

  Registry::Factory field = [](CallArgs& a) -> NodePtr {
    std::string name = a.takeString(0, "attr");
    auto def = a.takeOptionalNumber(1, "default");
    a.done();
    return std::make_unique<FieldValue>(std::move(name), def);
  };
  r.add("FieldValue", field);
  r.add("LV", field);

  r.add("DerivedRatio", [](CallArgs& a) -> NodePtr {
    std::string base = a.takeString(0, "base");
    std::string num  = a.takeString(1, "numerator");
    std::string den  = a.takeString(2, "denominator");
    auto def = a.takeOptionalNumber(3, "default");
    a.done();
    return std::make_unique<DerivedRatio>(std::move(base), std::move(num), std::move(den), def);
  });
  r.add("IPC", [](CallArgs& a) {
    std::string cpu = a.takeString(0, "attr");
    auto def = a.takeOptionalNumber(1, "default");
    a.done();
    return makeIpc(cpu, def);
  });
  r.add("CPI", [](CallArgs& a) {
    std::string cpu = a.takeString(0, "attr");
    auto def = a.takeOptionalNumber(1, "default");
    a.done();
    return makeCpi(cpu, def);
  });

  Registry::Factory accumulate = [](CallArgs& a) -> NodePtr {
    auto param = a.takeNode(0, "param");
    double start = a.takeOptionalNumber(1, "start").value_or(0.0);
    a.done();
    return std::make_unique<Accumulate>(std::move(param), start);
  };
  r.add("Accumulate", accumulate);
  r.add("AC", accumulate);

  r.add("ArithmeticMean", unary<ArithmeticMean>());
  r.add("AMean",          unary<ArithmeticMean>());
  r.add("GeometricMean",  unary<GeometricMean>());
  r.add("GMean",          unary<GeometricMean>());
  r.add("HarmonicMean",   unary<HarmonicMean>());
  r.add("HMean",          unary<HarmonicMean>());

  r.add("SlidingSum",            sliding<SlidingSum>());
  r.add("SlidingArithmeticMean", sliding<SlidingArithmeticMean>());
  r.add("SlidingAMean",          sliding<SlidingArithmeticMean>());
  r.add("SlidingGeometricMean",  sliding<SlidingGeometricMean>());
  r.add("SlidingGMean",          sliding<SlidingGeometricMean>());
  r.add("SlidingHarmonicMean",   sliding<SlidingHarmonicMean>());
  r.add("SlidingHMean",          sliding<SlidingHarmonicMean>());

  return r;
}

} // namespace

const Registry& Registry::defaults() {
  static const Registry inst = makeDefaults();
  return inst;
}

} // namespace statexpr
