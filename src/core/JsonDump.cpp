#include "statexpr/JsonDump.hpp"
#include "statexpr/Errors.hpp"

#include <rapidjson/error/en.h>

namespace statexpr {

namespace {

const rapidjson::Value* member(const rapidjson::Value& obj, const char* key, std::size_t len) {
  if (!obj.IsObject()) return nullptr;
  rapidjson::Value k(rapidjson::StringRef(key, static_cast<rapidjson::SizeType>(len)));
  auto it = obj.FindMember(k);
  return it == obj.MemberEnd() ? nullptr : &it->value;
}

} // namespace

JsonDump JsonDump::parse(const std::string& text) {
  auto doc = std::make_shared<rapidjson::Document>();
  doc->Parse(text.c_str(), text.size());
  if (doc->HasParseError()) {
    throw Error(std::string("JsonDump: ") + rapidjson::GetParseError_En(doc->GetParseError()) +
                " at offset " + std::to_string(doc->GetErrorOffset()));
  }
  return JsonDump(std::move(doc));
}

JsonDump::JsonDump(std::shared_ptr<const rapidjson::Document> doc) : doc_(std::move(doc)) {
  if (!doc_ || !doc_->IsObject()) throw Error("JsonDump: document must be a JSON object");
}

const rapidjson::Value* JsonDump::find(const std::string& name) const {
  if (auto* flat = member(*doc_, name.data(), name.size())) return flat;

  const rapidjson::Value* cur = doc_.get();
  std::size_t pos = 0;
  while (cur) {
    std::size_t dot = name.find('.', pos);
    std::size_t len = (dot == std::string::npos ? name.size() : dot) - pos;
    cur = member(*cur, name.data() + pos, len);
    if (dot == std::string::npos) break;
    pos = dot + 1;
  }
  return cur;
}

double JsonDump::lookup(const std::string& name, const std::optional<double>& def) const {
  const rapidjson::Value* v = find(name);
  if (v && v->IsNumber()) return v->GetDouble();
  if (def) return *def;
  throw FieldNotFound(name);
}

} // namespace statexpr
