#include "statexpr/Series.hpp"
#include "statexpr/ExpressionBuilder.hpp"

#include <cmath>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace statexpr {

SeriesCollector::SeriesCollector(const std::string& xExpression,
                                 const std::vector<std::string>& yExpressions,
                                 const Registry* extraNames)
{
  ExpressionBuilder builder;
  x_ = builder.build(xExpression, extraNames);
  table_.x.label = x_->describe();
  for (const auto& e : yExpressions) {
    ys_.push_back(builder.build(e, extraNames));
    table_.y.push_back(Series{ys_.back()->describe(), {}});
  }
  scratch_.reserve(ys_.size());
}

void SeriesCollector::add(const Dump& dump) {
  const double x = x_->evaluate(dump);
  scratch_.clear();
  for (auto& y : ys_) scratch_.push_back(y->evaluate(dump));

  table_.x.values.push_back(x);
  for (std::size_t i = 0; i < scratch_.size(); ++i) table_.y[i].values.push_back(scratch_[i]);
}

namespace {

void writeSeries(rapidjson::Writer<rapidjson::StringBuffer>& w, const Series& s) {
  w.StartObject();
  w.Key("label");
  w.String(s.label.c_str(), static_cast<rapidjson::SizeType>(s.label.size()));
  w.Key("values");
  w.StartArray();
  for (double v : s.values) {
    if (std::isfinite(v)) w.Double(v);
    else w.Null();   // JSON has no NaN/inf
  }
  w.EndArray();
  w.EndObject();
}

} // namespace

std::string toJson(const SeriesTable& table) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("x");
  writeSeries(w, table.x);
  w.Key("series");
  w.StartArray();
  for (const auto& s : table.y) writeSeries(w, s);
  w.EndArray();
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace statexpr
