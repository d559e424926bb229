#include "statexpr/Report.hpp"
#include "statexpr/Errors.hpp"
#include "statexpr/ExpressionBuilder.hpp"

namespace statexpr {

ErrorPolicy parseErrorPolicy(const std::string& s) {
  if (s == "abort") return ErrorPolicy::Abort;
  if (s == "skip")  return ErrorPolicy::Skip;
  throw ConfigError("unknown error policy '" + s + "' (expected abort or skip)");
}

Report::Report(const std::vector<std::string>& expressions,
               ReportOptions opts,
               const Registry* extraNames)
  : opts_(std::move(opts))
{
  opts_.window.validate();
  if (expressions.empty()) throw ConfigError("report needs at least one expression");

  ExpressionBuilder builder;
  exprs_.reserve(expressions.size());
  for (const auto& e : expressions) exprs_.push_back(builder.build(e, extraNames));
}

void Report::writeHeader(std::ostream& out) const {
  for (std::size_t i = 0; i < exprs_.size(); ++i) {
    out << "# " << i << ": " << exprs_[i]->describe() << '\n';
  }
}

void Report::reset() {
  for (auto& e : exprs_) e->reset();
}

bool Report::evaluateRow(const Dump& dump, std::size_t index, std::vector<double>& row) {
  row.clear();
  try {
    for (auto& e : exprs_) row.push_back(e->evaluate(dump));
  } catch (const Error& err) {
    if (opts_.onError == ErrorPolicy::Abort) throw;
    util::logger().log(util::LogLevel::Warn, "record skipped",
                       {{"record", std::to_string(index)}, {"error", err.what()}});
    return false;
  }
  return true;
}

void Report::writeRow(std::ostream& out, const std::vector<double>& row) const {
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i) out << opts_.separator;
    out << formatNumber(row[i]);
  }
  out << '\n';
}

void Report::logStart() const {
  auto& log = util::logger();
  if (!log.enabled(util::LogLevel::Debug)) return;
  const auto& w = opts_.window;
  log.log(util::LogLevel::Debug, "report started",
          {{"expressions", std::to_string(exprs_.size())},
           {"start", std::to_string(w.start)},
           {"step", std::to_string(w.step)},
           {"limit", w.limit ? std::to_string(*w.limit) : std::string("none")},
           {"trim", std::to_string(w.trim)}});
}

void Report::logFinish(const ReportStats& stats) const {
  util::logger().log(util::LogLevel::Debug, "report finished",
                     {{"rows", std::to_string(stats.rows)},
                      {"skipped", std::to_string(stats.skipped)}});
}

} // namespace statexpr
