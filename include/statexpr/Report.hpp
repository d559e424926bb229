#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "statexpr/Dump.hpp"
#include "statexpr/Registry.hpp"
#include "statexpr/Windowed.hpp"
#include "statexpr/nodes/ValueNode.hpp"
#include "statexpr/util/Logger.hpp"

namespace statexpr {

// What a report does when evaluating a record fails (missing field,
// division by zero, ...).
enum class ErrorPolicy { Abort, Skip };

ErrorPolicy parseErrorPolicy(const std::string& s);   // "abort" | "skip", throws ConfigError

struct ReportOptions {
  WindowOptions window;
  std::string separator = ":";
  bool lastOnly = false;        // print only the final row
  bool header = true;           // "# <i>: <expression>" lines before the data
  ErrorPolicy onError = ErrorPolicy::Abort;
};

struct ReportStats {
  std::size_t rows = 0;
  std::size_t skipped = 0;
};

/**
 * Text report over a stream of dumps: one line per batch, one column per
 * expression, evaluated against the first dump of each batch.
 *
 * All expressions are built in the constructor, so a bad expression fails
 * before any dump is read. The trees keep their state across run() calls;
 * call reset() to start over.
 */
class Report {
public:
  Report(const std::vector<std::string>& expressions,
         ReportOptions opts = {},
         const Registry* extraNames = nullptr);

  template <class Source>
  ReportStats run(Source source, std::ostream& out);

  void writeHeader(std::ostream& out) const;
  void reset();

  std::size_t size() const { return exprs_.size(); }
  const ValueNode& expression(std::size_t i) const { return *exprs_[i]; }
  const ReportOptions& options() const { return opts_; }

private:
  // Fills `row`; returns false if the record was skipped.
  bool evaluateRow(const Dump& dump, std::size_t index, std::vector<double>& row);
  void writeRow(std::ostream& out, const std::vector<double>& row) const;
  void logStart() const;
  void logFinish(const ReportStats& stats) const;

  std::vector<NodePtr> exprs_;
  ReportOptions opts_;
};

template <class Source>
ReportStats Report::run(Source source, std::ostream& out) {
  logStart();
  if (opts_.header) writeHeader(out);

  ReportStats stats;
  auto stream = windowed(std::move(source), opts_.window);
  std::vector<double> row;
  std::optional<std::vector<double>> last;
  std::size_t index = 0;

  while (auto batch = stream.next()) {
    if (!evaluateRow(asDump(batch->front()), index++, row)) {
      ++stats.skipped;
      continue;
    }
    ++stats.rows;
    if (opts_.lastOnly) last = row;
    else writeRow(out, row);
  }
  if (last) writeRow(out, *last);

  logFinish(stats);
  return stats;
}

} // namespace statexpr
