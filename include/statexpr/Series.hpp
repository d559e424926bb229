#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "statexpr/Dump.hpp"
#include "statexpr/Registry.hpp"
#include "statexpr/Windowed.hpp"
#include "statexpr/nodes/ValueNode.hpp"

namespace statexpr {

// x axis used when the caller does not pick one: simulated instructions.
inline constexpr const char* kDefaultXExpression = "LV('sim_insts')";

// Plots skip the first dump, which only holds the counters at startup.
inline constexpr std::size_t kDefaultPlotStart = 1;

inline WindowOptions defaultPlotWindow() {
  WindowOptions w;
  w.start = kDefaultPlotStart;
  return w;
}

struct Series {
  std::string label;            // describe() of the expression
  std::vector<double> values;
};

struct SeriesTable {
  Series x;
  std::vector<Series> y;
};

// Evaluates an x expression and any number of y expressions per dump and
// records the results column-wise, ready to be handed to a plotter.
class SeriesCollector {
public:
  SeriesCollector(const std::string& xExpression,
                  const std::vector<std::string>& yExpressions,
                  const Registry* extraNames = nullptr);

  // Evaluation failures propagate; nothing is recorded for that dump.
  void add(const Dump& dump);

  const SeriesTable& table() const { return table_; }
  SeriesTable release() { return std::move(table_); }

private:
  NodePtr x_;
  std::vector<NodePtr> ys_;
  SeriesTable table_;
  std::vector<double> scratch_;
};

// Runs a collector over the first dump of every batch of `source`.
template <class Source>
SeriesTable collectSeries(Source source,
                          const std::string& xExpression,
                          const std::vector<std::string>& yExpressions,
                          const WindowOptions& window = defaultPlotWindow(),
                          const Registry* extraNames = nullptr)
{
  SeriesCollector c(xExpression, yExpressions, extraNames);
  auto stream = windowed(std::move(source), window);
  while (auto batch = stream.next()) c.add(asDump(batch->front()));
  return c.release();
}

// {"x":{"label":...,"values":[...]},"series":[{"label":...,"values":[...]},...]}
std::string toJson(const SeriesTable& table);

} // namespace statexpr
