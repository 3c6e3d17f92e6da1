#include "energygraph/statistics.h"
#include "energygraph/utils.h"

#include <algorithm>
#include <numeric>

using namespace egraph;

double StatSample::get(Column column) const {
  switch (column) {
  case CONSUMPTION:
    return current;
  case AVERAGE:
    return average;
  case Q1:
    return q1;
  case Q3:
    return q3;
  }
  egraph_unreachable("Unknown StatSample column");
}

const char *StatSample::getColumnName(Column column) {
  switch (column) {
  case CONSUMPTION:
    return "consumption";
  case AVERAGE:
    return "average";
  case Q1:
    return "q1";
  case Q3:
    return "q3";
  }
  egraph_unreachable("Unknown StatSample column");
}

std::optional<StatSample::Column>
StatSample::parseColumn(std::string_view name) {
  if (name == "current")
    return CONSUMPTION;
  for (Column column : AllColumns)
    if (name == getColumnName(column))
      return column;
  return std::nullopt;
}

std::optional<StatSample> StatisticsAggregator::next() {
  if (done)
    return std::nullopt;
  if (bucket >= bucketCount || bucket >= samples.size()) {
    done = true;
    return std::nullopt;
  }

  std::vector<double> window;
  for (size_t idx = bucket; idx < samples.size(); idx += bucketCount)
    window.push_back(newest(idx).value);

  StatSample stat;
  stat.timestamp = newest(bucket).timestamp;
  stat.current = window.front();
  stat.average =
      std::accumulate(window.begin(), window.end(), 0.) / window.size();
  std::sort(window.begin(), window.end());
  size_t quarter = window.size() / 4;
  stat.q1 = window[quarter];
  stat.q3 = window[window.size() - 1 - quarter];
  ++bucket;
  return stat;
}

std::vector<StatSample> StatisticsAggregator::collect() {
  std::vector<StatSample> res;
  while (auto stat = next())
    res.push_back(*stat);
  return res;
}
