#include "energygraph/divisions.h"

#include <cassert>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace egraph;

namespace {
class ListDivisionStream : public DivisionStream {
public:
  ListDivisionStream(const std::vector<Division> &divisions,
                     int64_t periodStart, int64_t periodEnd)
      : divisions(divisions), periodEnd(periodEnd) {
    // Start at the last boundary at or before the period start.
    while (idx + 1 < divisions.size() &&
           divisions[idx + 1].boundary <= periodStart)
      ++idx;
  }
  std::optional<Division> next() override {
    if (passedEnd || idx >= divisions.size())
      return std::nullopt;
    const Division &div = divisions[idx++];
    passedEnd = div.boundary > periodEnd;
    return div;
  }

private:
  const std::vector<Division> &divisions;
  int64_t periodEnd;
  size_t idx = 0;
  bool passedEnd = false;
};

class FixedIntervalDivisionStream : public DivisionStream {
public:
  FixedIntervalDivisionStream(int64_t period, const std::string &labelFormat,
                              int64_t periodStart, int64_t periodEnd)
      : period(period), labelFormat(labelFormat), periodEnd(periodEnd) {
    // Round towards negative infinity, also for pre-epoch timestamps.
    boundary = periodStart / period * period;
    if (boundary > periodStart)
      boundary -= period;
  }
  std::optional<Division> next() override {
    if (boundary - period > periodEnd)
      return std::nullopt;
    Division div{boundary, formatUTC(boundary, labelFormat.c_str())};
    boundary += period;
    return div;
  }

private:
  int64_t period;
  const std::string &labelFormat;
  int64_t periodEnd;
  int64_t boundary;
};
} // namespace

std::unique_ptr<DivisionStream>
ListDivisionSource::divide(int64_t periodStart, int64_t periodEnd) const {
  return std::make_unique<ListDivisionStream>(divisions, periodStart,
                                              periodEnd);
}

std::unique_ptr<DivisionStream>
FixedIntervalDivisionSource::divide(int64_t periodStart,
                                    int64_t periodEnd) const {
  assert(period > 0 && "Division period must be positive");
  return std::make_unique<FixedIntervalDivisionStream>(
      period, labelFormat, periodStart, periodEnd);
}

std::string egraph::formatUTC(int64_t timestamp, const char *format) {
  std::time_t time = static_cast<std::time_t>(timestamp);
  std::tm tm{};
  std::stringstream ss;
  // Years past the range of tm fall back to the raw timestamp.
  if (!gmtime_r(&time, &tm)) {
    ss << timestamp;
    return ss.str();
  }
  ss << std::put_time(&tm, format);
  return ss.str();
}
