#ifndef ENERGYGRAPH_DIVISIONS_H
#define ENERGYGRAPH_DIVISIONS_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace egraph {

/// A calendar aligned breakpoint. The label names the period starting at
/// the boundary.
struct Division {
  int64_t boundary;
  std::string label;
};

/// Produce-once stream of divisions in ascending order.
struct DivisionStream {
  virtual ~DivisionStream() = default;
  virtual std::optional<Division> next() = 0;
};

/// Generates the divisions covering a period: the first boundary is at or
/// before the period start and the stream continues until it has produced
/// one boundary strictly past the period end.
struct DivisionSource {
  virtual ~DivisionSource() = default;
  virtual std::unique_ptr<DivisionStream> divide(int64_t periodStart,
                                                 int64_t periodEnd) const = 0;
};

/// Serves a fixed list of divisions, e.g. ones computed by the host.
/// Boundaries must be ascending.
class ListDivisionSource : public DivisionSource {
public:
  explicit ListDivisionSource(std::vector<Division> divisions)
      : divisions(std::move(divisions)) {}
  std::unique_ptr<DivisionStream> divide(int64_t periodStart,
                                         int64_t periodEnd) const override;

private:
  std::vector<Division> divisions;
};

/// Boundaries at multiples of a fixed period since the epoch (UTC), e.g.
/// 14400 for four hours or 86400 for days. Labels are formatted with
/// strftime.
class FixedIntervalDivisionSource : public DivisionSource {
public:
  FixedIntervalDivisionSource(int64_t period, std::string labelFormat)
      : period(period), labelFormat(std::move(labelFormat)) {}
  std::unique_ptr<DivisionStream> divide(int64_t periodStart,
                                         int64_t periodEnd) const override;

private:
  int64_t period;
  std::string labelFormat;
};

/// Formats a unix timestamp as UTC using a strftime pattern. Timestamps
/// whose year doesn't fit into std::tm are printed as plain numbers.
std::string formatUTC(int64_t timestamp, const char *format);

} // namespace egraph
#endif // ENERGYGRAPH_DIVISIONS_H
