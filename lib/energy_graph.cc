#include "energygraph/energy_graph.h"
#include "energygraph/axis_transform.h"
#include "energygraph/renderer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

using namespace egraph;

namespace {
/// Presentation attributes shared by all nodes of one render call.
struct GraphStyles {
  StyleRef evenBlock = makeStyle("none", "#f4f4f4");
  StyleRef oddBlock = makeStyle("none", "#e6e6e6");
  StyleRef caption = makeStyle("#cccccc", "#ffffff", 1, 1, 0.8);
  StyleRef gridline = makeStyle("#bbbbbb", "none", 0.5);
  StyleRef region = makeStyle("none", "#7f7f7f", 0, 0, 0.2);
  StyleRef consumption = makeStyle("#1f77b4", "none", 2);
  StyleRef average = makeStyle("#ff7f0e", "none", 1.5);
  StyleRef quartile = makeStyle("#7f7f7f", "none", 1, 0.6);
  StyleRef guide = makeStyle("#444444", "none", 0.5);
  StyleRef hitArea = makeStyle("none", "#ffffff", 0, 0, 0);
};

class GraphBuilder {
public:
  GraphBuilder(const GraphOptions &options) : options(options) {}

  GraphErrorOr<Document> build(const std::vector<Sample> &samples,
                               const DivisionSource *divisions);

private:
  template <typename... args_t> void log(args_t &&... args) {
    if (!options.log)
      return;
    (*options.log << ... << std::forward<args_t>(args));
    *options.log << "\n";
  }

  GraphErrorOr<void> prepareAxes(const std::vector<StatSample> &series);
  Group buildIntervalBlocks(const DivisionSource &divisions, int64_t start,
                            int64_t end);
  Group buildGridlines();
  std::string formatValue(double value) const;

  const GraphOptions &options;
  GraphStyles styles;
  AxisTransform xAxis{1, 0};
  AxisTransform yAxis{1, 0};
  double valueTop = 0;
  double gridInterval = 0;
};
} // namespace

std::string GraphBuilder::formatValue(double value) const {
  std::stringstream ss;
  ss << value << ' ' << options.unit;
  return ss.str();
}

GraphErrorOr<void>
GraphBuilder::prepareAxes(const std::vector<StatSample> &series) {
  if (series.empty())
    return GraphError(GraphError::DEGENERATE_RANGE, "No buckets to plot");
  double maxValue = -std::numeric_limits<double>::infinity();
  for (const StatSample &sample : series)
    for (StatSample::Column column : StatSample::AllColumns)
      if (!std::isnan(sample.get(column)))
        maxValue = std::max(maxValue, sample.get(column));

  auto interval = selectDivisionInterval(maxValue, options.gridlineCount);
  if (interval)
    return interval.to_error();
  gridInterval = *interval;
  // First gridline strictly above the largest value.
  valueTop = (std::floor(maxValue / gridInterval) + 1) * gridInterval;

  auto timeData = AxisTransform::fromRange(
      static_cast<double>(series.front().timestamp),
      static_cast<double>(series.back().timestamp));
  if (timeData)
    return timeData.to_error();
  auto valueData = AxisTransform::fromRange(0, valueTop);
  if (valueData)
    return valueData.to_error();

  xAxis = timeData->applyDisplay(AxisTransform::display(
      options.marginLeft, options.width - options.marginRight));
  yAxis = valueData->applyDisplay(AxisTransform::display(
      options.height - options.marginBottom, options.marginTop));
  return {};
}

Group GraphBuilder::buildIntervalBlocks(const DivisionSource &divisions,
                                        int64_t start, int64_t end) {
  Group blocks{"interval-blocks", {}};
  auto stream = divisions.divide(start, end);
  std::optional<Division> prev = stream->next();
  size_t idx = 0;
  while (prev && prev->boundary <= end) {
    std::optional<Division> cur = stream->next();
    if (!cur)
      break;
    int64_t from = std::max(prev->boundary, start);
    int64_t to = std::min(cur->boundary, end);
    if (from < to) {
      blocks.children.emplace_back(makeIntervalBlock(
          xAxis.map(static_cast<double>(from)),
          xAxis.map(static_cast<double>(to)), options.height, prev->label,
          idx % 2 ? styles.oddBlock : styles.evenBlock, styles.caption,
          options.font));
      ++idx;
    }
    prev = std::move(cur);
  }
  log("Drew ", idx, " interval blocks");
  return blocks;
}

Group GraphBuilder::buildGridlines() {
  Group gridlines{"gridlines", {}};
  size_t count = static_cast<size_t>(std::round(valueTop / gridInterval));
  for (size_t k = 0; k <= count; ++k) {
    double value = k * gridInterval;
    gridlines.children.emplace_back(makeHorizontalAxis(
        yAxis.map(value), options.marginLeft,
        options.width - options.marginRight, formatValue(value),
        styles.gridline, options.font));
  }
  log("Drew ", count + 1, " gridlines, ", gridInterval, " ", options.unit,
      " apart");
  return gridlines;
}

GraphErrorOr<Document>
GraphBuilder::build(const std::vector<Sample> &samples,
                    const DivisionSource *divisions) {
  size_t expected = options.bucketCount * options.statsDuration;
  if (samples.size() < expected)
    log("Warning: got ", samples.size(), " samples, expected ", expected);

  StatisticsAggregator aggregator(samples, options.bucketCount);
  std::vector<StatSample> series = aggregator.collect();
  if (aggregator.ranOutOfHistory()) {
    std::stringstream ss;
    ss << "produced " << series.size() << " of " << options.bucketCount
       << " buckets";
    log("Warning: ",
        GraphError(GraphError::INSUFFICIENT_DATA, ss.str()));
  }
  // Buckets come newest first, the chart runs left to right.
  std::reverse(series.begin(), series.end());

  if (auto err = prepareAxes(series))
    return err.to_error();

  int64_t start = series.front().timestamp;
  int64_t end = series.back().timestamp;
  NodeList children;
  if (divisions)
    children.emplace_back(buildIntervalBlocks(*divisions, start, end));
  children.emplace_back(buildGridlines());

  auto region = makeGraphRegion(series, "q1", "q3", xAxis, yAxis,
                                styles.region, options.strictTangents);
  if (region)
    return region.to_error();
  children.emplace_back(std::move(*region));

  const std::pair<const char *, StyleRef> curves[] = {
      {"consumption", styles.consumption},
      {"average", styles.average},
      {"q1", styles.quartile},
      {"q3", styles.quartile}};
  for (const auto &curve : curves) {
    auto line = makeGraphLine(series, curve.first, xAxis, yAxis, curve.second,
                              options.strictTangents);
    if (line)
      return line.to_error();
    children.emplace_back(std::move(*line));
  }

  OverlayStyle overlayStyle;
  overlayStyle.tracks = {{"consumption", "Consumption", styles.consumption},
                         {"average", "Average", styles.average},
                         {"q1", "Lower quartile", styles.quartile},
                         {"q3", "Upper quartile", styles.quartile}};
  overlayStyle.guide = styles.guide;
  overlayStyle.hitArea = styles.hitArea;
  overlayStyle.slotWidth =
      (options.width - options.marginLeft - options.marginRight) /
      series.size();
  overlayStyle.top = options.marginTop;
  overlayStyle.bottom = options.height - options.marginBottom;
  overlayStyle.unit = options.unit;
  overlayStyle.timeFormat = options.timeFormat;
  overlayStyle.cssClass = options.overlayClass;
  overlayStyle.font = options.font;
  Group overlays{"overlays", {}};
  for (const StatSample &sample : series) {
    auto overlay = makeGraphInfoOverlay(sample, xAxis, yAxis, overlayStyle);
    if (overlay)
      return overlay.to_error();
    overlays.children.emplace_back(std::move(*overlay));
  }
  children.emplace_back(std::move(overlays));
  log("Plotted ", series.size(), " buckets");

  std::vector<std::string> styleSheet;
  if (options.embedHoverStyles) {
    styleSheet.push_back("." + options.overlayClass + " { opacity: 0; }");
    styleSheet.push_back("." + options.overlayClass +
                         ":hover { opacity: 1; }");
  }
  Document doc{options.width, options.height, options.cssClass,
               std::move(styleSheet), std::move(children)};
  return doc;
}

GraphErrorOr<Document> egraph::buildEnergyGraph(
    const std::vector<Sample> &samples, const DivisionSource *divisions,
    const GraphOptions &options) {
  GraphBuilder builder(options);
  return builder.build(samples, divisions);
}

GraphErrorOr<std::string> egraph::renderEnergyGraph(
    const std::vector<Sample> &samples, const DivisionSource *divisions,
    const GraphOptions &options) {
  auto doc = buildEnergyGraph(samples, divisions, options);
  if (doc)
    return doc.to_error();
  return render(Node(std::move(*doc)), options.formatted);
}
