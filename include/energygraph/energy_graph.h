#ifndef ENERGYGRAPH_ENERGY_GRAPH_H
#define ENERGYGRAPH_ENERGY_GRAPH_H

#include "energygraph/divisions.h"
#include "energygraph/errors.h"
#include "energygraph/scene.h"
#include "energygraph/statistics.h"

#include <iostream>
#include <string>
#include <vector>

namespace egraph {

struct GraphOptions {
  double width = 840;
  double height = 630;
  /// Number of buckets (points per curve) wanted.
  size_t bucketCount = 48;
  /// Number of historical periods the samples are expected to cover.
  size_t statsDuration = 10;
  /// Upper bound for the number of gridline intervals.
  unsigned gridlineCount = 5;
  double marginLeft = 60;
  double marginRight = 20;
  double marginTop = 40;
  double marginBottom = 30;
  FontInfo font = FontInfo("sans-serif", 12);
  std::string unit = "kW";
  const char *timeFormat = "%Y-%m-%d %H:%M";
  std::string cssClass = "energy-graph";
  std::string overlayClass = "energy-graph-overlay";
  /// Embed css that hides the overlays until hovered.
  bool embedHoverStyles = false;
  /// Treat guessed curve tangents as errors.
  bool strictTangents = false;
  /// Indented instead of compact markup.
  bool formatted = false;
  /// Receives diagnostics if set.
  std::ostream *log = nullptr;
};

/// Aggregates @p samples (oldest first) and assembles the chart document.
/// @p divisions may be null, in which case no interval blocks are drawn.
GraphErrorOr<Document> buildEnergyGraph(const std::vector<Sample> &samples,
                                        const DivisionSource *divisions,
                                        const GraphOptions &options);

/// buildEnergyGraph followed by serialization to svg markup.
GraphErrorOr<std::string> renderEnergyGraph(const std::vector<Sample> &samples,
                                            const DivisionSource *divisions,
                                            const GraphOptions &options);

} // namespace egraph
#endif // ENERGYGRAPH_ENERGY_GRAPH_H
