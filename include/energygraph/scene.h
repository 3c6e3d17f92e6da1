#ifndef ENERGYGRAPH_SCENE_H
#define ENERGYGRAPH_SCENE_H

#include "energygraph/axis_transform.h"
#include "energygraph/errors.h"
#include "energygraph/path_segment.h"
#include "energygraph/statistics.h"
#include "energygraph/style.h"

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace egraph {

// The scene graph is a strict tree of plain structs. Node is a closed sum
// over all of them and rendering dispatches on the alternative (see
// renderer.h). Containers receive their children when they are built and
// draw them in that order, later children on top.

struct Node;
using NodeList = std::vector<Node>;

struct Document {
  double width;
  double height;
  /// Class marker on the root element for host styling.
  std::string cssClass;
  /// Optional css rules, emitted as a <style> element before the children.
  std::vector<std::string> styleSheet;
  NodeList children;
};

struct Group {
  std::string cssClass;
  NodeList children;
};

struct Rect {
  double x;
  double y;
  double width;
  double height;
  StyleRef style;
};

struct Line {
  double x1;
  double y1;
  double x2;
  double y2;
  StyleRef style;
  /// stroke-dasharray, empty for solid lines
  std::string dashes;
};

struct Text {
  double x;
  double y;
  std::string content;
  /// text-anchor, empty to inherit
  std::string anchor;
  /// 0 to inherit
  double fontSize = 0;
  std::string cssClass;
  /// font-family, empty to inherit
  std::string fontFamily;
};

struct Path {
  StyleRef style;
  std::vector<PathSegment> segments;
  bool closed = false;
};

/// Hover marker: a circle carrying a tooltip.
struct DataPoint {
  Point center;
  double radius;
  StyleRef style;
  std::string title;
};

/// Shaded background for one calendar period plus its caption.
struct IntervalBlock {
  Rect background;
  Rect captionBox;
  Text label;
};

/// Horizontal gridline with a value label at its left end.
struct HorizontalAxis {
  Line gridline;
  Text label;
};

/// One column of a statistics series drawn as a smooth curve.
struct GraphLine {
  StatSample::Column column;
  Path path;
};

/// Closed band between two columns of a statistics series.
struct GraphRegion {
  Path path;
};

/// Static hover details for one bucket. Visibility is left to the
/// embedding page, which can key on the css class.
struct GraphInfoOverlay {
  std::string cssClass;
  NodeList children;
};

struct Node {
  using value_t =
      std::variant<Document, Group, Rect, Line, Text, Path, DataPoint,
                   IntervalBlock, HorizontalAxis, GraphLine, GraphRegion,
                   GraphInfoOverlay>;

  template <typename NodeTy,
            typename = std::enable_if_t<
                !std::is_same_v<std::decay_t<NodeTy>, Node>>>
  Node(NodeTy &&node) : value(std::forward<NodeTy>(node)) {}

  value_t value;
};

/// Projects @p column of every sample through the two transforms. Fails
/// with MISSING_FIELD for unknown column names, NaN values and empty
/// series.
GraphErrorOr<std::vector<Point>>
projectColumn(const std::vector<StatSample> &series, std::string_view column,
              const AxisTransform &xAxis, const AxisTransform &yAxis);

IntervalBlock makeIntervalBlock(double left, double right, double height,
                                std::string label, StyleRef background,
                                StyleRef caption, const FontInfo &font);

HorizontalAxis makeHorizontalAxis(double y, double left, double right,
                                  std::string label, StyleRef style,
                                  const FontInfo &font);

/// With @p strictTangents set, curves whose tangents had to be guessed
/// fail with UNDEFINED_TANGENT.
GraphErrorOr<GraphLine> makeGraphLine(const std::vector<StatSample> &series,
                                      std::string_view column,
                                      const AxisTransform &xAxis,
                                      const AxisTransform &yAxis,
                                      StyleRef style,
                                      bool strictTangents = false);

/// Band enclosed by the reversed @p lower curve and the forward @p upper
/// curve. Both need the same, non-zero number of points.
GraphErrorOr<GraphRegion> makeGraphRegion(std::vector<Point> lower,
                                          std::vector<Point> upper,
                                          StyleRef style,
                                          bool strictTangents = false);
GraphErrorOr<GraphRegion> makeGraphRegion(
    const std::vector<StatSample> &series, std::string_view lowerColumn,
    std::string_view upperColumn, const AxisTransform &xAxis,
    const AxisTransform &yAxis, StyleRef style, bool strictTangents = false);

/// Appearance of the hover overlays.
struct OverlayStyle {
  struct Track {
    std::string column;
    std::string caption;
    StyleRef marker;
  };
  std::vector<Track> tracks;
  StyleRef guide;
  /// Transparent hit area spanning the bucket so hovering works between
  /// markers.
  StyleRef hitArea;
  double slotWidth = 0;
  double top = 0;
  double bottom = 0;
  double markerRadius = 4;
  std::string unit = "kW";
  const char *timeFormat = "%Y-%m-%d %H:%M";
  std::string cssClass = "energy-graph-overlay";
  FontInfo font;
};

GraphErrorOr<GraphInfoOverlay>
makeGraphInfoOverlay(const StatSample &sample, const AxisTransform &xAxis,
                     const AxisTransform &yAxis, const OverlayStyle &style);

} // namespace egraph
#endif // ENERGYGRAPH_SCENE_H
