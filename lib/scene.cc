#include "energygraph/scene.h"
#include "energygraph/divisions.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

using namespace egraph;

GraphErrorOr<std::vector<Point>>
egraph::projectColumn(const std::vector<StatSample> &series,
                      std::string_view column, const AxisTransform &xAxis,
                      const AxisTransform &yAxis) {
  auto parsed = StatSample::parseColumn(column);
  if (!parsed)
    return GraphError(GraphError::MISSING_FIELD,
                      "Unknown column \"" + std::string(column) + "\"");
  if (series.empty())
    return GraphError(GraphError::MISSING_FIELD,
                      "No samples to plot for column \"" +
                          std::string(column) + "\"");
  std::vector<Point> points;
  points.reserve(series.size());
  for (const StatSample &sample : series) {
    double value = sample.get(*parsed);
    if (std::isnan(value)) {
      std::stringstream ss;
      ss << "Sample at " << sample.timestamp << " has no value for column \""
         << column << "\"";
      return GraphError(GraphError::MISSING_FIELD, ss.str());
    }
    points.push_back({xAxis.map(static_cast<double>(sample.timestamp)),
                      yAxis.map(value)});
  }
  return points;
}

IntervalBlock egraph::makeIntervalBlock(double left, double right,
                                        double height, std::string label,
                                        StyleRef background, StyleRef caption,
                                        const FontInfo &font) {
  constexpr double padding = 4;
  double captionWidth = font.getWidth(label) + 2 * padding;
  double captionHeight = font.getHeight() + 2 * padding;
  IntervalBlock block{
      Rect{left, 0, right - left, height, std::move(background)},
      Rect{left, 0, captionWidth, captionHeight, std::move(caption)},
      Text{left + padding, padding + font.getHeight(), std::move(label), "",
           font.getSize(), "", font.getFont()}};
  return block;
}

HorizontalAxis egraph::makeHorizontalAxis(double y, double left, double right,
                                          std::string label, StyleRef style,
                                          const FontInfo &font) {
  HorizontalAxis axis{Line{left, y, right, y, std::move(style), "4 4"},
                      Text{left - 4, y + font.getHeight() / 3,
                           std::move(label), "end", font.getSize(), "",
                           font.getFont()}};
  return axis;
}

GraphErrorOr<GraphLine> egraph::makeGraphLine(
    const std::vector<StatSample> &series, std::string_view column,
    const AxisTransform &xAxis, const AxisTransform &yAxis, StyleRef style,
    bool strictTangents) {
  auto points = projectColumn(series, column, xAxis, yAxis);
  if (points)
    return points.to_error();
  CubicPath curve(std::move(*points));
  if (strictTangents)
    if (auto err = curve.checkTangents())
      return err.to_error();
  GraphLine line{*StatSample::parseColumn(column),
                 Path{std::move(style), {std::move(curve)}, false}};
  return line;
}

GraphErrorOr<GraphRegion> egraph::makeGraphRegion(std::vector<Point> lower,
                                                  std::vector<Point> upper,
                                                  StyleRef style,
                                                  bool strictTangents) {
  if (lower.size() != upper.size()) {
    std::stringstream ss;
    ss << "Region bounds differ in length: " << lower.size() << " lower vs "
       << upper.size() << " upper points";
    return GraphError(GraphError::MISSING_FIELD, ss.str());
  }
  if (lower.empty())
    return GraphError(GraphError::MISSING_FIELD, "Region without points");
  std::reverse(lower.begin(), lower.end());
  CubicPath back(std::move(lower));
  CubicPath forth(std::move(upper));
  if (strictTangents) {
    if (auto err = back.checkTangents())
      return err.to_error();
    if (auto err = forth.checkTangents())
      return err.to_error();
  }
  GraphRegion region{
      Path{std::move(style), {std::move(back), std::move(forth)}, true}};
  return region;
}

GraphErrorOr<GraphRegion> egraph::makeGraphRegion(
    const std::vector<StatSample> &series, std::string_view lowerColumn,
    std::string_view upperColumn, const AxisTransform &xAxis,
    const AxisTransform &yAxis, StyleRef style, bool strictTangents) {
  auto lower = projectColumn(series, lowerColumn, xAxis, yAxis);
  if (lower)
    return lower.to_error();
  auto upper = projectColumn(series, upperColumn, xAxis, yAxis);
  if (upper)
    return upper.to_error();
  return makeGraphRegion(std::move(*lower), std::move(*upper),
                         std::move(style), strictTangents);
}

static std::string formatValue(double value, const std::string &unit) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(2) << value << ' ' << unit;
  return ss.str();
}

GraphErrorOr<GraphInfoOverlay>
egraph::makeGraphInfoOverlay(const StatSample &sample,
                             const AxisTransform &xAxis,
                             const AxisTransform &yAxis,
                             const OverlayStyle &style) {
  const FontInfo &font = style.font;
  double x = xAxis.map(static_cast<double>(sample.timestamp));
  NodeList children;
  if (style.hitArea && style.slotWidth > 0)
    children.emplace_back(Rect{x - style.slotWidth / 2, style.top,
                               style.slotWidth, style.bottom - style.top,
                               style.hitArea});
  children.emplace_back(Line{x, style.top, x, style.bottom, style.guide, ""});
  children.emplace_back(Text{x, style.top - font.getHeight() / 2,
                             formatUTC(sample.timestamp, style.timeFormat),
                             "middle", font.getSize(), "", font.getFont()});

  double labelY = style.top + font.getHeight() * 1.5;
  for (const OverlayStyle::Track &track : style.tracks) {
    auto column = StatSample::parseColumn(track.column);
    if (!column)
      return GraphError(GraphError::MISSING_FIELD,
                        "Unknown column \"" + track.column + "\"");
    double value = sample.get(*column);
    if (std::isnan(value)) {
      std::stringstream ss;
      ss << "Sample at " << sample.timestamp << " has no value for column \""
         << track.column << "\"";
      return GraphError(GraphError::MISSING_FIELD, ss.str());
    }
    std::string text = track.caption + ": " + formatValue(value, style.unit);
    children.emplace_back(DataPoint{{x, yAxis.map(value)},
                                    style.markerRadius,
                                    track.marker,
                                    text});
    children.emplace_back(
        Text{x + style.markerRadius * 2, labelY, std::move(text), "start",
             font.getSize(), StatSample::getColumnName(*column),
             font.getFont()});
    labelY += font.getHeight() * 1.25;
  }
  GraphInfoOverlay overlay{style.cssClass, std::move(children)};
  return overlay;
}
