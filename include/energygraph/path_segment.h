#ifndef ENERGYGRAPH_PATH_SEGMENT_H
#define ENERGYGRAPH_PATH_SEGMENT_H

#include "energygraph/errors.h"

#include <array>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace egraph {

/// A point in device coordinates.
struct Point {
  double x;
  double y;

  bool operator==(const Point &o) const { return x == o.x && y == o.y; }
  bool operator!=(const Point &o) const { return !(*this == o); }
};

/// One absolute svg path command.
struct PathCommand {
  enum Type {
    MOVE,             ///< M x y
    LINE,             ///< L x y
    QUADRATIC,        ///< Q cx cy, x y
    SMOOTH_QUADRATIC, ///< T x y
    CUBIC,            ///< C c1x c1y, c2x c2y, x y
    SMOOTH_CUBIC,     ///< S c2x c2y, x y
    CLOSE,            ///< Z
  };

  static PathCommand move(Point p) { return {MOVE, {p}}; }
  static PathCommand line(Point p) { return {LINE, {p}}; }
  static PathCommand quadratic(Point p, Point control) {
    return {QUADRATIC, {control, p}};
  }
  static PathCommand smoothQuadratic(Point p) {
    return {SMOOTH_QUADRATIC, {p}};
  }
  static PathCommand cubic(Point p, Point control2, Point control1) {
    return {CUBIC, {control1, control2, p}};
  }
  static PathCommand smoothCubic(Point p, Point control2) {
    return {SMOOTH_CUBIC, {control2, p}};
  }
  static PathCommand close() { return {CLOSE, {}}; }

  Type type;
  /// Control points followed by the end point, as they appear in the
  /// path data.
  std::vector<Point> points;

  /// The point this command draws to.
  const Point &getEnd() const { return points.back(); }

  friend std::ostream &operator<<(std::ostream &os, const PathCommand &cmd);
};

/// Straight lines through all points.
class LinearPath {
public:
  explicit LinearPath(std::vector<Point> points);

  const Point &getStart() const { return points.front(); }
  const std::vector<Point> &getPoints() const { return points; }

  /// Produce-once stream of the commands following the start point. It
  /// refers to the path's points and must not outlive the path.
  class Commands {
  public:
    explicit Commands(const std::vector<Point> &points) : points(&points) {}
    std::optional<PathCommand> next();

  private:
    const std::vector<Point> *points;
    size_t idx = 1;
  };
  Commands getCommands() const { return Commands(points); }

private:
  std::vector<Point> points;
};

/// Quadratic curve. The first control point lies halfway between the
/// first two points, all further ones are reflected (T commands).
class QuadraticPath {
public:
  explicit QuadraticPath(std::vector<Point> points);

  const Point &getStart() const { return points.front(); }
  const std::vector<Point> &getPoints() const { return points; }

  class Commands {
  public:
    explicit Commands(const std::vector<Point> &points) : points(&points) {}
    std::optional<PathCommand> next();

  private:
    const std::vector<Point> *points;
    size_t idx = 1;
  };
  Commands getCommands() const { return Commands(points); }

private:
  std::vector<Point> points;
};

/// Smooth cubic curve through all points. Every point gets one incoming
/// control handle estimated from its neighbours (Catmull-Rom style); the
/// outgoing handle is the implicit reflection of an S command.
///
/// If the neighbours of a point share their x coordinate the gradient is
/// taken as zero, which puts the handle onto the point itself.
/// checkTangents() reports these points for callers that want to treat
/// them as errors.
class CubicPath {
public:
  explicit CubicPath(std::vector<Point> points);

  const Point &getStart() const { return points.front(); }
  const std::vector<Point> &getPoints() const { return points; }

  /// Fails with UNDEFINED_TANGENT if any tangent estimate had to fall back
  /// to a zero gradient.
  GraphErrorOr<void> checkTangents() const;

  /// Incoming control handle of @p current.
  static Point getControlPoint(const Point &prev, const Point &current,
                               const Point &next);

  class Commands {
  public:
    explicit Commands(const std::vector<Point> &points)
        : points(&points), prev(points.front()), current(points.front()) {}
    std::optional<PathCommand> next();

  private:
    const std::vector<Point> *points;
    Point prev;
    Point current;
    size_t idx = 1;
    bool finished = false;
  };
  Commands getCommands() const { return Commands(points); }

private:
  std::vector<Point> points;
};

using PathSegment = std::variant<LinearPath, QuadraticPath, CubicPath>;

const Point &getStart(const PathSegment &segment);
/// Drains the command stream of @p segment into @p out.
void appendCommands(const PathSegment &segment,
                    std::vector<PathCommand> &out);

/// Builds the svg path data for a sequence of segments. The first segment
/// starts with a move, every following one is joined with a line to its
/// start.
std::string formatPathData(const std::vector<PathSegment> &segments,
                           bool closed = false);

} // namespace egraph
#endif // ENERGYGRAPH_PATH_SEGMENT_H
