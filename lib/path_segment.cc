#include "energygraph/path_segment.h"

#include <cassert>
#include <sstream>

using namespace egraph;

namespace egraph {
std::ostream &operator<<(std::ostream &os, const PathCommand &cmd) {
  static constexpr char Letters[] = {'M', 'L', 'Q', 'T', 'C', 'S', 'Z'};
  os << Letters[cmd.type];
  bool first = true;
  for (const Point &p : cmd.points) {
    if (!first)
      os << ',';
    os << ' ' << p.x << ' ' << p.y;
    first = false;
  }
  return os;
}
} // namespace egraph

LinearPath::LinearPath(std::vector<Point> points) : points(std::move(points)) {
  assert(!this->points.empty() && "Paths need at least one point");
}

std::optional<PathCommand> LinearPath::Commands::next() {
  if (idx >= points->size())
    return std::nullopt;
  return PathCommand::line((*points)[idx++]);
}

QuadraticPath::QuadraticPath(std::vector<Point> points)
    : points(std::move(points)) {
  assert(!this->points.empty() && "Paths need at least one point");
}

std::optional<PathCommand> QuadraticPath::Commands::next() {
  if (idx >= points->size())
    return std::nullopt;
  const Point &p = (*points)[idx++];
  if (idx == 2) {
    const Point &origin = points->front();
    return PathCommand::quadratic(
        p, {(origin.x + p.x) / 2, (origin.y + p.y) / 2});
  }
  return PathCommand::smoothQuadratic(p);
}

CubicPath::CubicPath(std::vector<Point> points) : points(std::move(points)) {
  assert(!this->points.empty() && "Paths need at least one point");
}

Point CubicPath::getControlPoint(const Point &prev, const Point &current,
                                 const Point &next) {
  constexpr double k = 0.5;
  constexpr double m = 0.5;
  double dx = next.x - prev.x;
  double gradient = dx == 0. ? 0. : m * (next.y - prev.y) / dx;
  double offset = current.x - prev.x;
  return {current.x - k * offset, current.y - k * offset * gradient};
}

GraphErrorOr<void> CubicPath::checkTangents() const {
  // Mirrors the neighbour triples used by Commands::next().
  for (size_t i = 0; i < points.size(); ++i) {
    const Point &prev = points[i == 0 ? 0 : i - 1];
    const Point &next = points[i + 1 < points.size() ? i + 1 : i];
    if (next.x == prev.x && points.size() > 1) {
      std::stringstream ss;
      ss << "Tangent at (" << points[i].x << ", " << points[i].y
         << ") is undefined: neighbours share x = " << prev.x;
      return GraphError(GraphError::UNDEFINED_TANGENT, ss.str());
    }
  }
  return {};
}

std::optional<PathCommand> CubicPath::Commands::next() {
  if (finished)
    return std::nullopt;
  Point following = current;
  if (idx < points->size())
    following = (*points)[idx++];
  else
    finished = true;
  Point control = getControlPoint(prev, current, following);
  PathCommand cmd = PathCommand::smoothCubic(current, control);
  prev = current;
  current = following;
  return cmd;
}

const Point &egraph::getStart(const PathSegment &segment) {
  return std::visit(
      [](const auto &path) -> const Point & { return path.getStart(); },
      segment);
}

void egraph::appendCommands(const PathSegment &segment,
                            std::vector<PathCommand> &out) {
  std::visit(
      [&out](const auto &path) {
        auto commands = path.getCommands();
        while (auto cmd = commands.next())
          out.push_back(std::move(*cmd));
      },
      segment);
}

std::string egraph::formatPathData(const std::vector<PathSegment> &segments,
                                   bool closed) {
  std::vector<PathCommand> commands;
  for (const PathSegment &segment : segments) {
    const Point &start = getStart(segment);
    commands.push_back(commands.empty() ? PathCommand::move(start)
                                        : PathCommand::line(start));
    appendCommands(segment, commands);
  }
  if (closed && !commands.empty())
    commands.push_back(PathCommand::close());

  std::stringstream ss;
  bool first = true;
  for (const PathCommand &cmd : commands) {
    if (!first)
      ss << ' ';
    ss << cmd;
    first = false;
  }
  return ss.str();
}
