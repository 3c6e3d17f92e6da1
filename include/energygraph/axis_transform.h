#ifndef ENERGYGRAPH_AXIS_TRANSFORM_H
#define ENERGYGRAPH_AXIS_TRANSFORM_H

#include "energygraph/errors.h"

namespace egraph {

/// Linear mapping `y = m * x + c` between a value domain and display
/// coordinates. Transforms are values: every operation returns a new one.
class AxisTransform {
public:
  AxisTransform(double m, double c) : m(m), c(c) {}

  /// Transform mapping @p min to 0 and @p max to 1.
  static GraphErrorOr<AxisTransform> fromRange(double min, double max);
  /// Transform mapping 0 to @p start and 1 to @p end, e.g. the unit range
  /// onto a pixel span. Passing start > end flips the axis.
  static AxisTransform display(double start, double end) {
    return AxisTransform(end - start, start);
  }

  double map(double value) const { return m * value + c; }
  double unmap(double value) const { return (value - c) / m; }

  /// Folds @p device into this transform so that
  /// `applyDisplay(device).map(x) == device.map(map(x))`.
  AxisTransform applyDisplay(const AxisTransform &device) const {
    return AxisTransform(device.m * m, device.m * c + device.c);
  }
  AxisTransform inverse() const { return AxisTransform(1. / m, -c / m); }

  double getScale() const { return m; }
  double getOffset() const { return c; }

private:
  double m;
  double c;
};

/// Picks a gridline spacing for values in [0, max]. Candidates are
/// 1, 0.5 and 0.2 times descending powers of ten, starting at the power
/// of ten at or above @p max. Returns the last candidate before the first
/// one that would yield more than @p desiredIntervals divisions.
GraphErrorOr<double> selectDivisionInterval(double max,
                                            unsigned desiredIntervals);

} // namespace egraph
#endif // ENERGYGRAPH_AXIS_TRANSFORM_H
