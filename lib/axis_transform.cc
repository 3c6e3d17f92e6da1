#include "energygraph/axis_transform.h"

#include <cmath>
#include <sstream>

using namespace egraph;

GraphErrorOr<AxisTransform> AxisTransform::fromRange(double min, double max) {
  if (min == max) {
    std::stringstream ss;
    ss << "Cannot build an axis over the empty range [" << min << ", " << max
       << "]";
    return GraphError(GraphError::DEGENERATE_RANGE, ss.str());
  }
  double range = max - min;
  return AxisTransform(1. / range, -min / range);
}

GraphErrorOr<double> egraph::selectDivisionInterval(double max,
                                                    unsigned desiredIntervals) {
  if (!(max > 0) || !std::isfinite(max) || desiredIntervals == 0) {
    std::stringstream ss;
    ss << "Cannot divide [0, " << max << "] into " << desiredIntervals
       << " intervals";
    return GraphError(GraphError::DEGENERATE_RANGE, ss.str());
  }
  constexpr double factors[] = {1., 0.5, 0.2};
  int exponent = static_cast<int>(std::ceil(std::log10(max)));
  double previous = std::pow(10., exponent);
  // max / 10^exponent <= 1, so the loop ends once the candidates shrink
  // below max / desiredIntervals.
  for (;; --exponent) {
    double scale = std::pow(10., exponent);
    for (double factor : factors) {
      double candidate = factor * scale;
      if (max / candidate > desiredIntervals)
        return previous;
      previous = candidate;
    }
  }
}
