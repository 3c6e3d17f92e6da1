#include "energygraph/energy_graph.h"

#include <algorithm>
#include <cmath>
#include <string>

using namespace egraph;

static constexpr double pi = 3.14159265358979323846;

/// Ten days of 30 minute readings following a daily load curve with a
/// little deterministic jitter so the quartiles spread out.
static std::vector<Sample> makeSamples(int64_t now) {
  constexpr int64_t step = 1800;
  constexpr size_t perDay = 48;
  constexpr size_t days = 10;
  std::vector<Sample> samples;
  for (size_t i = 0; i < perDay * days; ++i) {
    int64_t ts = now - static_cast<int64_t>(perDay * days - 1 - i) * step;
    double phase = 2 * pi * static_cast<double>(i % perDay) / perDay;
    double base = 1.2 + std::sin(phase - pi / 2) + 0.1 * (i / perDay);
    double jitter = 0.3 * std::sin(static_cast<double>(i) * 7.3);
    samples.push_back({ts, std::max(0.05, base + jitter)});
  }
  return samples;
}

int main(int argc, const char **argv) {
  if (argc != 2) {
    std::cerr << "USAGE: energygraph-example [raw|formatted]" << std::endl;
    return 1;
  }
  std::string command = argv[1];
  GraphOptions options;
  if (command == "formatted")
    options.formatted = true;
  else if (command != "raw") {
    std::cerr << "Unknown format specified: " << command << std::endl;
    return 1;
  }
  // Show the overlays only while the pointer is over them. Without the
  // embedded css the host page is expected to style .energy-graph-overlay.
  options.embedHoverStyles = true;
  options.log = &std::cerr;

  // Shade every four hours. Any DivisionSource works here, e.g. a
  // ListDivisionSource filled with local calendar days.
  FixedIntervalDivisionSource divisions(4 * 3600, "%H:%M");

  auto markup =
      renderEnergyGraph(makeSamples(1700000000), &divisions, options);
  if (markup) {
    std::cerr << markup.to_error() << std::endl;
    return 1;
  }
  std::cout << *markup << std::endl;
  return 0;
}
