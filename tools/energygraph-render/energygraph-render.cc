#include "energygraph/cli_args.h"
#include "energygraph/energy_graph.h"
#include "energygraph/renderer.h"
#include "energygraph/sample_reader.h"
#include "energygraph/svg_formatted_writer.h"
#include "energygraph/svg_logging_writer.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>

using namespace egraph;
namespace fs = std::filesystem;

static cl::opt<fs::path>
    Infile(cl::meta("input.csv"), cl::required(),
           cl::desc("timestamp,value samples or - for stdin"));
static cl::opt<fs::path> Outfile(cl::name("o"), cl::meta("output.svg"),
                                 cl::init("-"),
                                 cl::desc("Output file, - for stdout"));
static cl::opt<unsigned> Buckets(cl::name("buckets"), cl::meta("N"),
                                 cl::init(48),
                                 cl::desc("Number of points per curve"));
static cl::opt<unsigned> Duration(
    cl::name("duration"), cl::meta("N"), cl::init(10),
    cl::desc("Number of historical periods covered by the input"));
static cl::opt<int64_t> DivisionSeconds(
    cl::name("division-seconds"), cl::meta("S"), cl::init(0),
    cl::desc("Shade alternating periods of S seconds, 0 to disable"));
static cl::opt<double> Width(cl::name("W"), cl::meta("px"), cl::init(840),
                             cl::desc("Document width"));
static cl::opt<double> Height(cl::name("H"), cl::meta("px"), cl::init(630),
                              cl::desc("Document height"));
static cl::opt<bool> Formatted(cl::name("formatted"), cl::init(false),
                               cl::desc("Indent the markup"));
static cl::opt<bool> HoverCss(
    cl::name("hover-css"), cl::init(false),
    cl::desc("Embed css that shows overlays only on hover"));
static cl::opt<bool> Strict(cl::name("strict"), cl::init(false),
                            cl::desc("Fail on undefined curve tangents"));
static cl::opt<bool> Verbose(cl::name("v"), cl::init(false),
                             cl::desc("Trace graph building and writer calls"));

static const char *TOOLNAME = "energygraph-render";
static const char *TOOLDESC = "Render power samples as an svg energy graph";

/// Labels for the common period lengths, strftime format otherwise.
static const char *divisionLabelFormat(int64_t seconds) {
  if (seconds % 86400 == 0)
    return "%a %d %b";
  if (seconds % 3600 == 0)
    return "%H:%M";
  return "%H:%M:%S";
}

template <typename WriterTy>
static int writeTraced(const Document &doc, std::ostream &out) {
  svg::WriterModel<svg::SVGLoggingWriter<WriterTy>> writer(std::cerr, out);
  if (auto err = writeNode(Node(doc), writer)) {
    std::cerr << "An error occurred:\n" << err.to_error() << std::endl;
    return 1;
  }
  out << std::endl;
  return 0;
}

int main(int argc, const char **argv) {
  cl::ParseArgs(TOOLNAME, TOOLDESC, argc, argv);

  std::vector<Sample> samples;
  SampleReader reader;
  SampleReader::MaybeError readErr;
  if (*Infile == "-") {
    readErr = reader.read(std::cin, samples);
  } else {
    if (!fs::exists(Infile)) {
      std::cerr << "Input file does not exist" << std::endl;
      return 1;
    }
    std::ifstream in(Infile->c_str());
    readErr = reader.read(in, samples);
  }
  if (readErr) {
    std::cerr << "Could not read samples:\n" << *readErr << std::endl;
    return 1;
  }

  GraphOptions options;
  options.width = Width;
  options.height = Height;
  options.bucketCount = Buckets;
  options.statsDuration = Duration;
  options.embedHoverStyles = HoverCss;
  options.strictTangents = Strict;
  options.formatted = Formatted;
  if (Verbose)
    options.log = &std::cerr;

  std::unique_ptr<DivisionSource> divisions;
  if (*DivisionSeconds < 0) {
    std::cerr << "Division period must not be negative" << std::endl;
    return 1;
  }
  if (*DivisionSeconds > 0)
    divisions = std::make_unique<FixedIntervalDivisionSource>(
        DivisionSeconds, divisionLabelFormat(DivisionSeconds));

  std::optional<std::ofstream> out_storage;
  std::ostream *out = nullptr;
  if (*Outfile == "-")
    out = &std::cout;
  else {
    out_storage.emplace(Outfile->c_str());
    out = &*out_storage;
  }

  if (Verbose) {
    auto doc = buildEnergyGraph(samples, divisions.get(), options);
    if (doc) {
      std::cerr << "An error occurred:\n" << doc.to_error() << std::endl;
      return 1;
    }
    if (Formatted)
      return writeTraced<svg::SVGFormattedWriter>(*doc, *out);
    return writeTraced<svg::SVGWriter>(*doc, *out);
  }

  auto markup = renderEnergyGraph(samples, divisions.get(), options);
  if (markup) {
    std::cerr << "An error occurred:\n" << markup.to_error() << std::endl;
    return 1;
  }
  *out << *markup << std::endl;
  return 0;
}
