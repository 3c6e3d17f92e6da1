#include "energygraph/sample_reader.h"
#include "energygraph/utils.h"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <system_error>
#include <sstream>

using namespace egraph;
using MaybeError = SampleReader::MaybeError;

MaybeError SampleReader::parseLine(std::string_view line, Sample &sample) {
  size_t comma = line.find(',');
  if (comma == std::string_view::npos)
    return ParseError("Expected \"timestamp,value\"");
  std::string_view timeStr = strview_trim(line.substr(0, comma));
  std::string_view valueStr = strview_trim(line.substr(comma + 1));
  int64_t time;
  auto result =
      std::from_chars(timeStr.data(), timeStr.data() + timeStr.size(), time);
  if (result.ec == std::errc::result_out_of_range)
    return ParseError("Timestamp is out of range: " + std::string(timeStr));
  if (result.ec != std::errc() || result.ptr != timeStr.data() + timeStr.size())
    return ParseError("Timestamp is not an integer: " + std::string(timeStr));
  auto value = strview_to_double(valueStr);
  if (!value)
    return ParseError("Value is not a number: " + std::string(valueStr));
  if (!std::isfinite(*value))
    return ParseError("Value is not finite: " + std::string(valueStr));
  sample.timestamp = time;
  sample.value = *value;
  return ParseSuccess;
}

MaybeError SampleReader::read(instream_t &is, std::vector<Sample> &out) {
  bool first = true;
  std::string line;
  while (std::getline(is, line)) {
    ++lineNum;
    std::string_view trimmed = strview_trim(line);
    if (trimmed.empty() || trimmed.front() == '#')
      continue;
    Sample sample;
    auto err = parseLine(trimmed, sample);
    bool wasFirst = first;
    first = false;
    if (err) {
      // Allow a header row like "interval_start,consumption".
      std::string_view head = trimmed.substr(0, trimmed.find(','));
      if (wasFirst && !strview_to_double(strview_trim(head)))
        continue;
      std::stringstream ss;
      ss << "line " << lineNum << ": " << err->what;
      return ParseError(ss.str());
    }
    if (!out.empty() && sample.timestamp < out.back().timestamp) {
      std::stringstream ss;
      ss << "line " << lineNum << ": timestamp " << sample.timestamp
         << " is older than its predecessor";
      return ParseError(ss.str());
    }
    out.push_back(sample);
  }
  return ParseSuccess;
}
