/**
 * @file Pressure.cpp
 * @brief Implementation of PSI file parsing.
 */

#include "src/memory/inc/Pressure.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <vector>

namespace zfree {

namespace memory {

using zfree::helpers::strings::parseDouble;
using zfree::helpers::strings::split;
using zfree::helpers::strings::splitLines;
using zfree::helpers::strings::splitWhitespace;

namespace {

/// Parse "<label> avg10=X avg60=Y avg300=Z ..." into three values.
bool parsePsiLine(std::string_view line, std::array<double, PSI_WINDOW_COUNT>& out) {
  const std::vector<std::string_view> TOKENS = splitWhitespace(line);
  if (TOKENS.size() < PSI_WINDOW_COUNT + 1) {
    return false;
  }

  for (std::size_t i = 0; i < PSI_WINDOW_COUNT; ++i) {
    const std::vector<std::string_view> KV = split(TOKENS[i + 1], '=');
    if (KV.size() != 2 || !parseDouble(KV[1], out[i])) {
      return false;
    }
  }
  return true;
}

} // namespace

SourceStatus parsePressure(std::string_view text, PressureStats& out) {
  const std::vector<std::string_view> LINES = splitLines(text);
  if (LINES.size() < 2) {
    return SourceStatus::MALFORMED;
  }

  PressureStats stats{};
  if (!parsePsiLine(LINES[0], stats.some) || !parsePsiLine(LINES[1], stats.full)) {
    return SourceStatus::MALFORMED;
  }

  out = stats;
  return SourceStatus::OK;
}

} // namespace memory

} // namespace zfree
