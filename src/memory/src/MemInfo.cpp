/**
 * @file MemInfo.cpp
 * @brief Implementation of /proc/meminfo field extraction.
 */

#include "src/memory/inc/MemInfo.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstdint>       // std::int64_t
#include <string>        // std::string
#include <unordered_map> // std::unordered_map
#include <utility>       // std::move
#include <vector>

namespace zfree {

namespace memory {

using zfree::helpers::strings::parseInt64;
using zfree::helpers::strings::split;
using zfree::helpers::strings::splitLines;
using zfree::helpers::strings::splitWhitespace;
using zfree::helpers::strings::trim;
using zfree::units::NamedRecord;
using zfree::units::Quantity;
using zfree::units::Unit;

namespace {

/* ----------------------------- Meminfo Parsing ----------------------------- */

/// Parse "FieldName:    12345 kB" into key and KiB value.
bool parseMemInfoLine(std::string_view line, std::string_view& key, std::int64_t& kib) {
  const std::vector<std::string_view> PARTS = split(line, ':');
  if (PARTS.size() != 2) {
    return false;
  }

  // Strip the unit
  const std::vector<std::string_view> TOKENS = splitWhitespace(PARTS[1]);
  if (TOKENS.empty()) {
    return false;
  }

  key = trim(PARTS[0]);
  return !key.empty() && parseInt64(TOKENS[0], kib);
}

/// KiB quantity from an integer count.
Quantity kib(std::int64_t value) { return Quantity{static_cast<double>(value), Unit::KIB}; }

} // namespace

/* ----------------------------- API ----------------------------- */

SourceStatus parseMemInfo(std::string_view text, NamedRecord& out) {
  std::unordered_map<std::string, std::int64_t> fields;

  for (const std::string_view LINE : splitLines(text)) {
    if (trim(LINE).empty()) {
      continue;
    }
    std::string_view key;
    std::int64_t value = 0;
    if (!parseMemInfoLine(LINE, key, value)) {
      return SourceStatus::MALFORMED;
    }
    fields[std::string(key)] = value;
  }

  const auto TOTAL = fields.find("MemTotal");
  const auto FREE = fields.find("MemFree");
  const auto BUFFERS = fields.find("Buffers");
  const auto CACHED = fields.find("Cached");
  if (TOTAL == fields.end() || FREE == fields.end() || BUFFERS == fields.end() ||
      CACHED == fields.end()) {
    return SourceStatus::MALFORMED;
  }

  const auto AVAILABLE = fields.find("MemAvailable");
  if (AVAILABLE == fields.end()) {
    return SourceStatus::NO_MEMAVAILABLE;
  }

  const std::int64_t USED = TOTAL->second - AVAILABLE->second;
  const std::int64_t BUFCACHE = BUFFERS->second + CACHED->second;

  NamedRecord record;
  record.add("total", kib(TOTAL->second));
  record.add("used", kib(USED));
  record.add("avail", kib(AVAILABLE->second));
  record.add("cache", kib(BUFCACHE));
  record.add("free", kib(FREE->second));

  out = std::move(record);
  return SourceStatus::OK;
}

} // namespace memory

} // namespace zfree
