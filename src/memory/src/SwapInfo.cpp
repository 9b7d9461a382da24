/**
 * @file SwapInfo.cpp
 * @brief Implementation of swap table and zram mm_stat extraction.
 */

#include "src/memory/inc/SwapInfo.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cstddef> // std::size_t
#include <cstdint> // std::int64_t
#include <optional>
#include <utility> // std::move
#include <vector>

namespace zfree {

namespace memory {

using zfree::helpers::strings::contains;
using zfree::helpers::strings::parseInt64;
using zfree::helpers::strings::split;
using zfree::helpers::strings::splitLines;
using zfree::helpers::strings::splitWhitespace;
using zfree::helpers::strings::trim;
using zfree::units::NamedRecord;
using zfree::units::Quantity;
using zfree::units::Unit;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::size_t SWAPS_SIZE_COLUMN = 2;
constexpr std::size_t SWAPS_USED_COLUMN = 3;

constexpr std::size_t MMSTAT_DATA_FIELD = 0;
constexpr std::size_t MMSTAT_TOTAL_FIELD = 2;

/// Device rows of /proc/swaps (header and blank lines dropped).
std::vector<std::string_view> swapRows(std::string_view text) {
  std::vector<std::string_view> rows = splitLines(text);
  if (!rows.empty()) {
    rows.erase(rows.begin());
  }
  std::vector<std::string_view> out;
  out.reserve(rows.size());
  for (const std::string_view ROW : rows) {
    if (!trim(ROW).empty()) {
      out.push_back(ROW);
    }
  }
  return out;
}

} // namespace

/* ----------------------------- API ----------------------------- */

SourceStatus parseDiskSwap(std::string_view text, NamedRecord& out) {
  std::optional<std::string_view> diskRow;
  for (const std::string_view ROW : swapRows(text)) {
    if (contains(ROW, ZRAM_MARKER)) {
      continue;
    }
    if (diskRow) {
      return SourceStatus::MULTIPLE_DISK_SWAP;
    }
    diskRow = ROW;
  }

  if (!diskRow) {
    return SourceStatus::NOT_PRESENT;
  }

  const std::vector<std::string_view> COLS = splitWhitespace(*diskRow);
  if (COLS.size() <= SWAPS_USED_COLUMN) {
    return SourceStatus::MALFORMED;
  }

  std::int64_t total = 0;
  std::int64_t used = 0;
  if (!parseInt64(COLS[SWAPS_SIZE_COLUMN], total) || !parseInt64(COLS[SWAPS_USED_COLUMN], used)) {
    return SourceStatus::MALFORMED;
  }

  NamedRecord record;
  record.add("total", Quantity{static_cast<double>(total), Unit::KIB});
  record.add("used", Quantity{static_cast<double>(used), Unit::KIB});
  record.add("free", Quantity{static_cast<double>(total - used), Unit::KIB});

  out = std::move(record);
  return SourceStatus::OK;
}

SourceStatus findZramDevice(std::string_view text, std::string& deviceName) {
  for (const std::string_view ROW : swapRows(text)) {
    if (!contains(ROW, ZRAM_MARKER)) {
      continue;
    }

    // "/dev/zram0" -> {"", "dev", "zram0"}
    const std::vector<std::string_view> COLS = splitWhitespace(ROW);
    const std::vector<std::string_view> PATH = split(COLS.front(), '/');
    if (PATH.size() < 3 || PATH[2].empty()) {
      return SourceStatus::MALFORMED;
    }

    deviceName.assign(PATH[2]);
    return SourceStatus::OK;
  }
  return SourceStatus::NOT_PRESENT;
}

SourceStatus parseZramSwap(std::string_view mmStat, NamedRecord& out) {
  const std::vector<std::string_view> FIELDS = splitWhitespace(mmStat);
  if (FIELDS.size() <= MMSTAT_TOTAL_FIELD) {
    return SourceStatus::MALFORMED;
  }

  std::int64_t data = 0;
  std::int64_t total = 0;
  if (!parseInt64(FIELDS[MMSTAT_DATA_FIELD], data) ||
      !parseInt64(FIELDS[MMSTAT_TOTAL_FIELD], total)) {
    return SourceStatus::MALFORMED;
  }

  Quantity ratio{};
  if (total != 0) {
    ratio.value = static_cast<double>(data) / static_cast<double>(total);
  }

  NamedRecord record;
  record.add("data", Quantity{static_cast<double>(data), Unit::B});
  record.add("total", Quantity{static_cast<double>(total), Unit::B});
  record.add("ratio", ratio);

  out = std::move(record);
  return SourceStatus::OK;
}

} // namespace memory

} // namespace zfree
