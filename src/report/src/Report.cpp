/**
 * @file Report.cpp
 * @brief Implementation of report assembly and rendering.
 */

#include "src/report/inc/Report.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/memory/inc/MemInfo.hpp"
#include "src/memory/inc/SwapInfo.hpp"
#include "src/report/inc/Table.hpp"

#include <algorithm>   // std::find_if
#include <array>       // std::array
#include <cmath>       // std::isfinite
#include <cstdint>     // std::int64_t
#include <string_view> // std::string_view
#include <utility>     // std::move
#include <vector>

#include <fmt/core.h>

namespace zfree {

namespace report {

using zfree::memory::SourceStatus;
using zfree::units::NamedRecord;
using zfree::units::Quantity;
using zfree::units::Unit;
using zfree::units::UnitStatus;

namespace {

/* ----------------------------- Column Names ----------------------------- */

/// User-facing column name and the record field it selects.
struct ColumnName {
  std::string_view name;
  bool zram;
  std::string_view field;
};

constexpr std::array<ColumnName, 11> COLUMN_NAMES = {{
    {"total", false, "total"},
    {"used", false, "used"},
    {"available", false, "avail"},
    {"avail", false, "avail"},
    {"bufcache", false, "cache"},
    {"cache", false, "cache"},
    {"free", false, "free"},
    {"compdata", true, "data"},
    {"comptotal", true, "total"},
    {"compratio", true, "ratio"},
    {"comp%", true, "comp%"},
}};

/* ----------------------------- Helpers ----------------------------- */

/// Value of a field in bytes; absent if the field is missing or undetermined.
Quantity fieldBytes(const NamedRecord& record, std::string_view name) {
  const Quantity* q = record.find(name);
  if (q == nullptr) {
    return Quantity{};
  }
  Quantity bytes{};
  if (units::convert(*q, Unit::B, bytes) != UnitStatus::OK) {
    return Quantity{};
  }
  return bytes;
}

/// Convert a parsed record into the report unit.
ReportStatus convertSection(const NamedRecord& in, Unit unit, const char* section,
                            NamedRecord& out, std::string& error) {
  const UnitStatus STATUS = units::convertAll(in, unit, out);
  if (STATUS != UnitStatus::OK) {
    error = fmt::format("internal error: cannot convert {} to {} ({})", section,
                        units::toString(unit), units::toString(STATUS));
    return ReportStatus::CONVERSION_ERROR;
  }
  return ReportStatus::OK;
}

/// "a, b, c" with two decimal places.
std::string joinPercentages(const std::array<double, memory::PSI_WINDOW_COUNT>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += fmt::format("{:.2f}", values[i]);
  }
  return out;
}

/* ----------------------------- JSON Helpers ----------------------------- */

std::string jsonRecord(const std::optional<NamedRecord>& record) {
  if (!record) {
    return "null";
  }
  std::string out = "{";
  for (std::size_t i = 0; i < record->fields.size(); ++i) {
    const units::Field& F = record->fields[i];
    out += fmt::format("{}\"{}\": {}", i > 0 ? ", " : "", F.name,
                       formatJsonQuantity(F.quantity));
  }
  out += "}";
  return out;
}

std::string jsonPressure(const std::optional<memory::PressureStats>& psi) {
  if (!psi) {
    return "null";
  }
  return fmt::format("{{\"some\": [{}], \"full\": [{}]}}", joinPercentages(psi->some),
                     joinPercentages(psi->full));
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ReportStatus status) noexcept {
  switch (status) {
  case ReportStatus::OK:
    return "OK";
  case ReportStatus::NO_MEMINFO:
    return "NO_MEMINFO";
  case ReportStatus::SOURCE_ERROR:
    return "SOURCE_ERROR";
  case ReportStatus::CONVERSION_ERROR:
    return "CONVERSION_ERROR";
  case ReportStatus::MISSING_TOTAL:
    return "MISSING_TOTAL";
  }
  return "UNKNOWN";
}

/* ----------------------------- Options ----------------------------- */

bool parseColumns(std::string_view list, ColumnSelection& out, std::string& error) {
  ColumnSelection selection{};
  for (const std::string_view ENTRY : helpers::strings::split(list, ',')) {
    const std::string_view NAME = helpers::strings::trim(ENTRY);
    const auto IT = std::find_if(COLUMN_NAMES.begin(), COLUMN_NAMES.end(),
                                 [NAME](const ColumnName& c) { return c.name == NAME; });
    if (IT == COLUMN_NAMES.end()) {
      error = fmt::format("unknown column type '{}'", NAME);
      return false;
    }
    (IT->zram ? selection.zram : selection.memory).emplace_back(IT->field);
  }

  out = std::move(selection);
  return true;
}

bool parseColumnWidth(std::string_view text, std::size_t& out) {
  std::int64_t value = 0;
  if (!helpers::strings::parseInt64(text, value) || value < 0 ||
      static_cast<std::uint64_t>(value) > MAX_COLUMN_WIDTH) {
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

/* ----------------------------- Collection ----------------------------- */

ReportStatus collectReport(const memory::SourceSnapshot& snap, const ReportConfig& cfg,
                           ReportData& out, std::string& error) {
  ReportData data{};

  if (!snap.meminfo) {
    error = fmt::format("internal error: {} could not be read", memory::PROC_MEMINFO);
    return ReportStatus::NO_MEMINFO;
  }

  NamedRecord parsed;
  SourceStatus status = memory::parseMemInfo(*snap.meminfo, parsed);
  if (status != SourceStatus::OK) {
    error = memory::describe(status, memory::PROC_MEMINFO);
    return ReportStatus::SOURCE_ERROR;
  }
  ReportStatus rs = convertSection(parsed, cfg.unit, "memory", data.memory, error);
  if (rs != ReportStatus::OK) {
    return rs;
  }

  if (cfg.showDiskSwap && snap.swaps) {
    status = memory::parseDiskSwap(*snap.swaps, parsed);
    if (memory::isFatal(status)) {
      error = memory::describe(status, memory::PROC_SWAPS);
      return ReportStatus::SOURCE_ERROR;
    }
    if (status == SourceStatus::OK) {
      NamedRecord converted;
      rs = convertSection(parsed, cfg.unit, "disk swap", converted, error);
      if (rs != ReportStatus::OK) {
        return rs;
      }
      data.diskSwap = std::move(converted);
    }
  }

  if (cfg.showZram && snap.zramMmStat) {
    status = memory::parseZramSwap(*snap.zramMmStat, parsed);
    if (status != SourceStatus::OK) {
      error = memory::describe(status, snap.zramMmStatPath);
      return ReportStatus::SOURCE_ERROR;
    }
    NamedRecord converted;
    rs = convertSection(parsed, cfg.unit, "zram swap", converted, error);
    if (rs != ReportStatus::OK) {
      return rs;
    }
    data.zram = std::move(converted);
  }

  if (cfg.showPressure && snap.pressure) {
    memory::PressureStats psi{};
    status = memory::parsePressure(*snap.pressure, psi);
    if (status != SourceStatus::OK) {
      error = memory::describe(status, memory::PROC_PRESSURE_MEMORY);
      return ReportStatus::SOURCE_ERROR;
    }
    data.pressure = psi;
  }

  out = std::move(data);
  return ReportStatus::OK;
}

/* ----------------------------- Rendering ----------------------------- */

std::string formatMemorySwap(const NamedRecord& mem, const NamedRecord* swap,
                             const ReportConfig& cfg) {
  const FormattedRecord MEM = formatValueUnitAll(mem, cfg.showUnit);
  const FormattedRecord SWAP = (swap != nullptr) ? formatValueUnitAll(*swap, cfg.showUnit)
                                                 : FormattedRecord{};

  const std::vector<std::string> NAMES = cfg.columns ? cfg.columns->memory : mem.names();
  if (NAMES.empty()) {
    return {};
  }

  const auto lookup = [](const FormattedRecord& rec, const std::string& name) {
    for (const auto& [field, text] : rec) {
      if (field == name) {
        return text;
      }
    }
    return std::string{};
  };

  Table table;
  table.reserve(NAMES.size());
  for (const std::string& NAME : NAMES) {
    if (swap == nullptr) {
      table.push_back({NAME, lookup(MEM, NAME)});
    } else {
      table.push_back({NAME, lookup(MEM, NAME), lookup(SWAP, NAME)});
    }
  }

  std::string out = (swap != nullptr) ? "Memory/swap\n" : "Memory\n";
  out += formatTable(table, cfg.width);
  return out;
}

ReportStatus formatZram(const NamedRecord& zram, const NamedRecord& mem, const ReportConfig& cfg,
                        std::string& out) {
  const Quantity MEM_TOTAL = fieldBytes(mem, "total");
  const Quantity ZRAM_TOTAL = fieldBytes(zram, "total");
  if (MEM_TOTAL.absent() || ZRAM_TOTAL.absent()) {
    return ReportStatus::MISSING_TOTAL;
  }

  Quantity percent{std::nullopt, Unit::PERCENT};
  if (*MEM_TOTAL.value != 0.0) {
    percent.value = *ZRAM_TOTAL.value / *MEM_TOTAL.value * 100.0;
  }

  const auto render = [&zram, &cfg](std::string_view name, int decimalPlaces) {
    const Quantity* q = zram.find(name);
    return (q != nullptr) ? formatValueUnit(*q, decimalPlaces, cfg.showUnit) : std::string{};
  };

  const Table ROWS = {
      {"data", render("data", 1)},
      {"total", render("total", 1)},
      {"ratio", render("ratio", 2)},
      {"comp%", formatValueUnit(percent, 2, cfg.showUnit)},
  };

  Table table;
  if (cfg.columns) {
    for (const std::string& NAME : cfg.columns->zram) {
      for (const auto& ROW : ROWS) {
        if (ROW.front() == NAME) {
          table.push_back(ROW);
        }
      }
    }
  } else {
    table = ROWS;
  }

  out.clear();
  if (table.empty()) {
    return ReportStatus::OK;
  }
  out = "zram\n";
  out += formatTable(table, cfg.width);
  return ReportStatus::OK;
}

std::string formatPressure(const memory::PressureStats& psi) {
  return fmt::format("psi some/full: {} / {}", joinPercentages(psi.some),
                     joinPercentages(psi.full));
}

std::string formatJsonQuantity(const Quantity& q) {
  if (q.absent() || !std::isfinite(*q.value)) {
    return "{\"value\": null, \"unit\": null}";
  }
  return fmt::format("{{\"value\": {}, \"unit\": \"{}\"}}", *q.value, units::toString(q.unit));
}

/* ----------------------------- API ----------------------------- */

ReportStatus buildReport(const memory::SourceSnapshot& snap, const ReportConfig& cfg,
                         std::string& out, std::string& error) {
  out.clear();

  ReportData data{};
  ReportStatus status = collectReport(snap, cfg, data, error);
  if (status != ReportStatus::OK) {
    return status;
  }

  std::vector<std::string> blocks;
  blocks.push_back(
      formatMemorySwap(data.memory, data.diskSwap ? &*data.diskSwap : nullptr, cfg));

  if (data.zram) {
    std::string zramBlock;
    status = formatZram(*data.zram, data.memory, cfg, zramBlock);
    if (status != ReportStatus::OK) {
      error = "internal error: total RAM or zram could not be determined";
      return status;
    }
    blocks.push_back(std::move(zramBlock));
  }

  if (data.pressure) {
    blocks.push_back(formatPressure(*data.pressure));
  }

  // Blocks emptied by the column selection leave no blank line.
  std::string text;
  for (const std::string& BLOCK : blocks) {
    if (BLOCK.empty()) {
      continue;
    }
    if (!text.empty()) {
      text += '\n';
    }
    text += BLOCK;
  }

  out = std::move(text);
  return ReportStatus::OK;
}

ReportStatus buildJsonReport(const memory::SourceSnapshot& snap, const ReportConfig& cfg,
                             std::string& out, std::string& error) {
  out.clear();

  ReportData data{};
  const ReportStatus STATUS = collectReport(snap, cfg, data, error);
  if (STATUS != ReportStatus::OK) {
    return STATUS;
  }

  out = "{\n";
  out += fmt::format("  \"unit\": \"{}\",\n", units::toString(cfg.unit));
  out += fmt::format("  \"memory\": {},\n", jsonRecord(data.memory));
  out += fmt::format("  \"swap\": {},\n", jsonRecord(data.diskSwap));
  out += fmt::format("  \"zram\": {},\n", jsonRecord(data.zram));
  out += fmt::format("  \"pressure\": {}\n", jsonPressure(data.pressure));
  out += "}";
  return ReportStatus::OK;
}

} // namespace report

} // namespace zfree
