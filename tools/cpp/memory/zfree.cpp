/**
 * @file zfree.cpp
 * @brief zram-aware free(1): one-shot memory, swap, zram and PSI report.
 *
 * Shows RAM usage next to disk swap, the compression statistics of a zram
 * swap device, and memory pressure stall averages, in a chosen unit or
 * autoranged.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/memory/inc/SourceStatus.hpp"
#include "src/memory/inc/Sources.hpp"
#include "src/report/inc/Report.hpp"
#include "src/report/inc/Table.hpp"
#include "src/units/inc/Units.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace mem = zfree::memory;
namespace report = zfree::report;
namespace units = zfree::units;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_KIBI = 0,
  ARG_KILO = 1,
  ARG_MEBI = 2,
  ARG_MEGA = 3,
  ARG_GIBI = 4,
  ARG_GIGA = 5,
  ARG_TEBI = 6,
  ARG_TERA = 7,
  ARG_HUMAN = 8,
  ARG_SI = 9,
  ARG_NO_DISK_SWAP = 10,
  ARG_NO_ZRAM = 11,
  ARG_NO_PSI = 12,
  ARG_NO_UNIT = 13,
  ARG_OUTPUT = 14,
  ARG_WIDTH = 15,
  ARG_JSON = 16,
  ARG_VERSION = 17,
  ARG_HELP = 18,
};

constexpr std::string_view DESCRIPTION = "A zram-aware free: memory, swap, zram and PSI usage.";

constexpr std::string_view VERSION = "1.0.0";

/// Explicit unit flags and the unit each selects.
constexpr std::array<std::pair<ArgKey, units::Unit>, 8> UNIT_FLAGS = {{
    {ARG_KIBI, units::Unit::KIB},
    {ARG_KILO, units::Unit::KB},
    {ARG_MEBI, units::Unit::MIB},
    {ARG_MEGA, units::Unit::MB},
    {ARG_GIBI, units::Unit::GIB},
    {ARG_GIGA, units::Unit::GB},
    {ARG_TEBI, units::Unit::TIB},
    {ARG_TERA, units::Unit::TB},
}};

zfree::helpers::args::ArgMap buildArgMap() {
  zfree::helpers::args::ArgMap map;
  map[ARG_KIBI] = {"-k", 0, "Show output in kibibytes", "--kibi"};
  map[ARG_KILO] = {"-K", 0, "Show output in kilobytes", "--kilo"};
  map[ARG_MEBI] = {"-m", 0, "Show output in mebibytes (default)", "--mebi"};
  map[ARG_MEGA] = {"-M", 0, "Show output in megabytes", "--mega"};
  map[ARG_GIBI] = {"-g", 0, "Show output in gibibytes", "--gibi"};
  map[ARG_GIGA] = {"-G", 0, "Show output in gigabytes", "--giga"};
  map[ARG_TEBI] = {"--tebi", 0, "Show output in tebibytes"};
  map[ARG_TERA] = {"--tera", 0, "Show output in terabytes"};
  map[ARG_HUMAN] = {"-h", 0, "Autorange units (\"human-readable\")"};
  map[ARG_SI] = {"--si", 0, "(-h only) use powers of 1000 not 1024", "--decimal"};
  map[ARG_NO_DISK_SWAP] = {"-S", 0, "Do not display disk swap stats"};
  map[ARG_NO_ZRAM] = {"-Z", 0, "Do not display zram swap stats"};
  map[ARG_NO_PSI] = {"-P", 0, "Do not display PSI"};
  map[ARG_NO_UNIT] = {"-n", 0, "Do not show units after values", "--no-unit"};
  map[ARG_OUTPUT] = {"-o", 1, "Comma-separated columns to show (e.g. total,used,compratio)",
                     "--output"};
  map[ARG_WIDTH] = {"-w", 1, "Output width of each column (default: 11)", "--width"};
  map[ARG_JSON] = {"--json", 0, "Output in JSON format"};
  map[ARG_VERSION] = {"--version", 0, "Show version"};
  map[ARG_HELP] = {"--help", 0, "Show this help message"};
  return map;
}

/// Build the report config from parsed flags. Returns false on a usage error.
bool buildConfig(const zfree::helpers::args::ParsedArgs& pargs, report::ReportConfig& cfg,
                 std::string& error) {
  std::size_t unitsSelected = 0;
  for (const auto& [key, unit] : UNIT_FLAGS) {
    if (pargs.count(key) != 0) {
      cfg.unit = unit;
      ++unitsSelected;
    }
  }
  const bool HUMAN = pargs.count(ARG_HUMAN) != 0;
  if (HUMAN) {
    ++unitsSelected;
  }

  if (unitsSelected > 1) {
    error = "cannot specify more than 1 unit";
    return false;
  }

  const bool DECIMAL = pargs.count(ARG_SI) != 0;
  if (DECIMAL && !HUMAN) {
    error = "--si/--decimal only has effect in combination with -h";
    return false;
  }
  if (HUMAN) {
    cfg.unit = DECIMAL ? units::Unit::AUTO_DECIMAL : units::Unit::AUTO_BINARY;
  }

  cfg.showDiskSwap = pargs.count(ARG_NO_DISK_SWAP) == 0;
  cfg.showZram = pargs.count(ARG_NO_ZRAM) == 0;
  cfg.showPressure = pargs.count(ARG_NO_PSI) == 0;
  cfg.showUnit = pargs.count(ARG_NO_UNIT) == 0;

  const auto WIDTH = pargs.find(ARG_WIDTH);
  if (WIDTH != pargs.end() && !report::parseColumnWidth(WIDTH->second.front(), cfg.width)) {
    error = fmt::format("invalid column width '{}' (0 to {})", WIDTH->second.front(),
                        report::MAX_COLUMN_WIDTH);
    return false;
  }

  const auto OUTPUT = pargs.find(ARG_OUTPUT);
  if (OUTPUT != pargs.end()) {
    report::ColumnSelection columns{};
    if (!report::parseColumns(OUTPUT->second.front(), columns, error)) {
      return false;
    }
    cfg.columns = std::move(columns);
  }

  return true;
}

/* ----------------------------- Gathering ----------------------------- */

/// Capture every source the config asks for. Returns false on a fatal error.
bool gather(const report::ReportConfig& cfg, mem::SourceSnapshot& snap, std::string& error) {
  snap = mem::gatherSources();

  if (!cfg.showZram || !snap.swaps) {
    return true;
  }

  std::string mmStat;
  std::string path;
  const mem::SourceStatus STATUS = mem::readZramMmStat(*snap.swaps, mmStat, path);
  if (STATUS == mem::SourceStatus::OK) {
    snap.zramMmStat = std::move(mmStat);
    snap.zramMmStatPath = std::move(path);
  } else if (mem::isFatal(STATUS)) {
    error = mem::describe(STATUS, STATUS == mem::SourceStatus::UNREADABLE ? std::string_view(path)
                                                                           : mem::PROC_SWAPS);
    return false;
  }
  return true;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const zfree::helpers::args::ArgMap ARG_MAP = buildArgMap();
  zfree::helpers::args::ParsedArgs pargs;
  report::ReportConfig cfg{};
  bool jsonOutput = false;

  if (argc > 1) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }

    std::string error;
    if (!zfree::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\nUse --help for help\n", error);
      return 1;
    }

    if (pargs.count(ARG_HELP) != 0) {
      zfree::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return 0;
    }

    if (pargs.count(ARG_VERSION) != 0) {
      fmt::print("zfree {}\n", VERSION);
      return 0;
    }

    if (!buildConfig(pargs, cfg, error)) {
      fmt::print(stderr, "Error: {}\n", error);
      return 1;
    }

    jsonOutput = (pargs.count(ARG_JSON) != 0);
  }

#ifndef __linux__
  fmt::print(stderr, "Error: zfree can only run on Linux.\n");
  return 1;
#else
  const report::ReportConfig CFG = cfg;

  mem::SourceSnapshot snap{};
  std::string error;
  if (!gather(CFG, snap, error)) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  std::string output;
  const report::ReportStatus STATUS = jsonOutput
                                          ? report::buildJsonReport(snap, CFG, output, error)
                                          : report::buildReport(snap, CFG, output, error);
  if (STATUS != report::ReportStatus::OK) {
    fmt::print(stderr, "Error: {}\n", error);
    return 1;
  }

  fmt::print("{}\n", output);
  return 0;
#endif
}
