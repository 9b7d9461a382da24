/**
 * @file Report_uTest.cpp
 * @brief Unit tests for report assembly from crafted source snapshots.
 *
 * Notes:
 *  - Snapshots are built by hand; nothing here reads the kernel.
 *  - Expected tables are assembled with pad() so column widths stay readable.
 */

#include "src/report/inc/Report.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using zfree::memory::PressureStats;
using zfree::memory::SourceSnapshot;
using zfree::report::buildJsonReport;
using zfree::report::buildReport;
using zfree::report::collectReport;
using zfree::report::ColumnSelection;
using zfree::report::formatJsonQuantity;
using zfree::report::formatPressure;
using zfree::report::formatZram;
using zfree::report::parseColumns;
using zfree::report::parseColumnWidth;
using zfree::report::ReportConfig;
using zfree::report::ReportData;
using zfree::report::ReportStatus;
using zfree::report::toString;
using zfree::units::NamedRecord;
using zfree::units::Quantity;
using zfree::units::Unit;

namespace {

constexpr const char* MEMINFO = "MemTotal:        8000000 kB\n"
                                "MemFree:         1000000 kB\n"
                                "MemAvailable:    5000000 kB\n"
                                "Buffers:          200000 kB\n"
                                "Cached:          2000000 kB\n";

constexpr const char* SWAPS = "Filename  Type  Size  Used  Priority\n"
                              "/dev/sda2  partition  8388604  1024  -2\n"
                              "/dev/zram0  partition  4194300  0  100\n";

constexpr const char* TWO_DISK_SWAPS = "Filename  Type  Size  Used  Priority\n"
                                       "/dev/sda2  partition  8388604  0  -2\n"
                                       "/swapfile  file       2097148  0  -3\n";

constexpr const char* MM_STAT = "1048576 0 2097152 0 0 0 0 0 0";

constexpr const char* PRESSURE = "some avg10=1.50 avg60=0.25 avg300=0.00 total=1\n"
                                 "full avg10=0.75 avg60=0.10 avg300=0.01 total=1";

/// Right-justify to the default column width.
std::string pad(const std::string& s) {
  return std::string(s.size() < 11 ? 11 - s.size() : 0, ' ') + s;
}

SourceSnapshot fullSnapshot() {
  SourceSnapshot snap{};
  snap.meminfo = MEMINFO;
  snap.swaps = SWAPS;
  snap.zramMmStat = MM_STAT;
  snap.zramMmStatPath = "/sys/class/block/zram0/mm_stat";
  snap.pressure = PRESSURE;
  return snap;
}

const std::string MEMORY_HEADER = pad("total") + pad("used") + pad("avail") + pad("cache") +
                                  pad("free");

const std::string MEMORY_MIB = pad("7812.5MiB") + pad("2929.7MiB") + pad("4882.8MiB") +
                               pad("2148.4MiB") + pad("976.6MiB");

} // namespace

/* ----------------------------- buildReport Tests ----------------------------- */

/** @test Full report with disk swap, zram and PSI in MiB. */
TEST(ReportBuild, FullReport) {
  std::string out;
  std::string error;
  ASSERT_EQ(buildReport(fullSnapshot(), ReportConfig{}, out, error), ReportStatus::OK) << error;

  const std::string EXPECTED = "Memory/swap\n" + MEMORY_HEADER + "\n" + MEMORY_MIB + "\n" +
                               pad("8192.0MiB") + pad("1.0MiB") + pad("") + pad("") +
                               pad("8191.0MiB") + "\nzram\n" + pad("data") + pad("total") +
                               pad("ratio") + pad("comp%") + "\n" + pad("1.0MiB") +
                               pad("2.0MiB") + pad("0.50") + pad("0.03%") +
                               "\npsi some/full: 1.50, 0.25, 0.00 / 0.75, 0.10, 0.01";
  EXPECT_EQ(out, EXPECTED);
}

/** @test Memory only when the other sources are absent. */
TEST(ReportBuild, MemoryOnly) {
  SourceSnapshot snap{};
  snap.meminfo = MEMINFO;

  std::string out;
  std::string error;
  ASSERT_EQ(buildReport(snap, ReportConfig{}, out, error), ReportStatus::OK);
  EXPECT_EQ(out, "Memory\n" + MEMORY_HEADER + "\n" + MEMORY_MIB);
}

/** @test Hidden sections are left out even when present. */
TEST(ReportBuild, SectionsHidden) {
  ReportConfig cfg{};
  cfg.showDiskSwap = false;
  cfg.showZram = false;
  cfg.showPressure = false;

  std::string out;
  std::string error;
  ASSERT_EQ(buildReport(fullSnapshot(), cfg, out, error), ReportStatus::OK);
  EXPECT_EQ(out, "Memory\n" + MEMORY_HEADER + "\n" + MEMORY_MIB);
}

/** @test Suffixes can be dropped and width changed. */
TEST(ReportBuild, NoUnitNarrow) {
  SourceSnapshot snap{};
  snap.meminfo = MEMINFO;
  ReportConfig cfg{};
  cfg.unit = Unit::GIB;
  cfg.showUnit = false;
  cfg.width = 6;

  std::string out;
  std::string error;
  ASSERT_EQ(buildReport(snap, cfg, out, error), ReportStatus::OK);
  EXPECT_EQ(out, "Memory\n total  used avail cache  free\n   7.6   2.9   4.8   2.1   1.0");
}

/** @test Human mode picks a unit per value. */
TEST(ReportBuild, HumanBinary) {
  SourceSnapshot snap{};
  snap.meminfo = MEMINFO;
  snap.swaps = SWAPS;
  ReportConfig cfg{};
  cfg.unit = Unit::AUTO_BINARY;

  std::string out;
  std::string error;
  ASSERT_EQ(buildReport(snap, cfg, out, error), ReportStatus::OK);
  EXPECT_NE(out.find("7.6GiB"), std::string::npos);
  EXPECT_NE(out.find("2.1GiB"), std::string::npos);
  EXPECT_NE(out.find("1.0MiB"), std::string::npos);
}

/** @test Two disk swap devices abort with empty output. */
TEST(ReportBuild, MultipleDiskSwapFatal) {
  SourceSnapshot snap = fullSnapshot();
  snap.swaps = TWO_DISK_SWAPS;

  std::string out = "stale";
  std::string error;
  EXPECT_EQ(buildReport(snap, ReportConfig{}, out, error), ReportStatus::SOURCE_ERROR);
  EXPECT_TRUE(out.empty());
  EXPECT_NE(error.find("multiple disk swap"), std::string::npos);
}

/** @test Multiple disk swap is not checked when swap is hidden. */
TEST(ReportBuild, MultipleDiskSwapHidden) {
  SourceSnapshot snap{};
  snap.meminfo = MEMINFO;
  snap.swaps = TWO_DISK_SWAPS;
  ReportConfig cfg{};
  cfg.showDiskSwap = false;

  std::string out;
  std::string error;
  EXPECT_EQ(buildReport(snap, cfg, out, error), ReportStatus::OK);
}

/** @test Missing meminfo is fatal. */
TEST(ReportBuild, NoMeminfo) {
  std::string out;
  std::string error;
  EXPECT_EQ(buildReport(SourceSnapshot{}, ReportConfig{}, out, error), ReportStatus::NO_MEMINFO);
  EXPECT_NE(error.find("/proc/meminfo"), std::string::npos);
}

/** @test meminfo without MemAvailable is fatal with a kernel hint. */
TEST(ReportBuild, NoMemAvailable) {
  SourceSnapshot snap{};
  snap.meminfo = "MemTotal: 1 kB\nMemFree: 1 kB\nBuffers: 0 kB\nCached: 0 kB\n";

  std::string out;
  std::string error;
  EXPECT_EQ(buildReport(snap, ReportConfig{}, out, error), ReportStatus::SOURCE_ERROR);
  EXPECT_NE(error.find("3.14"), std::string::npos);
}

/** @test Malformed mm_stat names its path. */
TEST(ReportBuild, MalformedMmStat) {
  SourceSnapshot snap = fullSnapshot();
  snap.zramMmStat = "garbage";

  std::string out;
  std::string error;
  EXPECT_EQ(buildReport(snap, ReportConfig{}, out, error), ReportStatus::SOURCE_ERROR);
  EXPECT_NE(error.find("/sys/class/block/zram0/mm_stat"), std::string::npos);
}

/* ----------------------------- Column Selection Tests ----------------------------- */

/** @test Column names split into memory and zram fields, in the given order. */
TEST(ReportColumns, ParseOrderAndGroups) {
  ColumnSelection sel{};
  std::string error;
  ASSERT_TRUE(parseColumns("free,compratio,total,available,comptotal,bufcache", sel, error));
  const std::vector<std::string> MEMORY = {"free", "total", "avail", "cache"};
  const std::vector<std::string> ZRAM = {"ratio", "total"};
  EXPECT_EQ(sel.memory, MEMORY);
  EXPECT_EQ(sel.zram, ZRAM);
}

/** @test Unknown and empty names are usage errors. */
TEST(ReportColumns, UnknownName) {
  ColumnSelection sel{};
  std::string error;
  EXPECT_FALSE(parseColumns("total,swapiness", sel, error));
  EXPECT_EQ(error, "unknown column type 'swapiness'");
  EXPECT_FALSE(parseColumns("total,,used", sel, error));
  EXPECT_FALSE(parseColumns("", sel, error));
}

/** @test Selected memory columns with the swap column alongside. */
TEST(ReportColumns, MemorySubset) {
  SourceSnapshot snap = fullSnapshot();
  snap.pressure.reset();
  ReportConfig cfg{};
  cfg.columns = ColumnSelection{{"free", "total", "cache"}, {}};

  std::string out;
  std::string error;
  ASSERT_EQ(buildReport(snap, cfg, out, error), ReportStatus::OK) << error;
  EXPECT_EQ(out, "Memory/swap\n" + pad("free") + pad("total") + pad("cache") + "\n" +
                     pad("976.6MiB") + pad("7812.5MiB") + pad("2148.4MiB") + "\n" +
                     pad("8191.0MiB") + pad("8192.0MiB") + pad(""));
}

/** @test zram-only selection drops the memory table without a blank line. */
TEST(ReportColumns, ZramOnly) {
  ReportConfig cfg{};
  cfg.showPressure = false;
  cfg.columns = ColumnSelection{{}, {"ratio", "data"}};

  std::string out;
  std::string error;
  ASSERT_EQ(buildReport(fullSnapshot(), cfg, out, error), ReportStatus::OK);
  EXPECT_EQ(out, "zram\n" + pad("ratio") + pad("data") + "\n" + pad("0.50") + pad("1.0MiB"));
}

/* ----------------------------- Column Width Tests ----------------------------- */

/** @test Widths are accepted up to the table limit. */
TEST(ReportColumnWidth, Accepted) {
  std::size_t width = 0;
  ASSERT_TRUE(parseColumnWidth("0", width));
  EXPECT_EQ(width, 0U);
  ASSERT_TRUE(parseColumnWidth("1024", width));
  EXPECT_EQ(width, 1024U);
}

/** @test Oversized, negative and junk widths are rejected. */
TEST(ReportColumnWidth, Rejected) {
  std::size_t width = 11;
  EXPECT_FALSE(parseColumnWidth("1025", width));
  EXPECT_FALSE(parseColumnWidth("3000000000", width));
  EXPECT_FALSE(parseColumnWidth("99999999999999999999", width));
  EXPECT_FALSE(parseColumnWidth("-1", width));
  EXPECT_FALSE(parseColumnWidth("12x", width));
  EXPECT_FALSE(parseColumnWidth("", width));
  EXPECT_EQ(width, 11U);
}

/** @test A config width beyond the limit still renders. */
TEST(ReportColumnWidth, HugeConfigWidth) {
  SourceSnapshot snap{};
  snap.meminfo = MEMINFO;
  ReportConfig cfg{};
  cfg.width = std::numeric_limits<std::size_t>::max();

  std::string out;
  std::string error;
  EXPECT_NO_THROW({ EXPECT_EQ(buildReport(snap, cfg, out, error), ReportStatus::OK); });
  EXPECT_FALSE(out.empty());
}

/* ----------------------------- collectReport Tests ----------------------------- */

/** @test Records arrive converted to the configured unit. */
TEST(ReportCollect, Converted) {
  ReportConfig cfg{};
  cfg.unit = Unit::KIB;

  ReportData data{};
  std::string error;
  ASSERT_EQ(collectReport(fullSnapshot(), cfg, data, error), ReportStatus::OK);
  EXPECT_EQ(*data.memory.find("total")->value, 8000000.0);
  ASSERT_TRUE(data.diskSwap.has_value());
  EXPECT_EQ(data.diskSwap->find("used")->unit, Unit::KIB);
  ASSERT_TRUE(data.zram.has_value());
  EXPECT_EQ(*data.zram->find("total")->value, 2048.0);
  EXPECT_EQ(data.zram->find("ratio")->unit, Unit::NONE);
  ASSERT_TRUE(data.pressure.has_value());
  EXPECT_DOUBLE_EQ(data.pressure->some[0], 1.5);
}

/* ----------------------------- formatZram Tests ----------------------------- */

/** @test Unknown totals are rejected. */
TEST(ReportFormatZram, MissingTotal) {
  NamedRecord zram;
  zram.add("data", Quantity{1.0, Unit::B});
  zram.add("total", Quantity{});
  NamedRecord mem;
  mem.add("total", Quantity{1.0, Unit::KIB});

  std::string out;
  EXPECT_EQ(formatZram(zram, mem, ReportConfig{}, out), ReportStatus::MISSING_TOTAL);
}

/** @test Empty zram pool shows N/A ratio and 0% share. */
TEST(ReportFormatZram, EmptyPool) {
  NamedRecord zram;
  zram.add("data", Quantity{0.0, Unit::MIB});
  zram.add("total", Quantity{0.0, Unit::MIB});
  zram.add("ratio", Quantity{});
  NamedRecord mem;
  mem.add("total", Quantity{1024.0, Unit::MIB});

  std::string out;
  ASSERT_EQ(formatZram(zram, mem, ReportConfig{}, out), ReportStatus::OK);
  EXPECT_EQ(out, "zram\n" + pad("data") + pad("total") + pad("ratio") + pad("comp%") + "\n" +
                     pad("0.0MiB") + pad("0.0MiB") + pad("N/A") + pad("0.00%"));
}

/* ----------------------------- formatPressure Tests ----------------------------- */

/** @test PSI line layout. */
TEST(ReportFormatPressure, Layout) {
  PressureStats psi{};
  psi.some = {0.0, 1.0, 2.5};
  psi.full = {10.0, 0.25, 3.0};
  EXPECT_EQ(formatPressure(psi), "psi some/full: 0.00, 1.00, 2.50 / 10.00, 0.25, 3.00");
}

/* ----------------------------- buildJsonReport Tests ----------------------------- */

/** @test JSON carries values and units, with null for hidden sections. */
TEST(ReportJson, Document) {
  ReportConfig cfg{};
  cfg.showZram = false;

  std::string out;
  std::string error;
  ASSERT_EQ(buildJsonReport(fullSnapshot(), cfg, out, error), ReportStatus::OK);
  EXPECT_NE(out.find("\"unit\": \"MiB\""), std::string::npos);
  EXPECT_NE(out.find("\"total\": {\"value\": 7812.5, \"unit\": \"MiB\"}"), std::string::npos);
  EXPECT_NE(out.find("\"zram\": null"), std::string::npos);
  EXPECT_NE(out.find("\"some\": [1.50, 0.25, 0.00]"), std::string::npos);
  EXPECT_EQ(out.front(), '{');
  EXPECT_EQ(out.back(), '}');
}

/** @test Non-finite values are written as null. */
TEST(ReportJson, NonFiniteIsNull) {
  const std::string NULL_QUANTITY = "{\"value\": null, \"unit\": null}";
  EXPECT_EQ(formatJsonQuantity(Quantity{std::nan(""), Unit::NONE}), NULL_QUANTITY);
  EXPECT_EQ(formatJsonQuantity(Quantity{std::numeric_limits<double>::infinity(), Unit::MIB}),
            NULL_QUANTITY);
  EXPECT_EQ(formatJsonQuantity(Quantity{}), NULL_QUANTITY);
  EXPECT_EQ(formatJsonQuantity(Quantity{0.5, Unit::NONE}), "{\"value\": 0.5, \"unit\": \"\"}");
}

/** @test JSON fails the same way as text. */
TEST(ReportJson, FailureLeavesEmpty) {
  std::string out = "stale";
  std::string error;
  EXPECT_EQ(buildJsonReport(SourceSnapshot{}, ReportConfig{}, out, error),
            ReportStatus::NO_MEMINFO);
  EXPECT_TRUE(out.empty());
}

/** @test Status strings. */
TEST(ReportStatusStrings, ToString) {
  EXPECT_STREQ(toString(ReportStatus::OK), "OK");
  EXPECT_STREQ(toString(ReportStatus::MISSING_TOTAL), "MISSING_TOTAL");
}
