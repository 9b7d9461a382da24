/**
 * @file SwapInfo_uTest.cpp
 * @brief Unit tests for /proc/swaps and zram mm_stat extraction.
 */

#include "src/memory/inc/SwapInfo.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using zfree::memory::findZramDevice;
using zfree::memory::parseDiskSwap;
using zfree::memory::parseZramSwap;
using zfree::memory::SourceStatus;
using zfree::units::NamedRecord;
using zfree::units::Unit;

namespace {

constexpr const char* SWAPS_HEADER = "Filename\t\t\t\tType\t\tSize\t\tUsed\t\tPriority\n";

std::string swaps(const std::string& rows) { return std::string(SWAPS_HEADER) + rows; }

double valueOf(const NamedRecord& rec, const char* name) {
  const auto* q = rec.find(name);
  return (q != nullptr && q->value) ? *q->value : -1.0;
}

} // namespace

/* ----------------------------- parseDiskSwap Tests ----------------------------- */

/** @test Single disk swap row yields total/used/free in KiB. */
TEST(SwapInfoDisk, SingleDevice) {
  NamedRecord rec;
  ASSERT_EQ(parseDiskSwap(swaps("/dev/nvme0n1p3  partition  8388604  1024  -2\n"), rec),
            SourceStatus::OK);

  const std::vector<std::string> EXPECTED = {"total", "used", "free"};
  EXPECT_EQ(rec.names(), EXPECTED);
  EXPECT_EQ(valueOf(rec, "total"), 8388604.0);
  EXPECT_EQ(valueOf(rec, "used"), 1024.0);
  EXPECT_EQ(valueOf(rec, "free"), 8387580.0);
  EXPECT_EQ(rec.find("total")->unit, Unit::KIB);
}

/** @test zram rows are not disk swap. */
TEST(SwapInfoDisk, ZramRowIgnored) {
  NamedRecord rec;
  EXPECT_EQ(parseDiskSwap(swaps("/dev/zram0  partition  4194300  0  100\n"), rec),
            SourceStatus::NOT_PRESENT);
}

/** @test A zram-only table has no disk swap but does name a zram device. */
TEST(SwapInfoDisk, ZramOnlyTable) {
  const std::string TABLE = swaps("/dev/zram0  partition  4194300  0  100\n");
  NamedRecord rec;
  EXPECT_EQ(parseDiskSwap(TABLE, rec), SourceStatus::NOT_PRESENT);
  std::string name;
  ASSERT_EQ(findZramDevice(TABLE, name), SourceStatus::OK);
  EXPECT_EQ(name, "zram0");
}

/** @test Header alone means no swap at all. */
TEST(SwapInfoDisk, HeaderOnly) {
  NamedRecord rec;
  EXPECT_EQ(parseDiskSwap(SWAPS_HEADER, rec), SourceStatus::NOT_PRESENT);
  EXPECT_EQ(parseDiskSwap("", rec), SourceStatus::NOT_PRESENT);
}

/** @test Disk row found alongside a zram row. */
TEST(SwapInfoDisk, MixedRows) {
  NamedRecord rec;
  ASSERT_EQ(parseDiskSwap(swaps("/dev/zram0  partition  4194300  0  100\n"
                                "/swapfile   file       2097148  0  -2\n"),
                          rec),
            SourceStatus::OK);
  EXPECT_EQ(valueOf(rec, "total"), 2097148.0);
}

/** @test Two disk rows are rejected. */
TEST(SwapInfoDisk, MultipleDiskSwap) {
  NamedRecord rec;
  EXPECT_EQ(parseDiskSwap(swaps("/dev/sda2  partition  8388604  0  -2\n"
                                "/swapfile  file       2097148  0  -3\n"),
                          rec),
            SourceStatus::MULTIPLE_DISK_SWAP);
  EXPECT_EQ(rec.size(), 0U);
}

/** @test Short or non-numeric rows are malformed. */
TEST(SwapInfoDisk, MalformedRow) {
  NamedRecord rec;
  EXPECT_EQ(parseDiskSwap(swaps("/dev/sda2  partition  8388604\n"), rec), SourceStatus::MALFORMED);
  EXPECT_EQ(parseDiskSwap(swaps("/dev/sda2  partition  big  0  -2\n"), rec),
            SourceStatus::MALFORMED);
}

/* ----------------------------- findZramDevice Tests ----------------------------- */

/** @test Device name is the last path component. */
TEST(SwapInfoZramDevice, ShortName) {
  std::string name;
  ASSERT_EQ(findZramDevice(swaps("/dev/sda2  partition  8388604  0  -2\n"
                                 "/dev/zram0  partition  4194300  0  100\n"),
                           name),
            SourceStatus::OK);
  EXPECT_EQ(name, "zram0");
}

/** @test Only the first zram row is used. */
TEST(SwapInfoZramDevice, FirstRowWins) {
  std::string name;
  ASSERT_EQ(findZramDevice(swaps("/dev/zram1  partition  4194300  0  100\n"
                                 "/dev/zram0  partition  4194300  0  100\n"),
                           name),
            SourceStatus::OK);
  EXPECT_EQ(name, "zram1");
}

/** @test No zram row is NOT_PRESENT. */
TEST(SwapInfoZramDevice, NotPresent) {
  std::string name;
  EXPECT_EQ(findZramDevice(swaps("/dev/sda2  partition  8388604  0  -2\n"), name),
            SourceStatus::NOT_PRESENT);
  EXPECT_TRUE(name.empty());
}

/** @test A zram row without a /dev/ path is malformed. */
TEST(SwapInfoZramDevice, BarePathMalformed) {
  std::string name;
  EXPECT_EQ(findZramDevice(swaps("zram0  partition  4194300  0  100\n"), name),
            SourceStatus::MALFORMED);
}

/* ----------------------------- parseZramSwap Tests ----------------------------- */

/** @test Ratio is data over total. */
TEST(SwapInfoZramStat, Ratio) {
  NamedRecord rec;
  ASSERT_EQ(parseZramSwap("1048576 0 2097152 0 0 0 0 0 0", rec), SourceStatus::OK);

  const std::vector<std::string> EXPECTED = {"data", "total", "ratio"};
  EXPECT_EQ(rec.names(), EXPECTED);
  EXPECT_EQ(valueOf(rec, "data"), 1048576.0);
  EXPECT_EQ(valueOf(rec, "total"), 2097152.0);
  EXPECT_DOUBLE_EQ(valueOf(rec, "ratio"), 0.5);
  EXPECT_EQ(rec.find("data")->unit, Unit::B);
  EXPECT_EQ(rec.find("ratio")->unit, Unit::NONE);
}

/** @test Zero total leaves the ratio absent. */
TEST(SwapInfoZramStat, ZeroTotal) {
  NamedRecord rec;
  ASSERT_EQ(parseZramSwap("0 0 0 0 0 0 0 0 0", rec), SourceStatus::OK);
  ASSERT_NE(rec.find("ratio"), nullptr);
  EXPECT_TRUE(rec.find("ratio")->absent());
}

/** @test Too few or non-numeric fields are malformed. */
TEST(SwapInfoZramStat, Malformed) {
  NamedRecord rec;
  EXPECT_EQ(parseZramSwap("1048576 0", rec), SourceStatus::MALFORMED);
  EXPECT_EQ(parseZramSwap("a b c d", rec), SourceStatus::MALFORMED);
  EXPECT_EQ(parseZramSwap("", rec), SourceStatus::MALFORMED);
}
