#ifndef ZFREE_MEMORY_SWAP_INFO_HPP
#define ZFREE_MEMORY_SWAP_INFO_HPP
/**
 * @file SwapInfo.hpp
 * @brief Disk swap and zram swap usage from /proc/swaps and zram mm_stat (Linux).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * /proc/swaps layout (sizes in KiB):
 *
 *   Filename        Type        Size     Used    Priority
 *   /dev/nvme0n1p3  partition   8388604  0       -2
 *   /dev/zram0      partition   4194300  123456  100
 *
 * Rows whose device path contains "zram" are zram swap; every other row is
 * disk swap. At most one disk swap device is supported.
 */

#include "src/memory/inc/SourceStatus.hpp"
#include "src/units/inc/Units.hpp"

#include <string>      // std::string
#include <string_view> // std::string_view

namespace zfree {

namespace memory {

/* ----------------------------- Constants ----------------------------- */

/// Substring identifying a zram device in a swap table row.
inline constexpr std::string_view ZRAM_MARKER = "zram";

/* ----------------------------- API ----------------------------- */

/**
 * @brief Extract the single disk swap device from /proc/swaps contents.
 * @param text Whole swap table including the header line.
 * @param out Receives fields total, used, free (KiB).
 * @return OK; NOT_PRESENT if there is no disk swap; MULTIPLE_DISK_SWAP;
 *         or MALFORMED if the row has too few or non-numeric columns.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] SourceStatus parseDiskSwap(std::string_view text, units::NamedRecord& out);

/**
 * @brief Find the zram swap device named in /proc/swaps contents.
 * @param text Whole swap table including the header line.
 * @param deviceName Receives the short device name (e.g., "zram0").
 * @return OK; NOT_PRESENT if no zram row exists; MALFORMED if the device
 *         path has no "/dev/<name>" form.
 *
 * Only the first zram row is considered.
 */
[[nodiscard]] SourceStatus findZramDevice(std::string_view text, std::string& deviceName);

/**
 * @brief Extract compressed size statistics from a zram mm_stat line.
 * @param mmStat mm_stat contents (whitespace-separated counters in bytes).
 * @param out Receives fields data (B), total (B), ratio (dimensionless).
 * @return OK or MALFORMED if fewer than three numeric fields.
 *
 * ratio = data / total, absent when total is zero.
 */
[[nodiscard]] SourceStatus parseZramSwap(std::string_view mmStat, units::NamedRecord& out);

} // namespace memory

} // namespace zfree

#endif // ZFREE_MEMORY_SWAP_INFO_HPP
