#ifndef ZFREE_MEMORY_SOURCES_HPP
#define ZFREE_MEMORY_SOURCES_HPP
/**
 * @file Sources.hpp
 * @brief Snapshot of the kernel text interfaces the report is built from (Linux).
 * @note Linux-only. Reads /proc/meminfo, /proc/swaps, /proc/pressure/memory,
 *       /sys/class/block/<dev>/mm_stat.
 *
 * Kernel pseudo-files change between reads, so every source is captured as a
 * complete string before any parsing begins.
 */

#include "src/memory/inc/SourceStatus.hpp"

#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace zfree {

namespace memory {

/* ----------------------------- Constants ----------------------------- */

inline constexpr const char* PROC_MEMINFO = "/proc/meminfo";
inline constexpr const char* PROC_SWAPS = "/proc/swaps";
inline constexpr const char* PROC_PRESSURE_MEMORY = "/proc/pressure/memory";
inline constexpr const char* SYS_CLASS_BLOCK = "/sys/class/block";

/* ----------------------------- SourceSnapshot ----------------------------- */

/**
 * @brief Raw contents of every source, empty where a source is unavailable.
 */
struct SourceSnapshot {
  std::optional<std::string> meminfo{};    ///< /proc/meminfo
  std::optional<std::string> swaps{};      ///< /proc/swaps
  std::optional<std::string> pressure{};   ///< /proc/pressure/memory (needs CONFIG_PSI)
  std::optional<std::string> zramMmStat{}; ///< mm_stat of the zram swap device
  std::string zramMmStatPath{};            ///< Path zramMmStat was read from
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Read a source that may legitimately be missing.
 * @param path File to read.
 * @return Trimmed contents, or std::nullopt if the file could not be read.
 */
[[nodiscard]] std::optional<std::string> readOptionalSource(const char* path);

/**
 * @brief Capture /proc/meminfo, /proc/swaps and /proc/pressure/memory.
 * @return Snapshot with zramMmStat left empty.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] SourceSnapshot gatherSources();

/**
 * @brief Read the mm_stat of the zram swap device listed in a swap table.
 * @param swaps /proc/swaps contents.
 * @param mmStat Receives the mm_stat contents.
 * @param path Receives the mm_stat path that was tried.
 * @param sysBlockRoot Directory holding per-device sysfs entries.
 * @return OK; NOT_PRESENT if no zram swap is listed; MALFORMED if the swap
 *         row is unusable; UNREADABLE if the listed device's mm_stat cannot
 *         be read.
 */
[[nodiscard]] SourceStatus readZramMmStat(std::string_view swaps, std::string& mmStat,
                                          std::string& path,
                                          const char* sysBlockRoot = SYS_CLASS_BLOCK);

} // namespace memory

} // namespace zfree

#endif // ZFREE_MEMORY_SOURCES_HPP
