#ifndef ZFREE_MEMORY_MEM_INFO_HPP
#define ZFREE_MEMORY_MEM_INFO_HPP
/**
 * @file MemInfo.hpp
 * @brief Physical memory usage from /proc/meminfo text (Linux).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include "src/memory/inc/SourceStatus.hpp"
#include "src/units/inc/Units.hpp"

#include <string_view> // std::string_view

namespace zfree {

namespace memory {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Extract memory usage from /proc/meminfo contents.
 * @param text Whole file contents ("Key:   value kB" per line).
 * @param out Receives fields total, used, avail, cache, free (KiB).
 * @return SourceStatus::OK, NO_MEMAVAILABLE, or MALFORMED.
 * @note NOT RT-safe: Allocates.
 *
 * Derived fields:
 *  - used  = MemTotal - MemAvailable
 *  - cache = Buffers + Cached
 */
[[nodiscard]] SourceStatus parseMemInfo(std::string_view text, units::NamedRecord& out);

} // namespace memory

} // namespace zfree

#endif // ZFREE_MEMORY_MEM_INFO_HPP
