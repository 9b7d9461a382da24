#ifndef ZFREE_MEMORY_SOURCE_STATUS_HPP
#define ZFREE_MEMORY_SOURCE_STATUS_HPP
/**
 * @file SourceStatus.hpp
 * @brief Outcome codes shared by the kernel-source readers and parsers.
 *
 * NOT_PRESENT is an expected result (the section is skipped). Every other
 * non-OK code is fatal for the report.
 */

#include <string>      // std::string
#include <string_view> // std::string_view

namespace zfree {

namespace memory {

/* ----------------------------- SourceStatus ----------------------------- */

/**
 * @brief Status codes for source reads and field extraction.
 */
enum class SourceStatus : unsigned char {
  OK = 0,
  NOT_PRESENT,        ///< Optional source or device absent (not an error)
  NO_MEMAVAILABLE,    ///< meminfo lacks MemAvailable (kernel older than 3.14)
  MALFORMED,          ///< Text does not match the kernel's documented layout
  MULTIPLE_DISK_SWAP, ///< More than one non-zram swap device
  UNREADABLE,         ///< A source known to exist could not be read
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns pointer to static string.
 */
[[nodiscard]] const char* toString(SourceStatus status) noexcept;

/**
 * @brief True for codes that must abort the report.
 */
[[nodiscard]] bool isFatal(SourceStatus status) noexcept;

/**
 * @brief One-line diagnostic for a status.
 * @param status Status to describe.
 * @param source Path (or name) of the offending source.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] std::string describe(SourceStatus status, std::string_view source);

} // namespace memory

} // namespace zfree

#endif // ZFREE_MEMORY_SOURCE_STATUS_HPP
