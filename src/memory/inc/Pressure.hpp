#ifndef ZFREE_MEMORY_PRESSURE_HPP
#define ZFREE_MEMORY_PRESSURE_HPP
/**
 * @file Pressure.hpp
 * @brief Memory pressure stall information from /proc/pressure/memory (Linux 4.20+).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * File layout:
 *
 *   some avg10=0.00 avg60=0.00 avg300=0.00 total=0
 *   full avg10=0.00 avg60=0.00 avg300=0.00 total=0
 */

#include "src/memory/inc/SourceStatus.hpp"

#include <array>       // std::array
#include <cstddef>     // std::size_t
#include <string_view> // std::string_view

namespace zfree {

namespace memory {

/* ----------------------------- Constants ----------------------------- */

/// Number of averaging windows per line (avg10, avg60, avg300).
inline constexpr std::size_t PSI_WINDOW_COUNT = 3;

/* ----------------------------- PressureStats ----------------------------- */

/**
 * @brief Stall percentages over the 10 s, 60 s and 300 s windows.
 */
struct PressureStats {
  std::array<double, PSI_WINDOW_COUNT> some{}; ///< Some tasks stalled (%)
  std::array<double, PSI_WINDOW_COUNT> full{}; ///< All non-idle tasks stalled (%)
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Extract the averaged percentages from a PSI file.
 * @param text Whole file contents (a "some" line and a "full" line).
 * @param out Receives the six percentages.
 * @return OK or MALFORMED.
 * @note NOT RT-safe: Allocates.
 */
[[nodiscard]] SourceStatus parsePressure(std::string_view text, PressureStats& out);

} // namespace memory

} // namespace zfree

#endif // ZFREE_MEMORY_PRESSURE_HPP
