#ifndef ZFREE_REPORT_TABLE_HPP
#define ZFREE_REPORT_TABLE_HPP
/**
 * @file Table.hpp
 * @brief Fixed-width text rendering of quantities and record tables.
 *
 * @note NOT RT-SAFE: All functions return std::string (heap allocation).
 *       Use only in cold paths (CLI output).
 */

#include "src/units/inc/Units.hpp"

#include <cstddef> // std::size_t
#include <string>
#include <utility> // std::pair
#include <vector>

namespace zfree {

namespace report {

/* ----------------------------- Types ----------------------------- */

/// Rows of [header, value, value, ...].
using Table = std::vector<std::vector<std::string>>;

/// Record with every quantity rendered, in field order.
using FormattedRecord = std::vector<std::pair<std::string, std::string>>;

/* ----------------------------- Constants ----------------------------- */

/// Rendering of a quantity whose value could not be determined.
inline constexpr const char* ABSENT_VALUE = "N/A";

/// Default digits after the decimal point.
inline constexpr int DEFAULT_DECIMAL_PLACES = 1;

/// Widest column formatTable will pad to.
inline constexpr std::size_t MAX_COLUMN_WIDTH = 1024;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Render a quantity as value immediately followed by its unit suffix.
 * @param q Quantity to render.
 * @param decimalPlaces Digits after the decimal point.
 * @param showUnit Append the unit suffix ("MiB", "%", ...).
 * @return e.g. "512.0MiB", "0.50", "N/A".
 */
[[nodiscard]] std::string formatValueUnit(const units::Quantity& q,
                                          int decimalPlaces = DEFAULT_DECIMAL_PLACES,
                                          bool showUnit = true);

/**
 * @brief Render every field of a record with formatValueUnit, keeping order.
 */
[[nodiscard]] FormattedRecord formatValueUnitAll(const units::NamedRecord& record,
                                                 bool showUnit = true);

/**
 * @brief Render a table column-major, each field right-justified to width.
 * @param rows Rows of [header, value, ...]; should all have the same length.
 * @param width Minimum width of each printed field, capped at MAX_COLUMN_WIDTH.
 * @return Printed line i holds element i of every row. Lines are joined by
 *         '\n' with no leading or trailing newline.
 *
 * Non-uniform rows are truncated to the shortest row.
 *
 * Example: {{"total", "1.0MiB"}, {"used", "0.5MiB"}} at width 8 gives
 *
 *      total    used
 *     1.0MiB  0.5MiB
 */
[[nodiscard]] std::string formatTable(const Table& rows, std::size_t width);

} // namespace report

} // namespace zfree

#endif // ZFREE_REPORT_TABLE_HPP
