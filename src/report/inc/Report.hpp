#ifndef ZFREE_REPORT_REPORT_HPP
#define ZFREE_REPORT_REPORT_HPP
/**
 * @file Report.hpp
 * @brief Memory/swap/zram/PSI report assembly from a source snapshot.
 *
 * Everything here is driven by an explicit ReportConfig, so the report can
 * be built from crafted snapshots without touching the CLI or the kernel.
 *
 * @note NOT RT-SAFE: Allocates throughout. Cold path only.
 */

#include "src/memory/inc/Pressure.hpp"
#include "src/memory/inc/Sources.hpp"
#include "src/units/inc/Units.hpp"

#include <cstddef>  // std::size_t
#include <optional> // std::optional
#include <string>
#include <string_view>
#include <vector>

namespace zfree {

namespace report {

/* ----------------------------- Constants ----------------------------- */

/// Default column width of the text tables.
inline constexpr std::size_t DEFAULT_COLUMN_WIDTH = 11;

/* ----------------------------- ColumnSelection ----------------------------- */

/**
 * @brief Text-table columns picked with -o/--output, in display order.
 *
 * Entries are record field names: memory "total", "used", "avail", "cache",
 * "free"; zram "data", "total", "ratio", "comp%". A table with no entries
 * is not printed.
 */
struct ColumnSelection {
  std::vector<std::string> memory{};
  std::vector<std::string> zram{};
};

/* ----------------------------- ReportConfig ----------------------------- */

/**
 * @brief Display options chosen on the command line.
 */
struct ReportConfig {
  units::Unit unit{units::Unit::MIB};        ///< Target unit (may be AUTO_*)
  bool showDiskSwap{true};                   ///< Include the disk swap column
  bool showZram{true};                       ///< Include the zram block
  bool showPressure{true};                   ///< Include the PSI line
  bool showUnit{true};                       ///< Append unit suffixes to values
  std::size_t width{DEFAULT_COLUMN_WIDTH};   ///< Column width of the tables
  std::optional<ColumnSelection> columns{};  ///< Table columns; every field when empty
};

/**
 * @brief Parse a comma-separated column list such as "total,used,compratio".
 * @param list Column names. Memory: total, used, available (avail),
 *             bufcache (cache), free. zram: compdata, comptotal, compratio, comp%.
 * @param out Receives the selection.
 * @param error Receives "unknown column type '<name>'" on failure.
 * @return false on an unknown or empty name.
 */
[[nodiscard]] bool parseColumns(std::string_view list, ColumnSelection& out, std::string& error);

/**
 * @brief Parse a column width.
 * @return false unless text is an integer in [0, MAX_COLUMN_WIDTH].
 */
[[nodiscard]] bool parseColumnWidth(std::string_view text, std::size_t& out);

/* ----------------------------- ReportStatus ----------------------------- */

/**
 * @brief Status codes for report assembly.
 */
enum class ReportStatus : unsigned char {
  OK = 0,
  NO_MEMINFO,       ///< /proc/meminfo unavailable
  SOURCE_ERROR,     ///< A source failed to parse (fatal SourceStatus)
  CONVERSION_ERROR, ///< Unit conversion rejected a quantity
  MISSING_TOTAL,    ///< RAM or zram total could not be determined
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns pointer to static string.
 */
[[nodiscard]] const char* toString(ReportStatus status) noexcept;

/* ----------------------------- ReportData ----------------------------- */

/**
 * @brief Parsed and converted records for one report.
 *
 * Optional sections are empty when hidden by the config or not present on
 * the system.
 */
struct ReportData {
  units::NamedRecord memory{};                  ///< total, used, avail, cache, free
  std::optional<units::NamedRecord> diskSwap{}; ///< total, used, free
  std::optional<units::NamedRecord> zram{};     ///< data, total, ratio
  std::optional<memory::PressureStats> pressure{};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse a snapshot and convert every record to cfg.unit.
 * @param snap Captured sources.
 * @param cfg Display options.
 * @param out Receives the converted records.
 * @param error Receives a one-line diagnostic on failure.
 * @return ReportStatus::OK on success.
 */
[[nodiscard]] ReportStatus collectReport(const memory::SourceSnapshot& snap,
                                         const ReportConfig& cfg, ReportData& out,
                                         std::string& error);

/**
 * @brief Render the memory table, with the disk swap column when given.
 * @param mem Converted memory record.
 * @param swap Converted disk swap record, or nullptr to omit the column.
 * @param cfg Display options (width, showUnit, columns).
 * @return "Memory" or "Memory/swap" header line followed by the table, or
 *         an empty string if cfg.columns selects no memory column.
 */
[[nodiscard]] std::string formatMemorySwap(const units::NamedRecord& mem,
                                           const units::NamedRecord* swap,
                                           const ReportConfig& cfg);

/**
 * @brief Render the zram block.
 * @param zram Converted zram record (data, total, ratio).
 * @param mem Converted memory record (for total RAM).
 * @param cfg Display options (width, showUnit, columns).
 * @param out Receives "zram" header line followed by data, total, ratio, comp%
 *            (or the rows cfg.columns selects; empty if it selects none).
 * @return MISSING_TOTAL if either total is absent, else OK.
 *
 * comp% is the zram pool total as a percentage of total RAM.
 */
[[nodiscard]] ReportStatus formatZram(const units::NamedRecord& zram,
                                      const units::NamedRecord& mem, const ReportConfig& cfg,
                                      std::string& out);

/**
 * @brief Render PSI as "psi some/full: a, b, c / d, e, f" (two decimal places).
 */
[[nodiscard]] std::string formatPressure(const memory::PressureStats& psi);

/**
 * @brief Render a quantity as a JSON object {"value": ..., "unit": ...}.
 *
 * Absent and non-finite values are written as null.
 */
[[nodiscard]] std::string formatJsonQuantity(const units::Quantity& q);

/**
 * @brief Build the full text report.
 * @param snap Captured sources.
 * @param cfg Display options.
 * @param out Receives the report (no trailing newline); left empty on failure.
 * @param error Receives a one-line diagnostic on failure.
 * @return ReportStatus::OK on success.
 */
[[nodiscard]] ReportStatus buildReport(const memory::SourceSnapshot& snap,
                                       const ReportConfig& cfg, std::string& out,
                                       std::string& error);

/**
 * @brief Build the report as a JSON document.
 *
 * Same inputs and failure behavior as buildReport. Absent values are null,
 * hidden or missing sections are null. cfg.columns does not apply.
 */
[[nodiscard]] ReportStatus buildJsonReport(const memory::SourceSnapshot& snap,
                                           const ReportConfig& cfg, std::string& out,
                                           std::string& error);

} // namespace report

} // namespace zfree

#endif // ZFREE_REPORT_REPORT_HPP
