#ifndef ZFREE_UNITS_UNITS_HPP
#define ZFREE_UNITS_UNITS_HPP
/**
 * @file Units.hpp
 * @brief Byte-multiple quantities, unit conversion, and autoranging.
 *
 * All concrete units resolve through bytes, so any pair of concrete units
 * (binary or decimal) converts exactly up to floating-point rounding.
 *
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string
#include <string_view>
#include <vector>

namespace zfree {

namespace units {

/* ----------------------------- Unit ----------------------------- */

/**
 * @brief Display unit of a Quantity.
 *
 * AUTO_BINARY and AUTO_DECIMAL are only valid as conversion targets.
 */
enum class Unit : std::uint8_t {
  NONE = 0, ///< Dimensionless, no suffix
  PERCENT,  ///< Dimensionless, "%" suffix
  B,
  KIB,
  MIB,
  GIB,
  TIB,
  KB,
  MB,
  GB,
  TB,
  AUTO_BINARY,  ///< Autorange over B..TiB
  AUTO_DECIMAL, ///< Autorange over B..TB
};

/// Highest autorange tier index (B=0 .. T*=4).
inline constexpr std::size_t AUTORANGE_MAX_TIER = 4;

/**
 * @brief Display suffix for a unit (e.g., "MiB", "%", "").
 * @note RT-safe: Returns pointer to static string.
 */
[[nodiscard]] const char* toString(Unit unit) noexcept;

/// @brief True for NONE and PERCENT.
[[nodiscard]] bool isDimensionless(Unit unit) noexcept;

/// @brief True for AUTO_BINARY and AUTO_DECIMAL.
[[nodiscard]] bool isAuto(Unit unit) noexcept;

/**
 * @brief Size of one unit in bytes.
 * @return Multiplier (B=1, KiB=1024, KB=1000, ...), 0 for non-byte units.
 */
[[nodiscard]] std::uint64_t multiplier(Unit unit) noexcept;

/* ----------------------------- UnitStatus ----------------------------- */

/**
 * @brief Status codes for conversion operations.
 */
enum class UnitStatus : unsigned char {
  OK = 0,
  AUTO_SOURCE_UNIT, ///< An auto unit was supplied as the unit to convert from
  NON_BYTE_TARGET,  ///< A byte quantity was asked to convert into NONE or PERCENT
};

/**
 * @brief Human-readable status string.
 * @note RT-safe: Returns pointer to static string.
 */
[[nodiscard]] const char* toString(UnitStatus status) noexcept;

/* ----------------------------- Quantity ----------------------------- */

/**
 * @brief A value with its unit. An empty value means "could not be determined".
 */
struct Quantity {
  std::optional<double> value{};
  Unit unit{Unit::NONE};

  /// @brief True if the value could not be determined.
  [[nodiscard]] bool absent() const noexcept { return !value.has_value(); }
};

/* ----------------------------- NamedRecord ----------------------------- */

/// One named field of a NamedRecord.
struct Field {
  std::string name;
  Quantity quantity{};
};

/**
 * @brief Ordered list of uniquely named quantities.
 *
 * Field order is display order and is kept by every transformation.
 */
struct NamedRecord {
  std::vector<Field> fields;

  /**
   * @brief Append a field.
   * @return false (and no change) if a field with this name already exists.
   */
  bool add(std::string_view name, Quantity quantity);

  /// @brief Look up a field by name; nullptr if not present.
  [[nodiscard]] const Quantity* find(std::string_view name) const noexcept;

  /// @brief Number of fields.
  [[nodiscard]] std::size_t size() const noexcept { return fields.size(); }

  /// @brief Field names in order.
  [[nodiscard]] std::vector<std::string> names() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Convert a quantity into another unit.
 * @param in Quantity to convert; its unit must not be an auto unit.
 * @param target Concrete or auto unit to convert into.
 * @param out Receives the converted quantity.
 * @return UnitStatus::AUTO_SOURCE_UNIT if in.unit is an auto unit,
 *         UnitStatus::NON_BYTE_TARGET if a byte quantity targets a dimensionless unit.
 *
 * Rules, in order:
 *  - absent value: out = (absent, NONE)
 *  - dimensionless unit: out = in
 *  - auto target: autorange
 *  - otherwise value * multiplier(in.unit) / multiplier(target)
 */
[[nodiscard]] UnitStatus convert(const Quantity& in, Unit target, Quantity& out) noexcept;

/**
 * @brief Magnitude tier of a byte count: floor(log1000(bytes)), clamped to [0, 4].
 *
 * Non-positive byte counts are tier 0.
 */
[[nodiscard]] std::size_t autorangeTier(double bytes) noexcept;

/**
 * @brief Convert a quantity into the largest unit keeping its magnitude readable.
 * @param in Quantity to convert.
 * @param wantDecimal Use powers of 1000 (KB, MB, ...) instead of 1024.
 * @param out Receives the converted quantity.
 *
 * The tier is chosen from the byte count, not the input unit, so equal
 * amounts pick the same unit whatever unit they arrive in.
 */
[[nodiscard]] UnitStatus autorange(const Quantity& in, bool wantDecimal, Quantity& out) noexcept;

/**
 * @brief Convert every field of a record, keeping names and order.
 * @param in Record to convert.
 * @param target Unit for all byte-valued fields; dimensionless fields pass through.
 * @param out Receives the converted record (cleared first).
 * @return First non-OK status encountered; out is cleared on failure.
 */
[[nodiscard]] UnitStatus convertAll(const NamedRecord& in, Unit target, NamedRecord& out);

} // namespace units

} // namespace zfree

#endif // ZFREE_UNITS_UNITS_HPP
