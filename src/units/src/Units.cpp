/**
 * @file Units.cpp
 * @brief Unit conversion and autoranging implementation.
 */

#include "src/units/inc/Units.hpp"

#include <array>   // std::array
#include <cmath>   // std::floor, std::log10
#include <utility> // std::move

namespace zfree {

namespace units {

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::uint64_t KIB = 1024ULL;
constexpr std::uint64_t MIB = KIB * 1024ULL;
constexpr std::uint64_t GIB = MIB * 1024ULL;
constexpr std::uint64_t TIB = GIB * 1024ULL;

constexpr std::uint64_t KB = 1000ULL;
constexpr std::uint64_t MB = KB * 1000ULL;
constexpr std::uint64_t GB = MB * 1000ULL;
constexpr std::uint64_t TB = GB * 1000ULL;

constexpr std::array<Unit, AUTORANGE_MAX_TIER + 1> BINARY_LADDER = {
    Unit::B, Unit::KIB, Unit::MIB, Unit::GIB, Unit::TIB};

constexpr std::array<Unit, AUTORANGE_MAX_TIER + 1> DECIMAL_LADDER = {
    Unit::B, Unit::KB, Unit::MB, Unit::GB, Unit::TB};

} // namespace

/* ----------------------------- Unit Helpers ----------------------------- */

const char* toString(Unit unit) noexcept {
  switch (unit) {
  case Unit::NONE:
    return "";
  case Unit::PERCENT:
    return "%";
  case Unit::B:
    return "B";
  case Unit::KIB:
    return "KiB";
  case Unit::MIB:
    return "MiB";
  case Unit::GIB:
    return "GiB";
  case Unit::TIB:
    return "TiB";
  case Unit::KB:
    return "KB";
  case Unit::MB:
    return "MB";
  case Unit::GB:
    return "GB";
  case Unit::TB:
    return "TB";
  case Unit::AUTO_BINARY:
    return "autobinary";
  case Unit::AUTO_DECIMAL:
    return "autodecimal";
  }
  return "";
}

bool isDimensionless(Unit unit) noexcept { return unit == Unit::NONE || unit == Unit::PERCENT; }

bool isAuto(Unit unit) noexcept { return unit == Unit::AUTO_BINARY || unit == Unit::AUTO_DECIMAL; }

std::uint64_t multiplier(Unit unit) noexcept {
  switch (unit) {
  case Unit::B:
    return 1;
  case Unit::KIB:
    return KIB;
  case Unit::MIB:
    return MIB;
  case Unit::GIB:
    return GIB;
  case Unit::TIB:
    return TIB;
  case Unit::KB:
    return KB;
  case Unit::MB:
    return MB;
  case Unit::GB:
    return GB;
  case Unit::TB:
    return TB;
  case Unit::NONE:
  case Unit::PERCENT:
  case Unit::AUTO_BINARY:
  case Unit::AUTO_DECIMAL:
    break;
  }
  return 0;
}

const char* toString(UnitStatus status) noexcept {
  switch (status) {
  case UnitStatus::OK:
    return "OK";
  case UnitStatus::AUTO_SOURCE_UNIT:
    return "AUTO_SOURCE_UNIT";
  case UnitStatus::NON_BYTE_TARGET:
    return "NON_BYTE_TARGET";
  }
  return "UNKNOWN";
}

/* ----------------------------- NamedRecord Methods ----------------------------- */

bool NamedRecord::add(std::string_view name, Quantity quantity) {
  if (find(name) != nullptr) {
    return false;
  }
  fields.push_back(Field{std::string(name), quantity});
  return true;
}

const Quantity* NamedRecord::find(std::string_view name) const noexcept {
  for (const Field& F : fields) {
    if (F.name == name) {
      return &F.quantity;
    }
  }
  return nullptr;
}

std::vector<std::string> NamedRecord::names() const {
  std::vector<std::string> out;
  out.reserve(fields.size());
  for (const Field& F : fields) {
    out.push_back(F.name);
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

UnitStatus convert(const Quantity& in, Unit target, Quantity& out) noexcept {
  if (in.absent()) {
    out = Quantity{};
    return UnitStatus::OK;
  }

  if (isDimensionless(in.unit)) {
    out = in;
    return UnitStatus::OK;
  }

  if (isAuto(in.unit)) {
    return UnitStatus::AUTO_SOURCE_UNIT;
  }

  if (isAuto(target)) {
    return autorange(in, target == Unit::AUTO_DECIMAL, out);
  }

  if (isDimensionless(target)) {
    return UnitStatus::NON_BYTE_TARGET;
  }

  const double FACTOR =
      static_cast<double>(multiplier(in.unit)) / static_cast<double>(multiplier(target));
  out = Quantity{*in.value * FACTOR, target};
  return UnitStatus::OK;
}

std::size_t autorangeTier(double bytes) noexcept {
  // log10 is exact at powers of ten, so 1000 B lands in tier 1, not tier 0.
  if (!(bytes > 0.0)) {
    return 0;
  }
  const double LOG1000 = std::floor(std::log10(bytes) / 3.0);
  if (LOG1000 <= 0.0) {
    return 0;
  }
  if (LOG1000 >= static_cast<double>(AUTORANGE_MAX_TIER)) {
    return AUTORANGE_MAX_TIER;
  }
  return static_cast<std::size_t>(LOG1000);
}

UnitStatus autorange(const Quantity& in, bool wantDecimal, Quantity& out) noexcept {
  if (isAuto(in.unit)) {
    return UnitStatus::AUTO_SOURCE_UNIT;
  }
  if (isDimensionless(in.unit) || in.absent()) {
    return convert(in, Unit::B, out);
  }

  Quantity bytes{};
  const UnitStatus STATUS = convert(in, Unit::B, bytes);
  if (STATUS != UnitStatus::OK) {
    return STATUS;
  }
  if (bytes.absent()) {
    out = Quantity{};
    return UnitStatus::OK;
  }

  const std::size_t TIER = autorangeTier(*bytes.value);
  const Unit TARGET = wantDecimal ? DECIMAL_LADDER[TIER] : BINARY_LADDER[TIER];
  return convert(in, TARGET, out);
}

UnitStatus convertAll(const NamedRecord& in, Unit target, NamedRecord& out) {
  NamedRecord result;
  result.fields.reserve(in.fields.size());

  for (const Field& F : in.fields) {
    Quantity converted{};
    const UnitStatus STATUS = convert(F.quantity, target, converted);
    if (STATUS != UnitStatus::OK) {
      out.fields.clear();
      return STATUS;
    }
    result.fields.push_back(Field{F.name, converted});
  }

  out = std::move(result);
  return UnitStatus::OK;
}

} // namespace units

} // namespace zfree
