/**
 * @file Table.cpp
 * @brief Implementation of quantity and table rendering.
 */

#include "src/report/inc/Table.hpp"

#include <algorithm> // std::min

#include <fmt/core.h>

namespace zfree {

namespace report {

std::string formatValueUnit(const units::Quantity& q, int decimalPlaces, bool showUnit) {
  if (q.absent()) {
    return ABSENT_VALUE;
  }
  return fmt::format("{:.{}f}{}", *q.value, decimalPlaces, showUnit ? units::toString(q.unit) : "");
}

FormattedRecord formatValueUnitAll(const units::NamedRecord& record, bool showUnit) {
  FormattedRecord out;
  out.reserve(record.size());
  for (const units::Field& F : record.fields) {
    out.emplace_back(F.name, formatValueUnit(F.quantity, DEFAULT_DECIMAL_PLACES, showUnit));
  }
  return out;
}

std::string formatTable(const Table& rows, std::size_t width) {
  if (rows.empty()) {
    return {};
  }

  std::size_t columns = rows.front().size();
  for (const auto& ROW : rows) {
    columns = std::min(columns, ROW.size());
  }

  const std::size_t WIDTH = std::min(width, MAX_COLUMN_WIDTH);

  std::string out;
  for (std::size_t col = 0; col < columns; ++col) {
    if (col > 0) {
      out.push_back('\n');
    }
    for (const auto& ROW : rows) {
      out += fmt::format("{:>{}}", ROW[col], WIDTH);
    }
  }
  return out;
}

} // namespace report

} // namespace zfree
