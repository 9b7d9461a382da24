/**
 * @file SourceStatus.cpp
 * @brief Status strings and diagnostics for source parsing.
 */

#include "src/memory/inc/SourceStatus.hpp"

#include <fmt/core.h>

namespace zfree {

namespace memory {

const char* toString(SourceStatus status) noexcept {
  switch (status) {
  case SourceStatus::OK:
    return "OK";
  case SourceStatus::NOT_PRESENT:
    return "NOT_PRESENT";
  case SourceStatus::NO_MEMAVAILABLE:
    return "NO_MEMAVAILABLE";
  case SourceStatus::MALFORMED:
    return "MALFORMED";
  case SourceStatus::MULTIPLE_DISK_SWAP:
    return "MULTIPLE_DISK_SWAP";
  case SourceStatus::UNREADABLE:
    return "UNREADABLE";
  }
  return "UNKNOWN";
}

bool isFatal(SourceStatus status) noexcept {
  return status != SourceStatus::OK && status != SourceStatus::NOT_PRESENT;
}

std::string describe(SourceStatus status, std::string_view source) {
  switch (status) {
  case SourceStatus::OK:
    return fmt::format("{}: ok", source);
  case SourceStatus::NOT_PRESENT:
    return fmt::format("{}: not present", source);
  case SourceStatus::NO_MEMAVAILABLE:
    return fmt::format("MemAvailable in {} absent (kernel older than 3.14?)", source);
  case SourceStatus::MALFORMED:
    return fmt::format("internal error: {} not in expected format", source);
  case SourceStatus::MULTIPLE_DISK_SWAP:
    return fmt::format("having multiple disk swap devices is unsupported (see {})", source);
  case SourceStatus::UNREADABLE:
    return fmt::format("internal error: {} exists but could not be read", source);
  }
  return fmt::format("{}: unknown status", source);
}

} // namespace memory

} // namespace zfree
