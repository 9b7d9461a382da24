/**
 * @file Sources.cpp
 * @brief Implementation of kernel source capture.
 */

#include "src/memory/inc/Sources.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/memory/inc/SwapInfo.hpp"

#include <fmt/core.h>

namespace zfree {

namespace memory {

using zfree::helpers::files::FileStatus;
using zfree::helpers::files::readFileToString;

std::optional<std::string> readOptionalSource(const char* path) {
  std::string contents;
  if (readFileToString(path, contents) != FileStatus::OK) {
    return std::nullopt;
  }
  return contents;
}

SourceSnapshot gatherSources() {
  SourceSnapshot snap{};
  snap.meminfo = readOptionalSource(PROC_MEMINFO);
  snap.swaps = readOptionalSource(PROC_SWAPS);
  snap.pressure = readOptionalSource(PROC_PRESSURE_MEMORY);
  return snap;
}

SourceStatus readZramMmStat(std::string_view swaps, std::string& mmStat, std::string& path,
                            const char* sysBlockRoot) {
  std::string device;
  const SourceStatus FOUND = findZramDevice(swaps, device);
  if (FOUND != SourceStatus::OK) {
    return FOUND;
  }

  path = fmt::format("{}/{}/mm_stat", sysBlockRoot, device);

  // The swap table named this device, so failing to read it is not an
  // expected absence.
  if (readFileToString(path.c_str(), mmStat) != FileStatus::OK) {
    return SourceStatus::UNREADABLE;
  }
  return SourceStatus::OK;
}

} // namespace memory

} // namespace zfree
