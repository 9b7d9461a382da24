#ifndef ZFREE_HELPERS_FILES_HPP
#define ZFREE_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Whole-file reads for procfs/sysfs pseudo-files.
 *
 * Uses C-style I/O (open/read/close) so that "could not open" and "read
 * failed after open" are reported separately: the first is expected for
 * optional kernel interfaces, the second is not.
 *
 * @note NOT RT-SAFE: Output is a growing std::string.
 */

#include "src/helpers/inc/Strings.hpp"

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <unistd.h>   // read, close

#include <array>
#include <cerrno>
#include <cstddef>
#include <string>

namespace zfree {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for each read(2) call.
inline constexpr std::size_t FILE_READ_CHUNK_SIZE = 4096;

/* ----------------------------- FileStatus ----------------------------- */

/**
 * @brief Outcome of a whole-file read.
 */
enum class FileStatus : unsigned char {
  OK = 0,
  OPEN_FAILED, ///< Missing, permission denied, or filesystem not mounted
  READ_FAILED, ///< read(2) failed after a successful open
};

/**
 * @brief Human-readable status string.
 * @note RT-SAFE: Returns static string pointer.
 */
[[nodiscard]] inline const char* toString(FileStatus status) noexcept {
  switch (status) {
  case FileStatus::OK:
    return "OK";
  case FileStatus::OPEN_FAILED:
    return "OPEN_FAILED";
  case FileStatus::READ_FAILED:
    return "READ_FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file into a string.
 * @param path File path to read.
 * @param out Receives the contents with trailing whitespace stripped.
 *            Cleared on failure.
 * @return FileStatus::OK on success.
 *
 * Pseudo-files report a size of zero, so the file is read until EOF rather
 * than sized up front.
 */
[[nodiscard]] inline FileStatus readFileToString(const char* path, std::string& out) {
  out.clear();
  if (path == nullptr) {
    return FileStatus::OPEN_FAILED;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return FileStatus::OPEN_FAILED;
  }

  std::array<char, FILE_READ_CHUNK_SIZE> chunk{};
  while (true) {
    const ssize_t N = ::read(FD, chunk.data(), chunk.size());
    if (N == 0) {
      break;
    }
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(FD);
      out.clear();
      return FileStatus::READ_FAILED;
    }
    out.append(chunk.data(), static_cast<std::size_t>(N));
  }

  ::close(FD);
  strings::stripTrailingWhitespace(out);
  return FileStatus::OK;
}

} // namespace files
} // namespace helpers
} // namespace zfree

#endif // ZFREE_HELPERS_FILES_HPP
