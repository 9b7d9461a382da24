#ifndef ZFREE_HELPERS_STRINGS_HPP
#define ZFREE_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Tokenizing and numeric parsing helpers for kernel text interfaces.
 *
 * procfs/sysfs files are small, so these helpers work on std::string_view
 * and return views into the caller's buffer. The caller's buffer must outlive
 * every returned view.
 *
 * @note NOT RT-SAFE: Splitting functions return std::vector (heap allocation).
 */

#include <cerrno>  // errno, ERANGE
#include <cstddef> // std::size_t
#include <cstdint> // std::int64_t
#include <cstdlib> // strtoll, strtod
#include <string>
#include <string_view>
#include <vector>

namespace zfree {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/// True for the whitespace characters found in procfs tables.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

/**
 * @brief Check if str contains needle anywhere.
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] inline bool contains(std::string_view str, std::string_view needle) noexcept {
  return str.find(needle) != std::string_view::npos;
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip leading and trailing whitespace.
 * @return View into str without surrounding whitespace.
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] inline std::string_view trim(std::string_view str) noexcept {
  std::size_t begin = 0;
  while (begin < str.size() && isSpace(str[begin])) {
    ++begin;
  }
  std::size_t end = str.size();
  while (end > begin && isSpace(str[end - 1])) {
    --end;
  }
  return str.substr(begin, end - begin);
}

/**
 * @brief Strip trailing whitespace from a std::string in-place.
 * @note RT-SAFE: No allocation (erase never grows the string).
 */
inline void stripTrailingWhitespace(std::string& str) noexcept {
  std::size_t len = str.size();
  while (len > 0 && isSpace(str[len - 1])) {
    --len;
  }
  str.erase(len);
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split text into lines on '\n'.
 * @param text Input text.
 * @return One view per line (empty lines included, no trailing '\n').
 *
 * An empty input yields no lines. A trailing '\n' does not produce an extra
 * empty line.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    const std::size_t EOL = text.find('\n', start);
    if (EOL == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, EOL - start));
    start = EOL + 1;
  }
  return lines;
}

/**
 * @brief Split text on runs of whitespace.
 * @param text Input text.
 * @return Non-empty tokens in order of appearance.
 */
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view text) {
  std::vector<std::string_view> tokens;
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && isSpace(text[i])) {
      ++i;
    }
    const std::size_t BEGIN = i;
    while (i < text.size() && !isSpace(text[i])) {
      ++i;
    }
    if (i > BEGIN) {
      tokens.push_back(text.substr(BEGIN, i - BEGIN));
    }
  }
  return tokens;
}

/**
 * @brief Split text on every occurrence of a delimiter.
 * @return Fields between delimiters (empty fields kept), always at least one.
 */
[[nodiscard]] inline std::vector<std::string_view> split(std::string_view text, char delim) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = text.find(delim, start);
    if (POS == std::string_view::npos) {
      fields.push_back(text.substr(start));
      break;
    }
    fields.push_back(text.substr(start, POS - start));
    start = POS + 1;
  }
  return fields;
}

/* ----------------------------- Numeric Parsing ----------------------------- */

/**
 * @brief Parse a whole token as a signed 64-bit decimal integer.
 * @param token Text to parse (no surrounding whitespace allowed).
 * @param out Receives the parsed value on success.
 * @return true if the entire token is a valid in-range integer.
 */
[[nodiscard]] inline bool parseInt64(std::string_view token, std::int64_t& out) {
  if (token.empty()) {
    return false;
  }
  const std::string BUF(token);
  char* end = nullptr;
  errno = 0;
  const long long VAL = std::strtoll(BUF.c_str(), &end, 10);
  if (end != BUF.c_str() + BUF.size() || errno == ERANGE || isSpace(BUF.front())) {
    return false;
  }
  out = static_cast<std::int64_t>(VAL);
  return true;
}

/**
 * @brief Parse a whole token as a decimal floating-point number.
 * @param token Text to parse (e.g., "0.12").
 * @param out Receives the parsed value on success.
 * @return true if the entire token is a valid number.
 */
[[nodiscard]] inline bool parseDouble(std::string_view token, double& out) {
  if (token.empty()) {
    return false;
  }
  const std::string BUF(token);
  char* end = nullptr;
  const double VAL = std::strtod(BUF.c_str(), &end);
  if (end != BUF.c_str() + BUF.size() || isSpace(BUF.front())) {
    return false;
  }
  out = VAL;
  return true;
}

} // namespace strings
} // namespace helpers
} // namespace zfree

#endif // ZFREE_HELPERS_STRINGS_HPP
