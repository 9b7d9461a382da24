#ifndef ZFREE_HELPERS_ARGS_HPP
#define ZFREE_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Every flag has a fixed number of values and may have one alias
 * (e.g. "-k" / "--kibi"). Tokens that are neither flags nor values are
 * rejected.
 *
 * @note Cold-path: Allocates std::unordered_map for parsed results.
 */

#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace zfree {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;    ///< Flag string, e.g. "-k"
  std::uint8_t nargs;       ///< Number of values required after the flag
  std::string_view desc{};  ///< Description for help output (optional)
  std::string_view alias{}; ///< Alternate spelling, e.g. "--kibi" (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

namespace detail {

/// Flag and alias joined for display (e.g. "-k, --kibi").
inline std::string displayName(const ArgDef& def) {
  if (def.alias.empty()) {
    return std::string(def.flag);
  }
  return fmt::format("{}, {}", def.flag, def.alias);
}

/// Display name with a value placeholder for flags that take one.
inline std::string usageName(const ArgDef& def) {
  std::string out = displayName(def);
  for (std::uint8_t i = 0; i < def.nargs; ++i) {
    out.append(" <value>");
  }
  return out;
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag (or its alias) is matched, the next nargs tokens are taken
 * literally as its values. A repeated flag replaces its earlier values.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Definitions of accepted flags.
 * @param pargs  Output map of parsed values.
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on an unknown token or a missing value.
 * @note Cold-path: Allocates internally.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  const auto fail = [&error](std::string message) {
    if (error) {
      error->get() = std::move(message);
    }
    return false;
  };

  // Flag or alias -> key
  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size() * 2);
  for (const auto& [key, def] : map) {
    lut.emplace(def.flag, key);
    if (!def.alias.empty()) {
      lut.emplace(def.alias, key);
    }
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = lut.find(args[i]);
    if (IT == lut.end()) {
      return fail(fmt::format("Unrecognized argument: '{}'", args[i]));
    }

    const std::uint8_t KEY = IT->second;
    const std::size_t NEED = map.at(KEY).nargs;
    if (args.size() - i - 1 < NEED) {
      return fail(fmt::format("Expected {} value(s) for flag '{}'", NEED, args[i]));
    }

    std::vector<std::string_view>& values = pargs[KEY];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + NEED));
    i += NEED;
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 *
 * Options are listed in key order so related flags stay grouped.
 *
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 * @note Cold-path: Performs I/O.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<std::pair<std::uint8_t, std::string>> entries;
  entries.reserve(map.size());
  std::size_t nameWidth = 0;
  for (const auto& [key, def] : map) {
    entries.emplace_back(key, detail::usageName(def));
    nameWidth = std::max(nameWidth, entries.back().second.size());
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  nameWidth = std::clamp<std::size_t>(nameWidth, 16, 30);

  for (const auto& [key, name] : entries) {
    fmt::print("  {:<{}}  {}\n", name, nameWidth, map.at(key).desc);
  }
}

} // namespace args
} // namespace helpers
} // namespace zfree

#endif // ZFREE_HELPERS_ARGS_HPP
