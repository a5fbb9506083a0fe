#ifndef GPUWATCH_HELPERS_ARGS_HPP
#define GPUWATCH_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing plus range-checked integer conversion for the
 * gpuwatch tools. Cold-path only.
 */

#include <algorithm>
#include <bitset>
#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace gpuwatch {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief One accepted command-line flag.
 */
struct ArgDef {
  std::string_view flag;   ///< e.g. "--interval"
  std::uint8_t nargs;      ///< Values consumed after the flag
  bool required;           ///< Parsing fails if absent
  std::string_view desc{}; ///< Help text
};

/// Tool-defined key -> flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Tool-defined key -> values given on the command line.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Match argv tokens against map.
 *
 * A matched flag takes the next nargs tokens verbatim. An unmatched token is
 * an error.
 *
 * @param args  Tokens after argv[0]; views must outlive pargs.
 * @param map   Accepted flags.
 * @param pargs Receives values per key; a repeated flag keeps its last values.
 * @param error Receives a message on failure, if given.
 * @return false on an unknown flag, missing value, or missing required flag.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, KV.first);
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    const std::string_view TOK = args[i];
    auto it = lut.find(TOK);
    if (it == lut.end()) {
      if (error) {
        error->get() = fmt::format("Unknown argument '{}'", TOK);
      }
      return false;
    }

    const std::uint8_t KEY = it->second;
    const ArgDef& DEF = map.at(KEY);

    if (DEF.nargs > 0 && i + static_cast<std::size_t>(DEF.nargs) >= N) {
      if (error) {
        error->get() =
            fmt::format("Flag '{}' expects {} value(s)", DEF.flag, static_cast<int>(DEF.nargs));
      }
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    out.reserve(DEF.nargs);
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Convert a flag value to an integer within [lo, hi].
 * @param text Token to convert (whole token must be numeric).
 * @param lo   Inclusive lower bound.
 * @param hi   Inclusive upper bound.
 * @return Parsed value, or std::nullopt if not numeric or out of range.
 */
[[nodiscard]] inline std::optional<int> parseIntInRange(std::string_view text, int lo,
                                                        int hi) noexcept {
  int value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto RES = std::from_chars(first, last, value);
  if (RES.ec != std::errc{} || RES.ptr != last) {
    return std::nullopt;
  }
  if (value < lo || value > hi) {
    return std::nullopt;
  }
  return value;
}

/**
 * @brief Print "Usage:" text with flags sorted by name.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  std::size_t flagWidth = 16;
  for (const ArgDef* def : entries) {
    const std::size_t WIDTH = def->flag.size() + (def->nargs > 0 ? 8 : 0);
    flagWidth = std::max(flagWidth, WIDTH);
  }
  flagWidth = std::min<std::size_t>(flagWidth, 30);

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs > 0) {
      flagStr.append(" <value>");
    }
    fmt::print("  {:<{}}  {}{}\n", flagStr, flagWidth, def->desc,
               def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace gpuwatch

#endif // GPUWATCH_HELPERS_ARGS_HPP
