#ifndef GPUWATCH_HELPERS_STRINGS_HPP
#define GPUWATCH_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for CSV parsing and fixed-width terminal cells.
 *
 * Width helpers decode UTF-8 and ask wcwidth() for each code point, so their
 * answers follow the LC_CTYPE locale. Wide CJK glyphs take two columns and
 * combining marks none. Code points the locale cannot classify (everything
 * non-ASCII under the "C" locale) and malformed bytes count as one column.
 */

#include <wchar.h> // wcwidth

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gpuwatch {
namespace helpers {
namespace strings {

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Trim leading and trailing whitespace (space, tab, CR, LF).
 * @param text Input view.
 * @return Sub-view without surrounding whitespace.
 */
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
  constexpr std::string_view WS = " \t\r\n";
  const std::size_t FIRST = text.find_first_not_of(WS);
  if (FIRST == std::string_view::npos) {
    return {};
  }
  const std::size_t LAST = text.find_last_not_of(WS);
  return text.substr(FIRST, LAST - FIRST + 1);
}

/**
 * @brief Split text on a delimiter, trimming each piece.
 * @param text  Input line.
 * @param delim Delimiter character.
 * @return Views into text; an empty input yields one empty field.
 */
[[nodiscard]] inline std::vector<std::string_view> splitTrimmed(std::string_view text,
                                                                char delim) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = text.find(delim, start);
    if (POS == std::string_view::npos) {
      out.push_back(trim(text.substr(start)));
      break;
    }
    out.push_back(trim(text.substr(start, POS - start)));
    start = POS + 1;
  }
  return out;
}

/**
 * @brief Split text into non-empty trimmed lines.
 */
[[nodiscard]] inline std::vector<std::string_view> nonEmptyLines(std::string_view text) {
  std::vector<std::string_view> out;
  for (std::string_view line : splitTrimmed(text, '\n')) {
    if (!line.empty()) {
      out.push_back(line);
    }
  }
  return out;
}

/**
 * @brief Last path component of a Unix or Windows style path.
 */
[[nodiscard]] inline std::string_view baseName(std::string_view path) noexcept {
  const std::size_t POS = path.find_last_of("/\\");
  return (POS == std::string_view::npos) ? path : path.substr(POS + 1);
}

/* ----------------------------- Terminal Width ----------------------------- */

/// One decoded UTF-8 sequence.
struct Utf8Glyph {
  std::uint32_t codePoint; ///< U+FFFD for malformed input
  std::size_t length;      ///< Bytes consumed, at least 1
};

/**
 * @brief Decode the UTF-8 sequence starting at text[pos].
 * @pre pos < text.size().
 */
[[nodiscard]] inline Utf8Glyph decodeUtf8(std::string_view text, std::size_t pos) noexcept {
  constexpr Utf8Glyph BAD{0xFFFDU, 1};
  const auto LEAD = static_cast<unsigned char>(text[pos]);

  std::size_t length = 0;
  std::uint32_t cp = 0;
  if (LEAD < 0x80U) {
    return {LEAD, 1};
  }
  if ((LEAD & 0xE0U) == 0xC0U) {
    length = 2;
    cp = LEAD & 0x1FU;
  } else if ((LEAD & 0xF0U) == 0xE0U) {
    length = 3;
    cp = LEAD & 0x0FU;
  } else if ((LEAD & 0xF8U) == 0xF0U) {
    length = 4;
    cp = LEAD & 0x07U;
  } else {
    return BAD;
  }

  if (pos + length > text.size()) {
    return BAD;
  }
  for (std::size_t k = 1; k < length; ++k) {
    const auto C = static_cast<unsigned char>(text[pos + k]);
    if ((C & 0xC0U) != 0x80U) {
      return BAD;
    }
    cp = (cp << 6U) | (C & 0x3FU);
  }
  if (cp > 0x10FFFFU) {
    return BAD;
  }
  return {cp, length};
}

/**
 * @brief Terminal columns of one code point (0, 1 or 2).
 */
[[nodiscard]] inline std::size_t columnWidth(std::uint32_t codePoint) noexcept {
  const int W = ::wcwidth(static_cast<wchar_t>(codePoint));
  return W < 0 ? 1U : static_cast<std::size_t>(W);
}

/**
 * @brief Number of terminal columns a UTF-8 string occupies.
 */
[[nodiscard]] inline std::size_t displayWidth(std::string_view text) noexcept {
  std::size_t width = 0;
  for (std::size_t i = 0; i < text.size();) {
    const Utf8Glyph G = decodeUtf8(text, i);
    width += columnWidth(G.codePoint);
    i += G.length;
  }
  return width;
}

/**
 * @brief Longest prefix of a UTF-8 string that fits in width columns.
 * @note A wide glyph that would straddle the limit is left out.
 */
[[nodiscard]] inline std::string_view clipToWidth(std::string_view text,
                                                  std::size_t width) noexcept {
  std::size_t cols = 0;
  for (std::size_t i = 0; i < text.size();) {
    const Utf8Glyph G = decodeUtf8(text, i);
    const std::size_t W = columnWidth(G.codePoint);
    if (cols + W > width) {
      return text.substr(0, i);
    }
    cols += W;
    i += G.length;
  }
  return text;
}

/**
 * @brief Truncate or right-pad a UTF-8 string to exactly width columns.
 * @param text  Input text.
 * @param width Target column count.
 * @return New string occupying exactly width columns.
 */
[[nodiscard]] inline std::string fitToWidth(std::string_view text, std::size_t width) {
  const std::string_view KEPT = clipToWidth(text, width);
  std::string out;
  out.reserve(KEPT.size() + width);
  out.append(KEPT);
  out.append(width - displayWidth(KEPT), ' ');
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace gpuwatch

#endif // GPUWATCH_HELPERS_STRINGS_HPP
