#ifndef GPUWATCH_HELPERS_FILES_HPP
#define GPUWATCH_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief File and executable lookup helpers.
 *
 * Uses open/read/close and stat/access directly; no iostreams.
 */

#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <sys/stat.h> // stat, S_ISREG
#include <unistd.h>   // read, close, access

#include <array>
#include <cstddef>
#include <cstdlib> // getenv
#include <string>
#include <string_view>

namespace gpuwatch {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Buffer size for single-line pseudo-file reads (/proc/<pid>/comm etc.).
inline constexpr std::size_t LINE_READ_BUFFER_SIZE = 256;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read the first line of a small file.
 * @param path File path to read.
 * @return First line without the newline; empty on error.
 */
[[nodiscard]] inline std::string readFirstLine(const char* path) {
  if (path == nullptr) {
    return {};
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return {};
  }

  std::array<char, LINE_READ_BUFFER_SIZE> buf{};
  std::size_t total = 0;
  while (total < buf.size()) {
    const ssize_t N = ::read(FD, buf.data() + total, buf.size() - total);
    if (N <= 0) {
      break;
    }
    total += static_cast<std::size_t>(N);
  }
  ::close(FD);

  std::string_view text(buf.data(), total);
  const std::size_t EOL = text.find_first_of("\r\n");
  if (EOL != std::string_view::npos) {
    text = text.substr(0, EOL);
  }
  return std::string(text);
}

/* ----------------------------- Path Utilities ----------------------------- */

/**
 * @brief Check if path is a regular file the caller may execute.
 */
[[nodiscard]] inline bool isExecutableFile(const char* path) noexcept {
  if (path == nullptr || *path == '\0') {
    return false;
  }
  struct stat st{};
  if (::stat(path, &st) != 0 || !S_ISREG(st.st_mode)) {
    return false;
  }
  return ::access(path, X_OK) == 0;
}

/**
 * @brief Resolve an executable name against $PATH.
 * @param name Bare executable name (no slash).
 * @return Absolute path of the first executable match, or empty.
 */
[[nodiscard]] inline std::string findInPath(std::string_view name) {
  const char* env = std::getenv("PATH");
  if (env == nullptr || name.empty()) {
    return {};
  }

  const std::string_view PATH(env);
  std::size_t start = 0;
  while (start <= PATH.size()) {
    std::size_t end = PATH.find(':', start);
    if (end == std::string_view::npos) {
      end = PATH.size();
    }
    const std::string_view DIR = PATH.substr(start, end - start);
    if (!DIR.empty()) {
      std::string candidate(DIR);
      candidate.push_back('/');
      candidate.append(name);
      if (isExecutableFile(candidate.c_str())) {
        return candidate;
      }
    }
    start = end + 1;
  }
  return {};
}

} // namespace files
} // namespace helpers
} // namespace gpuwatch

#endif // GPUWATCH_HELPERS_FILES_HPP
