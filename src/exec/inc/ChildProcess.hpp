#ifndef GPUWATCH_EXEC_CHILD_PROCESS_HPP
#define GPUWATCH_EXEC_CHILD_PROCESS_HPP
/**
 * @file ChildProcess.hpp
 * @brief Time-bounded child process execution (Linux).
 * @note Linux-only. Uses fork/execv/pipe/poll/waitpid.
 * @note Thread-safe: Functions hold no shared state. Not async-signal-safe.
 *
 * Two entry points:
 *  - runCommand(): exec an external program and capture its stdout.
 *  - callInChild(): run a function in a forked child and copy back a
 *    trivially copyable result over a pipe.
 *
 * Both kill the child with SIGKILL once the deadline passes, so a hung
 * driver or diagnostic tool never blocks the caller beyond the timeout.
 */

#include <fcntl.h>     // O_CLOEXEC
#include <sys/types.h> // pid_t
#include <unistd.h>    // fork, pipe2, _exit, write, close

#include <chrono>      // std::chrono
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <string>      // std::string
#include <type_traits> // std::is_trivially_copyable_v
#include <vector>      // std::vector

namespace gpuwatch {

namespace exec {

/* ----------------------------- Constants ----------------------------- */

/// Captured stdout is truncated beyond this many bytes.
inline constexpr std::size_t MAX_CAPTURE_BYTES = 1024 * 1024;

/* ----------------------------- ExecStatus ----------------------------- */

/**
 * @brief Status codes for child process operations.
 */
enum class ExecStatus : std::uint8_t {
  OK = 0,       ///< Child ran to completion (check exit code separately)
  SPAWN_FAILED, ///< pipe() or fork() failed
  EXEC_FAILED,  ///< execv() failed (binary missing or not executable)
  TIMEOUT,      ///< Deadline passed; child was killed
  IO_ERROR,     ///< Reading the child's output failed or was short
};

/**
 * @brief Human-readable status string.
 */
[[nodiscard]] const char* toString(ExecStatus status) noexcept;

/* ----------------------------- CommandResult ----------------------------- */

/**
 * @brief Outcome of runCommand().
 */
struct CommandResult {
  ExecStatus status{ExecStatus::SPAWN_FAILED}; ///< Spawn/IO outcome
  int exitCode{-1};                            ///< Exit status, -1 if not exited normally
  std::string output;                          ///< Captured stdout

  /// @brief True if the child ran and exited with status 0.
  [[nodiscard]] bool succeeded() const noexcept {
    return status == ExecStatus::OK && exitCode == 0;
  }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Run an executable and capture its stdout.
 * @param argv    argv[0] must be a path to the executable; remaining entries
 *                are passed through unchanged (no shell).
 * @param timeout Upper bound on total runtime including output drain.
 * @return Result with status, exit code and stdout text.
 * @note stdin and stderr of the child are redirected to /dev/null.
 */
[[nodiscard]] CommandResult runCommand(const std::vector<std::string>& argv,
                                       std::chrono::milliseconds timeout);

namespace detail {

/// Read exactly len bytes from fd before deadline.
[[nodiscard]] ExecStatus readExact(int fd, void* data, std::size_t len,
                                   std::chrono::steady_clock::time_point deadline) noexcept;

/// Write all bytes to fd, retrying on EINTR. Used in the child only.
bool writeAll(int fd, const void* data, std::size_t len) noexcept;

/// Wait for the child until deadline, then SIGKILL and reap.
/// @return Exit code if it exited normally, -1 otherwise.
int reap(pid_t pid, std::chrono::steady_clock::time_point deadline) noexcept;

} // namespace detail

/**
 * @brief Run fn(out) in a forked child and copy the result back.
 * @tparam MsgT Trivially copyable result type.
 * @tparam Fn   Callable taking MsgT&.
 * @param fn      Work to run in the child. Must not rely on parent state it mutates.
 * @param out     Receives the child's result on OK; untouched otherwise.
 * @param timeout Upper bound on child runtime.
 * @return OK, SPAWN_FAILED, TIMEOUT or IO_ERROR.
 */
template <typename MsgT, typename Fn>
[[nodiscard]] ExecStatus callInChild(Fn&& fn, MsgT& out, std::chrono::milliseconds timeout) {
  static_assert(std::is_trivially_copyable_v<MsgT>, "callInChild result must be POD-like");

  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;

  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return ExecStatus::SPAWN_FAILED;
  }

  const pid_t PID = ::fork();
  if (PID < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    return ExecStatus::SPAWN_FAILED;
  }

  if (PID == 0) {
    ::close(fds[0]);
    MsgT msg{};
    fn(msg);
    const bool WROTE = detail::writeAll(fds[1], &msg, sizeof(MsgT));
    ::close(fds[1]);
    ::_exit(WROTE ? 0 : 1);
  }

  ::close(fds[1]);
  MsgT msg{};
  const ExecStatus STATUS = detail::readExact(fds[0], &msg, sizeof(MsgT), DEADLINE);
  ::close(fds[0]);
  (void)detail::reap(PID, STATUS == ExecStatus::OK ? DEADLINE : std::chrono::steady_clock::now());

  if (STATUS == ExecStatus::OK) {
    out = msg;
  }
  return STATUS;
}

} // namespace exec

} // namespace gpuwatch

#endif // GPUWATCH_EXEC_CHILD_PROCESS_HPP
