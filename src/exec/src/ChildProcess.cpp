/**
 * @file ChildProcess.cpp
 * @brief Time-bounded fork/exec with stdout capture (Linux).
 * @note exec failure is reported through a CLOEXEC status pipe: the pipe
 *       closes silently on a successful exec and carries errno otherwise.
 */

#include "src/exec/inc/ChildProcess.hpp"

#include <fcntl.h>    // open, O_RDWR
#include <poll.h>     // poll, pollfd
#include <signal.h>   // kill, SIGKILL
#include <sys/wait.h> // waitpid, WIFEXITED, WEXITSTATUS

#include <array>  // std::array
#include <cerrno> // errno, EINTR
#include <thread> // std::this_thread::sleep_for

namespace gpuwatch {

namespace exec {

namespace {

using Clock = std::chrono::steady_clock;

/// Interval between non-blocking waitpid() checks.
constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{5};

/// Milliseconds left until deadline, clamped to [0, INT_MAX].
int remainingMs(Clock::time_point deadline) noexcept {
  const auto LEFT =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  if (LEFT <= 0) {
    return 0;
  }
  return LEFT > 0x7fffffff ? 0x7fffffff : static_cast<int>(LEFT);
}

/// Wait for fd readability until deadline.
/// @return 1 readable/hung-up, 0 timed out, -1 error.
int waitReadable(int fd, Clock::time_point deadline) noexcept {
  while (true) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int RC = ::poll(&pfd, 1, remainingMs(deadline));
    if (RC < 0) {
      if (errno == EINTR) {
        if (Clock::now() >= deadline) {
          return 0;
        }
        continue;
      }
      return -1;
    }
    return RC == 0 ? 0 : 1;
  }
}

/// Child side of runCommand(): wire up fds and exec. Never returns.
[[noreturn]] void execChild(const std::vector<std::string>& argv, int outFd, int statusFd) {
  const int NULL_FD = ::open("/dev/null", O_RDWR | O_CLOEXEC);
  if (NULL_FD >= 0) {
    ::dup2(NULL_FD, STDIN_FILENO);
    ::dup2(NULL_FD, STDERR_FILENO);
  }
  ::dup2(outFd, STDOUT_FILENO);

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  ::execv(cargv[0], cargv.data());

  const int ERR = errno;
  (void)detail::writeAll(statusFd, &ERR, sizeof(ERR));
  ::_exit(127);
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ExecStatus status) noexcept {
  switch (status) {
  case ExecStatus::OK:
    return "OK";
  case ExecStatus::SPAWN_FAILED:
    return "SPAWN_FAILED";
  case ExecStatus::EXEC_FAILED:
    return "EXEC_FAILED";
  case ExecStatus::TIMEOUT:
    return "TIMEOUT";
  case ExecStatus::IO_ERROR:
    return "IO_ERROR";
  }
  return "UNKNOWN";
}

/* ----------------------------- detail ----------------------------- */

namespace detail {

ExecStatus readExact(int fd, void* data, std::size_t len, Clock::time_point deadline) noexcept {
  auto* p = static_cast<unsigned char*>(data);
  std::size_t got = 0;
  while (got < len) {
    const int READY = waitReadable(fd, deadline);
    if (READY == 0) {
      return ExecStatus::TIMEOUT;
    }
    if (READY < 0) {
      return ExecStatus::IO_ERROR;
    }
    const ssize_t N = ::read(fd, p + got, len - got);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      return ExecStatus::IO_ERROR;
    }
    if (N == 0) {
      return ExecStatus::IO_ERROR;
    }
    got += static_cast<std::size_t>(N);
  }
  return ExecStatus::OK;
}

bool writeAll(int fd, const void* data, std::size_t len) noexcept {
  const auto* p = static_cast<const unsigned char*>(data);
  std::size_t sent = 0;
  while (sent < len) {
    const ssize_t N = ::write(fd, p + sent, len - sent);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<std::size_t>(N);
  }
  return true;
}

int reap(pid_t pid, Clock::time_point deadline) noexcept {
  int status = 0;
  while (true) {
    const pid_t RC = ::waitpid(pid, &status, WNOHANG);
    if (RC == pid) {
      return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
    if (RC < 0 && errno != EINTR) {
      return -1;
    }
    if (Clock::now() >= deadline) {
      ::kill(pid, SIGKILL);
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      return -1;
    }
    std::this_thread::sleep_for(REAP_POLL_INTERVAL);
  }
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

CommandResult runCommand(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
  CommandResult result{};
  if (argv.empty() || argv.front().empty()) {
    result.status = ExecStatus::EXEC_FAILED;
    return result;
  }

  const auto DEADLINE = Clock::now() + timeout;

  int outPipe[2] = {-1, -1};
  int statusPipe[2] = {-1, -1};
  if (::pipe2(outPipe, O_CLOEXEC) != 0) {
    result.status = ExecStatus::SPAWN_FAILED;
    return result;
  }
  if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    result.status = ExecStatus::SPAWN_FAILED;
    return result;
  }

  const pid_t PID = ::fork();
  if (PID < 0) {
    ::close(outPipe[0]);
    ::close(outPipe[1]);
    ::close(statusPipe[0]);
    ::close(statusPipe[1]);
    result.status = ExecStatus::SPAWN_FAILED;
    return result;
  }

  if (PID == 0) {
    ::close(outPipe[0]);
    ::close(statusPipe[0]);
    execChild(argv, outPipe[1], statusPipe[1]);
  }

  ::close(outPipe[1]);
  ::close(statusPipe[1]);

  // Closed without data on successful exec; carries errno on failure.
  int execErrno = 0;
  const ExecStatus EXEC_STATUS = detail::readExact(statusPipe[0], &execErrno, sizeof(execErrno),
                                                   DEADLINE);
  ::close(statusPipe[0]);
  if (EXEC_STATUS == ExecStatus::OK) {
    ::close(outPipe[0]);
    (void)detail::reap(PID, Clock::now());
    result.status = ExecStatus::EXEC_FAILED;
    return result;
  }
  if (EXEC_STATUS == ExecStatus::TIMEOUT) {
    ::close(outPipe[0]);
    (void)detail::reap(PID, Clock::now());
    result.status = ExecStatus::TIMEOUT;
    return result;
  }

  std::array<char, 4096> buf{};
  result.status = ExecStatus::OK;
  while (true) {
    const int READY = waitReadable(outPipe[0], DEADLINE);
    if (READY == 0) {
      result.status = ExecStatus::TIMEOUT;
      break;
    }
    if (READY < 0) {
      result.status = ExecStatus::IO_ERROR;
      break;
    }
    const ssize_t N = ::read(outPipe[0], buf.data(), buf.size());
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.status = ExecStatus::IO_ERROR;
      break;
    }
    if (N == 0) {
      break;
    }
    if (result.output.size() < MAX_CAPTURE_BYTES) {
      result.output.append(buf.data(), static_cast<std::size_t>(N));
    }
  }
  ::close(outPipe[0]);

  if (result.status != ExecStatus::OK) {
    (void)detail::reap(PID, Clock::now());
    result.output.clear();
    return result;
  }

  result.exitCode = detail::reap(PID, DEADLINE);
  if (result.exitCode < 0 && Clock::now() >= DEADLINE) {
    result.status = ExecStatus::TIMEOUT;
  }
  return result;
}

} // namespace exec

} // namespace gpuwatch
