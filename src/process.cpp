/**
 * @file process.cpp
 * @brief External process execution implementation
 */

#include "transync/process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace transync {

namespace {

/// Keep at most this much diagnostic output (the tail matters most)
constexpr size_t MAX_OUTPUT_BYTES = 16 * 1024;

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);
constexpr auto KILL_GRACE = std::chrono::seconds(2);

void append_tail(std::string &out, const char *buf, size_t n) {
  out.append(buf, n);
  if (out.size() > MAX_OUTPUT_BYTES)
    out.erase(0, out.size() - MAX_OUTPUT_BYTES);
}

} // anonymous namespace

std::string ProcessResult::describe() const {
  std::string text = output;
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
    text.pop_back();

  std::string status;
  if (!launched)
    status = "could not be started";
  else if (canceled)
    status = "canceled";
  else if (term_signal != 0)
    status = fmt::format("killed by signal {}", term_signal);
  else
    status = fmt::format("exit code {}", exit_code);

  return text.empty() ? status : fmt::format("{}: {}", status, text);
}

ProcessResult run_shell_command(const std::string &command,
                                const CancellationToken &token) {
  ProcessResult result;

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    result.output = fmt::format("pipe failed: {}", std::strerror(errno));
    return result;
  }

  pid_t pid = ::fork();
  if (pid == -1) {
    result.output = fmt::format("fork failed: {}", std::strerror(errno));
    ::close(fds[0]);
    ::close(fds[1]);
    return result;
  }

  if (pid == 0) {
    /// Child: own process group so cancellation can stop the whole tree
    ::setpgid(0, 0);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull != -1)
      ::dup2(devnull, STDIN_FILENO);
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  /// Parent
  ::setpgid(pid, pid);
  ::close(fds[1]);
  result.launched = true;

  bool eof = false;
  bool reaped = false;
  bool term_sent = false;
  bool kill_sent = false;
  int status = 0;
  auto term_time = std::chrono::steady_clock::now();
  char buf[4096];

  while (!(eof && reaped)) {
    if (!eof) {
      struct pollfd pfd {};
      pfd.fd = fds[0];
      pfd.events = POLLIN;
      int ready = ::poll(&pfd, 1, static_cast<int>(POLL_INTERVAL.count()));
      if (ready > 0) {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0)
          append_tail(result.output, buf, static_cast<size_t>(n));
        else if (n == 0 || (errno != EINTR && errno != EAGAIN))
          eof = true;
      } else if (ready == -1 && errno != EINTR) {
        eof = true;
      }
    } else {
      std::this_thread::sleep_for(POLL_INTERVAL);
    }

    if (!reaped) {
      pid_t w = ::waitpid(pid, &status, WNOHANG);
      if (w == pid || (w == -1 && errno == ECHILD)) {
        reaped = true;
        /// Grandchildren may still hold the pipe; don't wait on them
        if (!eof) {
          ssize_t n;
          int flags = ::fcntl(fds[0], F_GETFL);
          ::fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);
          while ((n = ::read(fds[0], buf, sizeof(buf))) > 0)
            append_tail(result.output, buf, static_cast<size_t>(n));
          eof = true;
        }
      }
    }

    if (!reaped && token.requested()) {
      auto now = std::chrono::steady_clock::now();
      if (!term_sent) {
        ::kill(-pid, SIGTERM);
        term_sent = true;
        term_time = now;
      } else if (!kill_sent && now - term_time >= KILL_GRACE) {
        ::kill(-pid, SIGKILL);
        kill_sent = true;
      }
    }
  }

  ::close(fds[0]);

  result.canceled = term_sent;
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

} // namespace transync
