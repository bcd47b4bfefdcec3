#include "rpc/process_transport.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <thread>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace status_poller::rpc {
namespace {

using steady_clock = std::chrono::steady_clock;

constexpr std::size_t kReadChunkSize = 4096;
constexpr std::chrono::milliseconds kReapPollInterval{5};

class FdGuard {
 public:
  explicit FdGuard(const int fd = -1) noexcept : fd_(fd) {}
  ~FdGuard() { reset(); }

  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const noexcept { return fd_; }

  void reset() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

std::string errno_message(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

bool send_all(const int fd, const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

// Waits for the child until the deadline, then kills its process group.
int reap(const pid_t pid, const steady_clock::time_point deadline) {
  int status = 0;
  while (true) {
    const pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      return status;
    }
    if (done < 0 && errno != EINTR) {
      return -1;
    }
    if (steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }

  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  return status;
}

std::string describe_exit(const int status) {
  if (status < 0) {
    return "backend command could not be reaped";
  }
  if (WIFEXITED(status)) {
    return "backend command exited with status " + std::to_string(WEXITSTATUS(status)) + " and no response";
  }
  if (WIFSIGNALED(status)) {
    return "backend command terminated by signal " + std::to_string(WTERMSIG(status));
  }
  return "backend command produced no response";
}

}  // namespace

ProcessTransport::ProcessTransport(ProcessTransportOptions options) : options_(std::move(options)) {}

bool ProcessTransport::exchange(const std::string& request_line, std::string& response_line, std::string& error) {
  response_line.clear();
  error.clear();

  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    error = errno_message("socketpair failed");
    return false;
  }
  FdGuard parent_end(fds[0]);
  FdGuard child_end(fds[1]);

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = errno_message("fork failed");
    return false;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(child_end.get(), STDIN_FILENO);
    ::dup2(child_end.get(), STDOUT_FILENO);
    ::execl("/bin/sh", "sh", "-c", options_.command.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  child_end.reset();
  const auto deadline = steady_clock::now() + options_.timeout;

  // A child that exits without reading is judged by its output alone.
  const bool request_sent = send_all(parent_end.get(), request_line + '\n');
  ::shutdown(parent_end.get(), SHUT_WR);

  std::string buffer;
  bool timed_out = false;
  bool read_failed = false;
  char chunk[kReadChunkSize];
  while (buffer.find('\n') == std::string::npos) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now()).count();
    if (remaining <= 0) {
      timed_out = true;
      break;
    }

    pollfd readable{};
    readable.fd = parent_end.get();
    readable.events = POLLIN;
    const int ready = ::poll(&readable, 1, static_cast<int>(remaining));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = errno_message("poll failed");
      read_failed = true;
      break;
    }
    if (ready == 0) {
      timed_out = true;
      break;
    }

    const ssize_t n = ::read(parent_end.get(), chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = errno_message("read failed");
      read_failed = true;
      break;
    }
    if (n == 0) {
      break;
    }
    buffer.append(chunk, static_cast<std::size_t>(n));
  }

  parent_end.reset();
  const int status = reap(pid, timed_out ? steady_clock::now() : deadline);

  if (timed_out) {
    error = "backend command timed out after " + std::to_string(options_.timeout.count()) + "ms";
    return false;
  }
  if (read_failed) {
    return false;
  }

  const auto newline = buffer.find('\n');
  response_line = newline == std::string::npos ? buffer : buffer.substr(0, newline);
  if (!response_line.empty() && response_line.back() == '\r') {
    response_line.pop_back();
  }

  if (response_line.empty()) {
    error = describe_exit(status);
    if (!request_sent) {
      error += " (request not delivered)";
    }
    return false;
  }

  return true;
}

}  // namespace status_poller::rpc
