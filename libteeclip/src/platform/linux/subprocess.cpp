/**
 * @file subprocess.cpp
 * @brief fork/exec based child process handling
 */

#include "subprocess.h"
#include "teeclip/log.h"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace teeclip {
namespace platform {

namespace {

// Poll interval while waiting for the child and reading its stderr
constexpr int WAIT_POLL_MS = 50;

std::string errno_string(int err) { return std::strerror(err); }

std::string base_name(const std::string &path) {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

/**
 * @brief Send errno to the parent over the status pipe
 *
 * Only async-signal-safe calls are allowed between fork and exec.
 */
void child_report_errno(int fd, int err) {
  const char *p = reinterpret_cast<const char *>(&err);
  size_t left = sizeof(err);
  while (left > 0) {
    ssize_t n = ::write(fd, p, left);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
}

} // namespace

// ============================================================================
// ExitStatus
// ============================================================================

std::string ExitStatus::describe() const {
  if (exited) {
    return "exit status " + std::to_string(code);
  }
  return "killed by signal " + std::to_string(signal);
}

// ============================================================================
// Lifetime
// ============================================================================

Subprocess::~Subprocess() {
  if (running()) {
    kill();
  }
}

Subprocess::Subprocess(Subprocess &&other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), status_(other.status_),
      stdin_(std::move(other.stdin_)), stderr_fd_(std::move(other.stderr_fd_)),
      stderr_(std::move(other.stderr_)), stderr_limit_(other.stderr_limit_) {
  other.pid_ = -1;
  other.reaped_ = false;
}

Subprocess &Subprocess::operator=(Subprocess &&other) noexcept {
  if (this != &other) {
    if (running()) {
      kill();
    }
    pid_ = other.pid_;
    reaped_ = other.reaped_;
    status_ = other.status_;
    stdin_ = std::move(other.stdin_);
    stderr_fd_ = std::move(other.stderr_fd_);
    stderr_ = std::move(other.stderr_);
    stderr_limit_ = other.stderr_limit_;
    other.pid_ = -1;
    other.reaped_ = false;
  }
  return *this;
}

// ============================================================================
// Spawn
// ============================================================================

Result<Subprocess> Subprocess::spawn(const std::string &path,
                                     const std::vector<std::string> &args,
                                     const SpawnOptions &options) {
  auto log = logging::diag();

  // argv must be built before fork; the child may not allocate
  std::string argv0 = base_name(path);
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(argv0.c_str()));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int status_pipe[2];
  if (pipe2(status_pipe, O_CLOEXEC) < 0) {
    return Error(ErrorCode::HelperSpawnError, path + ": status pipe",
                 errno_string(errno));
  }
  UniqueFd status_read(status_pipe[0]);
  UniqueFd status_write(status_pipe[1]);

  UniqueFd stdin_read, stdin_write;
  if (options.pipe_stdin) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
      return Error(ErrorCode::HelperSpawnError, path + ": stdin pipe",
                   errno_string(errno));
    }
    stdin_read.reset(fds[0]);
    stdin_write.reset(fds[1]);
  }

  UniqueFd stderr_read, stderr_write;
  if (options.capture_stderr) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
      return Error(ErrorCode::HelperSpawnError, path + ": stderr pipe",
                   errno_string(errno));
    }
    stderr_read.reset(fds[0]);
    stderr_write.reset(fds[1]);
  }

  UniqueFd dev_null(::open("/dev/null", O_RDWR | O_CLOEXEC));
  if (!dev_null) {
    return Error(ErrorCode::HelperSpawnError, path + ": open /dev/null",
                 errno_string(errno));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    return Error(ErrorCode::HelperSpawnError, path + ": fork",
                 errno_string(errno));
  }

  if (pid == 0) {
    // Child. dup2 clears O_CLOEXEC on the target descriptor.
    int in_fd = stdin_read ? stdin_read.get() : dev_null.get();
    int err_fd = stderr_write ? stderr_write.get() : dev_null.get();
    if (::dup2(in_fd, STDIN_FILENO) < 0 ||
        ::dup2(dev_null.get(), STDOUT_FILENO) < 0 ||
        ::dup2(err_fd, STDERR_FILENO) < 0) {
      child_report_errno(status_write.get(), errno);
      ::_exit(127);
    }
    // The parent ignores SIGPIPE; ignored dispositions survive exec
    ::signal(SIGPIPE, SIG_DFL);
    ::execv(path.c_str(), argv.data());
    child_report_errno(status_write.get(), errno);
    ::_exit(127);
  }

  // Parent
  status_write.reset();
  stdin_read.reset();
  stderr_write.reset();

  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(status_read.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);

  if (n > 0) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return Error(ErrorCode::HelperSpawnError, path + ": start",
                 errno_string(exec_errno));
  }

  log->debug("spawned {} (pid {})", argv0, pid);

  Subprocess proc;
  proc.pid_ = pid;
  proc.stdin_ = std::move(stdin_write);
  proc.stderr_fd_ = std::move(stderr_read);
  proc.stderr_limit_ = options.stderr_limit;

  if (proc.stdin_ && !set_nonblocking(proc.stdin_.get())) {
    return Error(ErrorCode::HelperSpawnError, path + ": stdin pipe",
                 errno_string(errno));
  }
  if (proc.stderr_fd_ && !set_nonblocking(proc.stderr_fd_.get())) {
    return Error(ErrorCode::HelperSpawnError, path + ": stderr pipe",
                 errno_string(errno));
  }

  return Result<Subprocess>(std::move(proc));
}

// ============================================================================
// I/O
// ============================================================================

Result<void> Subprocess::write_input(const std::string &data) {
  if (!stdin_) {
    return Error(ErrorCode::HelperWriteError, "stdin is not a pipe");
  }

  size_t offset = 0;
  while (offset < data.size()) {
    pollfd fds[2];
    nfds_t count = 1;
    fds[0].fd = stdin_.get();
    fds[0].events = POLLOUT;
    fds[0].revents = 0;
    if (stderr_fd_) {
      fds[1].fd = stderr_fd_.get();
      fds[1].events = POLLIN;
      fds[1].revents = 0;
      count = 2;
    }

    if (::poll(fds, count, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Error(ErrorCode::HelperWriteError, "poll", errno_string(errno));
    }

    if (count == 2 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
      drain_stderr();
    }

    if (fds[0].revents & (POLLOUT | POLLERR | POLLHUP)) {
      ssize_t n =
          ::write(stdin_.get(), data.data() + offset, data.size() - offset);
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
          continue;
        }
        return Error(ErrorCode::HelperWriteError, "write stdin",
                     errno_string(errno));
      }
      offset += static_cast<size_t>(n);
    }
  }

  return Result<void>::ok();
}

void Subprocess::close_input() { stdin_.reset(); }

void Subprocess::drain_stderr() {
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(stderr_fd_.get(), buf, sizeof(buf));
    if (n > 0) {
      size_t room = stderr_limit_ > stderr_.size()
                        ? stderr_limit_ - stderr_.size()
                        : 0;
      stderr_.append(buf, std::min(room, static_cast<size_t>(n)));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n == 0) {
      // Every writer is gone
      stderr_fd_.reset();
    }
    return;
  }
}

// ============================================================================
// Wait / Kill
// ============================================================================

void Subprocess::reap(int flags) {
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, flags);
  } while (r < 0 && errno == EINTR);

  if (r != pid_) {
    if (r < 0) {
      // Already reaped elsewhere (ECHILD); nothing left to wait for
      reaped_ = true;
    }
    return;
  }

  reaped_ = true;
  if (WIFEXITED(status)) {
    status_.exited = true;
    status_.code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    status_.exited = false;
    status_.signal = WTERMSIG(status);
  }
}

Result<ExitStatus> Subprocess::wait() {
  if (pid_ <= 0) {
    return Error(ErrorCode::HelperExitError, "process was never started");
  }

  close_input();

  while (!reaped_) {
    reap(WNOHANG);
    if (reaped_) {
      break;
    }

    if (stderr_fd_) {
      pollfd pfd;
      pfd.fd = stderr_fd_.get();
      pfd.events = POLLIN;
      pfd.revents = 0;
      int r = ::poll(&pfd, 1, WAIT_POLL_MS);
      if (r > 0) {
        drain_stderr();
      } else if (r < 0 && errno != EINTR) {
        return Error(ErrorCode::HelperExitError, "poll", errno_string(errno));
      }
    } else {
      reap(0);
    }
  }

  // Pick up whatever the child wrote right before exiting. Descendants
  // may still hold the pipe open, so never block here.
  if (stderr_fd_) {
    drain_stderr();
    stderr_fd_.reset();
  }

  return status_;
}

void Subprocess::kill() {
  if (!running()) {
    return;
  }
  close_input();
  ::kill(pid_, SIGKILL);
  reap(0);
  stderr_fd_.reset();
  logging::diag()->debug("killed pid {}", pid_);
}

} // namespace platform
} // namespace teeclip
