/**
 * @file subprocess.h
 * @brief Scoped child process with a piped stdin and captured stderr
 *
 * Internal to the Linux platform layer. A Subprocess owns its pipes and its
 * pid: destroying a handle whose child was never waited for kills and reaps
 * the child, so no zombie or half-fed helper outlives the call.
 */

#ifndef TEECLIP_PLATFORM_LINUX_SUBPROCESS_H
#define TEECLIP_PLATFORM_LINUX_SUBPROCESS_H

#include "teeclip/error.h"
#include "teeclip/types.h"
#include "unique_fd.h"
#include <string>
#include <sys/types.h>
#include <vector>

namespace teeclip {
namespace platform {

/**
 * @brief How the child's standard streams are wired
 */
struct SpawnOptions {
  /// Give the child a pipe on stdin (otherwise /dev/null)
  bool pipe_stdin = true;

  /// Capture the child's stderr (otherwise /dev/null)
  bool capture_stderr = true;

  /// Maximum stderr bytes kept; the rest is read and discarded
  size_t stderr_limit = MAX_HELPER_STDERR;
};

/**
 * @brief How a child process ended
 */
struct ExitStatus {
  bool exited = false; // Normal exit (code is valid)
  int code = 0;
  int signal = 0; // Terminating signal when !exited

  bool success() const { return exited && code == 0; }

  /// "exit status 1", "killed by signal 9"
  std::string describe() const;
};

class Subprocess {
public:
  Subprocess() = default;
  ~Subprocess();

  // Move-only
  Subprocess(Subprocess &&other) noexcept;
  Subprocess &operator=(Subprocess &&other) noexcept;
  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  /**
   * @brief Start @p path with @p args (argv[0] is derived from the path)
   *
   * The environment is inherited. Exec failures are reported here, not as
   * an exit status, through a close-on-exec status pipe.
   *
   * @return Running process or HelperSpawnError
   */
  static Result<Subprocess> spawn(const std::string &path,
                                  const std::vector<std::string> &args,
                                  const SpawnOptions &options = {});

  /**
   * @brief Write all of @p data to the child's stdin
   *
   * Stderr is drained while writing so a chatty child cannot block on a
   * full pipe. Does not close stdin.
   *
   * @return Success or HelperWriteError (EPIPE included)
   */
  Result<void> write_input(const std::string &data);

  /// Close the child's stdin, signalling end of input
  void close_input();

  /**
   * @brief Close stdin and wait for the child to exit
   *
   * Stderr is read until the child exits, then drained without blocking.
   * A grandchild that inherited the stderr pipe therefore cannot stall
   * the wait.
   */
  Result<ExitStatus> wait();

  /// Send SIGKILL and reap the child
  void kill();

  /// Captured stderr (up to stderr_limit bytes)
  const std::string &stderr_output() const { return stderr_; }

  pid_t pid() const { return pid_; }

  bool running() const { return pid_ > 0 && !reaped_; }

private:
  void drain_stderr();
  void reap(int flags);

  pid_t pid_ = -1;
  bool reaped_ = false;
  ExitStatus status_;
  UniqueFd stdin_;
  UniqueFd stderr_fd_;
  std::string stderr_;
  size_t stderr_limit_ = MAX_HELPER_STDERR;
};

} // namespace platform
} // namespace teeclip

#endif // TEECLIP_PLATFORM_LINUX_SUBPROCESS_H
