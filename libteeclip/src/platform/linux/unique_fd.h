/**
 * @file unique_fd.h
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Used for subprocess pipes and the terminal device so that every exit
 * path, error paths included, releases the descriptor.
 */

#ifndef TEECLIP_PLATFORM_LINUX_UNIQUE_FD_H
#define TEECLIP_PLATFORM_LINUX_UNIQUE_FD_H

#include <unistd.h>

namespace teeclip {
namespace platform {

class UniqueFd {
public:
  UniqueFd() = default;

  explicit UniqueFd(int fd) : fd_(fd) {}

  ~UniqueFd() { reset(); }

  // Move-only
  UniqueFd(UniqueFd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  explicit operator bool() const { return valid(); }

  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

} // namespace platform
} // namespace teeclip

#endif // TEECLIP_PLATFORM_LINUX_UNIQUE_FD_H
