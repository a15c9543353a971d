/**
 * @file capture.cpp
 * @brief Capped stdin capture with stdout mirroring
 */

#include "teeclip/capture.h"
#include "teeclip/log.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <vector>

namespace teeclip {

namespace {

/// Write all of [data, data+size) to fd; false on any error
bool write_all(int fd, const char *data, size_t size) {
  while (size > 0) {
    ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

} // namespace

Result<void> check_piped_input(int fd) {
  struct stat st;
  if (::fstat(fd, &st) != 0) {
    return Error(ErrorCode::InputError, "unable to stat stdin",
                 std::strerror(errno));
  }

  if (S_ISCHR(st.st_mode)) {
    return Error(ErrorCode::NoPipedInput, "No piped input detected");
  }

  return Result<void>::ok();
}

Result<CaptureResult> capture_input(const CaptureOptions &options) {
  auto log = logging::diag();

  CaptureResult result;
  bool mirroring = options.mirror;
  std::vector<char> buf(IO_CHUNK_SIZE);

  while (result.content.size() < options.limit) {
    size_t want =
        std::min(buf.size(), options.limit - result.content.size());
    ssize_t n = ::read(options.input_fd, buf.data(), want);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Error(ErrorCode::InputError, "read stdin", std::strerror(errno));
    }
    if (n == 0) {
      break;
    }

    auto count = static_cast<size_t>(n);
    if (mirroring && !write_all(options.mirror_fd, buf.data(), count)) {
      log->warn("stopped mirroring input to stdout: {}", std::strerror(errno));
      mirroring = false;
      result.mirror_failed = true;
    }
    result.content.append(buf.data(), count);
  }

  // Input of exactly the limit is complete; only a further byte means loss
  if (result.content.size() >= options.limit) {
    char extra;
    ssize_t n;
    do {
      n = ::read(options.input_fd, &extra, 1);
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
      result.truncated = true;
      log->debug("input limit of {} bytes reached; further input ignored",
                 options.limit);
    } else if (n < 0) {
      log->debug("read past input limit failed: {}", std::strerror(errno));
    }
  }

  return result;
}

} // namespace teeclip
