/**
 * @file osc52_linux.cpp
 * @brief OSC 52 encoding (libsodium base64) and terminal write
 */

#include "teeclip/osc52.h"
#include "teeclip/log.h"
#include "unique_fd.h"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sodium.h>
#include <unistd.h>

namespace teeclip {

namespace {

constexpr const char *OSC52_PREFIX = "\x1b]52;c;";
constexpr char OSC52_TERMINATOR = '\x07';

std::atomic<bool> g_sodium_ready{false};

} // namespace

Result<void> encoding_init() {
  if (g_sodium_ready.load()) {
    return Result<void>::ok();
  }

  if (sodium_init() < 0) {
    return Error(ErrorCode::EncodingError, "Failed to initialize libsodium");
  }

  g_sodium_ready.store(true);
  return Result<void>::ok();
}

Result<std::string> base64_encode(const Content &content) {
  TEECLIP_TRY(encoding_init());

  const int variant = sodium_base64_VARIANT_ORIGINAL;
  size_t encoded_len = sodium_base64_ENCODED_LEN(content.size(), variant);

  // encoded_len includes the trailing NUL
  std::string out(encoded_len, '\0');
  sodium_bin2base64(&out[0], out.size(),
                    reinterpret_cast<const unsigned char *>(content.data()),
                    content.size(), variant);
  out.resize(encoded_len - 1);
  return out;
}

Result<std::string> build_osc52_sequence(const Content &content) {
  auto encoded = base64_encode(content);
  if (encoded.is_error()) {
    return encoded.error();
  }

  std::string seq = OSC52_PREFIX;
  seq += encoded.value();
  seq += OSC52_TERMINATOR;
  return seq;
}

Result<void> write_osc52(const Content &content,
                         const std::filesystem::path &tty_path) {
  auto log = logging::diag();

  auto built = build_osc52_sequence(content);
  if (built.is_error()) {
    return built.error();
  }
  const std::string &seq = built.value();

  platform::UniqueFd tty(
      ::open(tty_path.c_str(), O_WRONLY | O_NOCTTY | O_CLOEXEC));
  if (!tty) {
    return Error(ErrorCode::TerminalUnavailableError,
                 "open " + tty_path.string(), std::strerror(errno));
  }

  log->debug("writing {} byte OSC 52 sequence to {}", seq.size(),
             tty_path.string());

  // One write() in the common case; continue if the device takes less
  size_t offset = 0;
  while (offset < seq.size()) {
    ssize_t n = ::write(tty.get(), seq.data() + offset, seq.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Error(ErrorCode::FallbackWriteError, "write OSC52",
                   std::strerror(errno));
    }
    if (n == 0) {
      return Error(ErrorCode::FallbackWriteError, "write OSC52",
                   "device accepted no data");
    }
    offset += static_cast<size_t>(n);
  }

  return Result<void>::ok();
}

} // namespace teeclip
