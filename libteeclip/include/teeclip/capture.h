/**
 * @file capture.h
 * @brief Reading piped input with a size cap, mirroring it as it arrives
 */

#ifndef TEECLIP_CAPTURE_H
#define TEECLIP_CAPTURE_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <unistd.h>

namespace teeclip {

/**
 * @brief Where to read from and where to echo to
 */
struct CaptureOptions {
  /// Descriptor to read (normally stdin)
  int input_fd = STDIN_FILENO;

  /// Echo every chunk read to mirror_fd
  bool mirror = true;

  /// Descriptor receiving the echo (normally stdout)
  int mirror_fd = STDOUT_FILENO;

  /// Maximum number of bytes kept; reading stops there
  size_t limit = MAX_CONTENT_SIZE;
};

/**
 * @brief What was captured
 */
struct CaptureResult {
  /// Exactly the bytes read, before any cleaning
  Content content;

  /// Input went on past the limit; the excess was not kept
  bool truncated = false;

  /// The echo failed (e.g. the reader of stdout went away) and was dropped
  bool mirror_failed = false;
};

/**
 * @brief Check that @p fd is a pipe or file rather than a terminal
 *
 * @return Success, InputError (fstat failed) or NoPipedInput
 */
TEECLIP_API Result<void> check_piped_input(int fd = STDIN_FILENO);

/**
 * @brief Read input until EOF or the limit, echoing it unless disabled
 *
 * A failing echo does not abort capture: the clipboard copy is still
 * wanted when the downstream reader has gone (`cmd | teeclip | head`).
 *
 * @return Captured content or InputError
 */
TEECLIP_API Result<CaptureResult> capture_input(const CaptureOptions &options);

} // namespace teeclip

#endif // TEECLIP_CAPTURE_H
