/**
 * @file teeclip.h
 * @brief Main teeclip API header
 *
 * teeclip - copy piped output to the system clipboard
 *
 * Reads a command's output from stdin, echoes it to stdout, optionally
 * strips terminal escape sequences, saves it to a file and puts it on the
 * clipboard through wl-copy/xclip/xsel or, failing that, OSC 52.
 *
 * Quick Start:
 * @code
 *   #include <teeclip/teeclip.h>
 *
 *   teeclip::TeeclipConfig config;
 *   config.trim = true;
 *
 *   auto report = teeclip::run_pipeline(config);
 *   if (!report) {
 *       std::cerr << report.error().to_string() << std::endl;
 *   }
 * @endcode
 */

#ifndef TEECLIP_TEECLIP_H
#define TEECLIP_TEECLIP_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "capture.h"
#include "clipboard.h"
#include "config.h"
#include "file_sink.h"
#include "helper.h"
#include "log.h"
#include "notify.h"
#include "osc52.h"
#include "sanitizer.h"

#include <optional>
#include <unistd.h>

namespace teeclip {

// ============================================================================
// Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "1.0.0";

// ============================================================================
// Pipeline
// ============================================================================

/**
 * @brief Descriptors and session inputs a pipeline runs against
 */
struct PipelineIo {
  /// Input (stdin)
  int input_fd = STDIN_FILENO;

  /// Mirror output (stdout)
  int output_fd = STDOUT_FILENO;

  /// Helper discovery inputs; the process environment when unset
  std::optional<DiscoveryEnvironment> discovery;
};

/**
 * @brief What one run did
 */
struct PipelineReport {
  /// Bytes read from input (before cleaning)
  size_t bytes_read = 0;

  /// Input hit the size limit
  bool input_truncated = false;

  /// Size of the cleaned content
  size_t content_size = 0;

  /// Cleaned content was empty; nothing was saved or copied
  bool nothing_to_copy = false;

  /// Bytes written to the output file (0 when no file was requested)
  size_t bytes_saved = 0;

  /// Content reached the clipboard
  bool copied = false;

  /// Mechanism that put it there
  Transport transport = Transport::None;
};

/**
 * @brief capture -> sanitize -> file -> clipboard -> notify
 *
 * Steps run strictly in order. A failing step ends the run; earlier steps
 * are not rolled back (a saved file stays saved when the copy fails).
 */
class TEECLIP_API Pipeline {
public:
  explicit Pipeline(TeeclipConfig config, PipelineIo io = {});

  /**
   * @brief Run once
   * @return Report, or the first fatal error (InvalidArgument, InputError,
   *         NoPipedInput, FileWriteError, ClipboardUnavailable)
   */
  Result<PipelineReport> run() const;

  const TeeclipConfig &config() const { return config_; }

private:
  TeeclipConfig config_;
  PipelineIo io_;
};

/// Convenience: Pipeline(config, io).run()
TEECLIP_API Result<PipelineReport> run_pipeline(const TeeclipConfig &config,
                                                const PipelineIo &io = {});

} // namespace teeclip

#endif // TEECLIP_TEECLIP_H
