/**
 * @file config.h
 * @brief Run configuration for teeclip
 */

#ifndef TEECLIP_CONFIG_H
#define TEECLIP_CONFIG_H

#include "error.h"
#include "osc52.h"
#include "platform.h"
#include "sanitizer.h"
#include "types.h"
#include <filesystem>
#include <string>

namespace teeclip {

/// Environment variable overriding the terminal device used for OSC 52
constexpr const char *TTY_PATH_ENV = "TEECLIP_TTY";

// ============================================================================
// Run Configuration
// ============================================================================

/**
 * @brief Complete configuration for one teeclip run
 */
struct TeeclipConfig {
  // ========================================================================
  // Output
  // ========================================================================

  /// Don't mirror input to stdout and suppress status lines
  bool quiet = false;

  /// Enable debug diagnostics
  bool verbose = false;

  // ========================================================================
  // Cleaning
  // ========================================================================

  /// Strip terminal control sequences before saving/copying
  bool strip_ansi = true;

  /// Trim leading/trailing whitespace before saving/copying
  bool trim = false;

  // ========================================================================
  // File Sink
  // ========================================================================

  /// File to save the cleaned content to (empty = none)
  std::filesystem::path output_file;

  /// Append to output_file instead of truncating it
  bool append = false;

  // ========================================================================
  // Clipboard
  // ========================================================================

  /// Deliver the content to the clipboard
  bool copy_to_clipboard = true;

  /// Skip external helpers and go straight to OSC 52
  bool force_osc52 = false;

  /// Terminal device for the OSC 52 fallback
  std::filesystem::path tty_path = DEFAULT_TTY_PATH;

  /// Send a desktop notification after a successful copy
  bool notify = false;

  // ========================================================================
  // Input
  // ========================================================================

  /// Maximum number of bytes captured from stdin
  size_t max_input_size = MAX_CONTENT_SIZE;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Apply TEECLIP_TTY if set
  void apply_environment();

  /// Validate configuration
  Result<void> validate() const;

  /// Cleaning options derived from this configuration
  SanitizeOptions sanitize_options() const;
};

} // namespace teeclip

#endif // TEECLIP_CONFIG_H
