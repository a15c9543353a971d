/**
 * @file config.cpp
 * @brief Run configuration defaults and validation
 */

#include <cstdlib>
#include <string>

#include "teeclip/config.h"

namespace teeclip {

// ============================================================================
// TeeclipConfig Methods
// ============================================================================

void TeeclipConfig::load_defaults() {
  quiet = false;
  verbose = false;

  strip_ansi = true;
  trim = false;

  output_file.clear();
  append = false;

  copy_to_clipboard = true;
  force_osc52 = false;
  tty_path = DEFAULT_TTY_PATH;
  notify = false;

  max_input_size = MAX_CONTENT_SIZE;
}

void TeeclipConfig::apply_environment() {
  const char *tty = std::getenv(TTY_PATH_ENV);
  if (tty && tty[0] != '\0') {
    tty_path = tty;
  }
}

Result<void> TeeclipConfig::validate() const {
  TEECLIP_REQUIRE(max_input_size > 0 && max_input_size <= MAX_CONTENT_SIZE,
                  ErrorCode::InvalidArgument,
                  "Input limit must be between 1 byte and 10 MiB");

  TEECLIP_REQUIRE(!tty_path.empty(), ErrorCode::InvalidArgument,
                  "Terminal device path is empty");

  TEECLIP_REQUIRE(copy_to_clipboard || !force_osc52,
                  ErrorCode::InvalidArgument,
                  "--osc52 cannot be combined with --no-clip");

  return Result<void>::ok();
}

SanitizeOptions TeeclipConfig::sanitize_options() const {
  SanitizeOptions options;
  options.strip_ansi = strip_ansi;
  options.trim = trim;
  return options;
}

} // namespace teeclip
