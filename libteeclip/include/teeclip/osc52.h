/**
 * @file osc52.h
 * @brief OSC 52 clipboard fallback through the controlling terminal
 *
 * Most modern terminal emulators (and tmux with set-clipboard on) accept
 * ESC ] 52 ; c ; <base64> BEL and place the decoded payload on the system
 * clipboard. This works over SSH where no helper can reach a display.
 */

#ifndef TEECLIP_OSC52_H
#define TEECLIP_OSC52_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <filesystem>
#include <string>

namespace teeclip {

/// Controlling terminal device
constexpr const char *DEFAULT_TTY_PATH = "/dev/tty";

/**
 * @brief Initialize libsodium once per process
 *
 * Safe to call repeatedly; the encoders below call it themselves.
 *
 * @return Success or EncodingError
 */
TEECLIP_API Result<void> encoding_init();

/// Standard base64 (with padding) of @p content
TEECLIP_API Result<std::string> base64_encode(const Content &content);

/// ESC ]52;c; + base64(content) + BEL
TEECLIP_API Result<std::string> build_osc52_sequence(const Content &content);

/**
 * @brief Write the OSC 52 sequence for @p content to @p tty_path
 *
 * The device is opened write-only without becoming the controlling
 * terminal and closed before returning.
 *
 * @return Success, TerminalUnavailableError or FallbackWriteError
 */
TEECLIP_API Result<void> write_osc52(const Content &content,
                                     const std::filesystem::path &tty_path);

} // namespace teeclip

#endif // TEECLIP_OSC52_H
