/**
 * @file sanitizer.h
 * @brief Terminal control sequence stripping and whitespace trimming
 *
 * Captured command output usually carries colour codes, cursor movement and
 * window-title updates that are useless (or harmful) in a clipboard. These
 * functions are pure and never fail.
 */

#ifndef TEECLIP_SANITIZER_H
#define TEECLIP_SANITIZER_H

#include "platform.h"
#include <string>

namespace teeclip {

/**
 * @brief What to clean from captured text
 */
struct SanitizeOptions {
  /// Remove CSI/OSC/DCS/SOS/PM/APC and short escape sequences
  bool strip_ansi = true;

  /// Remove leading and trailing ASCII whitespace
  bool trim = false;
};

/**
 * @brief Remove recognised terminal control sequences
 *
 * Runs over the whole buffer at once, so sequences spanning lines (OSC
 * titles, DCS payloads) are removed intact. Unterminated sequences are left
 * as they are. The result contains no recognised sequence, so applying it
 * again is a no-op.
 */
TEECLIP_API std::string strip_ansi(const std::string &text);

/// Remove leading and trailing " \t\n\v\f\r"
TEECLIP_API std::string trim_whitespace(const std::string &text);

/// Apply the selected cleaning steps, stripping before trimming
TEECLIP_API std::string sanitize(const std::string &text,
                                 const SanitizeOptions &options);

} // namespace teeclip

#endif // TEECLIP_SANITIZER_H
