/**
 * @file helper.h
 * @brief External clipboard helper discovery and invocation
 *
 * teeclip does not speak the X11 or Wayland clipboard protocols itself.
 * It hands content to wl-copy, xclip or xsel, whichever fits the session.
 */

#ifndef TEECLIP_HELPER_H
#define TEECLIP_HELPER_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <optional>
#include <string>
#include <vector>

namespace teeclip {

// ============================================================================
// Known Helpers
// ============================================================================

constexpr const char *WAYLAND_HELPER = "wl-copy";
constexpr const char *X11_PRIMARY_HELPER = "xclip";
constexpr const char *X11_SECONDARY_HELPER = "xsel";

/// Makes wl-copy exit after serving one paste instead of staying resident
constexpr const char *ONE_SHOT_FLAG = "--paste-once";

// ============================================================================
// Discovery Inputs
// ============================================================================

/**
 * @brief Session signals consulted by helper discovery
 */
struct DiscoveryEnvironment {
  /// WAYLAND_DISPLAY
  std::string wayland_display;

  /// DISPLAY
  std::string x_display;

  /// PATH
  std::string search_path;

  bool is_wayland() const { return !wayland_display.empty(); }
  bool is_x11() const { return !x_display.empty(); }

  /// Snapshot of the current process environment
  static DiscoveryEnvironment from_process();
};

// ============================================================================
// Helper Descriptor
// ============================================================================

/**
 * @brief A helper picked by discovery, consumed by one invocation
 */
struct HelperDescriptor {
  /// Absolute (or PATH-relative) executable path
  std::string path;

  /// Arguments, not including argv[0] or the one-shot flag
  std::vector<std::string> args;

  /// Helper runs as a persistent server unless told to serve once
  bool one_shot_required = false;

  /// Executable name without directories, for messages
  std::string name() const;

  /// Arguments actually passed: ONE_SHOT_FLAG first when required
  std::vector<std::string> invocation_args() const;
};

// ============================================================================
// Discovery
// ============================================================================

/**
 * @brief Resolve @p name against a colon-separated search path
 *
 * Only checks for an executable regular file; nothing is run. Names
 * containing '/' are checked as given. Empty and relative path elements
 * are skipped, so the working directory is never searched.
 */
TEECLIP_API std::optional<std::string>
find_executable(const std::string &name, const std::string &search_path);

/**
 * @brief Pick a clipboard helper for the session
 *
 * 1. Wayland session: wl-copy (one-shot)
 * 2. X11 session: xclip -selection clipboard, else xsel --clipboard --input
 * 3. Any session: wl-copy if it is anywhere on the path (one-shot)
 *
 * @return Descriptor, or nullopt when nothing usable is installed
 */
TEECLIP_API std::optional<HelperDescriptor>
discover_helper(const DiscoveryEnvironment &env);

// ============================================================================
// Invocation
// ============================================================================

/**
 * @brief Run the helper and feed it @p content on stdin
 *
 * Spawns exactly one process and always waits for it (or kills and reaps
 * it on a write failure) before returning.
 *
 * @return Success, or HelperSpawnError / HelperWriteError / HelperExitError
 *         (the latter with the helper's stderr in Error::details)
 */
TEECLIP_API Result<void> invoke_helper(const HelperDescriptor &helper,
                                       const Content &content);

} // namespace teeclip

#endif // TEECLIP_HELPER_H
