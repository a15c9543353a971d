/**
 * @file clipboard.h
 * @brief Clipboard delivery: external helper first, OSC 52 second
 *
 * Delivery is a single pass through two tiers:
 *
 *   Start -> discover helper
 *     found     -> invoke -> Success
 *                         -> failed -> OSC 52
 *     not found ------------------------> OSC 52 -> Success | Fail
 *
 * There are no retries. Helper failures never surface on their own; they
 * only show up as the reason attached to a final failure.
 */

#ifndef TEECLIP_CLIPBOARD_H
#define TEECLIP_CLIPBOARD_H

#include "error.h"
#include "helper.h"
#include "osc52.h"
#include "platform.h"
#include "types.h"
#include <filesystem>
#include <optional>
#include <string>

namespace teeclip {

// ============================================================================
// Delivery Outcome
// ============================================================================

/**
 * @brief Result category of one delivery attempt (per tier)
 */
enum class DeliveryStatus : uint8_t {
  /// Content is on the clipboard
  Success = 0,

  /// No helper was found (or helpers are disabled)
  HelperUnavailable = 1,

  /// Helper could not be started, fed, or exited non-zero
  HelperFailed = 2,

  /// OSC 52 could not be written; delivery is over
  FallbackFailed = 3
};

/**
 * @brief Mechanism that delivered (or last tried to deliver) the content
 */
enum class Transport : uint8_t { None = 0, Helper = 1, Osc52 = 2 };

/// Get human-readable name for delivery status
TEECLIP_API const char *delivery_status_name(DeliveryStatus status);

/// Get human-readable name for transport
TEECLIP_API const char *transport_name(Transport transport);

/**
 * @brief Final outcome of ClipboardDelivery::deliver()
 */
struct DeliveryOutcome {
  DeliveryStatus status = DeliveryStatus::HelperUnavailable;
  Transport transport = Transport::None;

  /// Helper that was tried, if any
  std::optional<HelperDescriptor> helper;

  /// Why the helper tier failed (when it was tried and failed)
  std::optional<Error> helper_error;

  /// Why the fallback tier failed (status == FallbackFailed)
  std::optional<Error> fallback_error;

  bool succeeded() const { return status == DeliveryStatus::Success; }
};

/**
 * @brief Reduce an outcome to success or a ClipboardUnavailable error
 *
 * The error message reads "no external clipboard helper and OSC52 failed:
 * <reason>"; when both tiers failed the helper's error is in details.
 */
TEECLIP_API Result<void> delivery_result(const DeliveryOutcome &outcome);

// ============================================================================
// Delivery
// ============================================================================

/**
 * @brief Delivery settings
 */
struct DeliveryConfig {
  /// Try external helpers before OSC 52
  bool allow_helpers = true;

  /// Terminal device for OSC 52
  std::filesystem::path tty_path = DEFAULT_TTY_PATH;

  /// Discovery inputs; the process environment when unset
  std::optional<DiscoveryEnvironment> environment;
};

/**
 * @brief Runs the two-tier clipboard delivery
 */
class TEECLIP_API ClipboardDelivery {
public:
  ClipboardDelivery() = default;
  explicit ClipboardDelivery(DeliveryConfig config);

  const DeliveryConfig &config() const { return config_; }

  /**
   * @brief Deliver @p content, helper first, then OSC 52
   */
  DeliveryOutcome deliver(const Content &content) const;

private:
  DeliveryConfig config_;
};

} // namespace teeclip

#endif // TEECLIP_CLIPBOARD_H
