/**
 * @file clipboard.cpp
 * @brief Two-tier clipboard delivery
 */

#include "teeclip/clipboard.h"
#include "teeclip/log.h"
#include "teeclip/osc52.h"

namespace teeclip {

// ============================================================================
// Names
// ============================================================================

const char *delivery_status_name(DeliveryStatus status) {
  switch (status) {
  case DeliveryStatus::Success:
    return "Success";
  case DeliveryStatus::HelperUnavailable:
    return "HelperUnavailable";
  case DeliveryStatus::HelperFailed:
    return "HelperFailed";
  case DeliveryStatus::FallbackFailed:
    return "FallbackFailed";
  default:
    return "Invalid";
  }
}

const char *transport_name(Transport transport) {
  switch (transport) {
  case Transport::None:
    return "none";
  case Transport::Helper:
    return "helper";
  case Transport::Osc52:
    return "OSC 52";
  default:
    return "invalid";
  }
}

// ============================================================================
// Outcome
// ============================================================================

Result<void> delivery_result(const DeliveryOutcome &outcome) {
  if (outcome.succeeded()) {
    return Result<void>::ok();
  }

  std::string reason = outcome.fallback_error
                           ? outcome.fallback_error->to_string()
                           : std::string(delivery_status_name(outcome.status));

  Error err(ErrorCode::ClipboardUnavailable,
            "no external clipboard helper and OSC52 failed: " + reason);
  if (outcome.helper_error && outcome.fallback_error) {
    err.details = outcome.helper_error->to_string();
  }
  return err;
}

// ============================================================================
// ClipboardDelivery
// ============================================================================

ClipboardDelivery::ClipboardDelivery(DeliveryConfig config)
    : config_(std::move(config)) {}

DeliveryOutcome ClipboardDelivery::deliver(const Content &content) const {
  auto log = logging::diag();
  DeliveryOutcome outcome;

  // Tier 1: external helper
  if (config_.allow_helpers) {
    auto env = config_.environment ? *config_.environment
                                   : DiscoveryEnvironment::from_process();
    outcome.helper = discover_helper(env);

    if (outcome.helper) {
      outcome.transport = Transport::Helper;
      auto result = invoke_helper(*outcome.helper, content);
      if (result.is_ok()) {
        outcome.status = DeliveryStatus::Success;
        return outcome;
      }
      log->debug("helper failed, falling back to OSC 52: {}",
                 result.error().to_string());
      outcome.status = DeliveryStatus::HelperFailed;
      outcome.helper_error = result.error();
    } else {
      log->debug("no clipboard helper found, falling back to OSC 52");
      outcome.status = DeliveryStatus::HelperUnavailable;
    }
  } else {
    outcome.status = DeliveryStatus::HelperUnavailable;
  }

  // Tier 2: OSC 52
  outcome.transport = Transport::Osc52;
  auto result = write_osc52(content, config_.tty_path);
  if (result.is_ok()) {
    outcome.status = DeliveryStatus::Success;
    return outcome;
  }

  outcome.status = DeliveryStatus::FallbackFailed;
  outcome.fallback_error = result.error();
  return outcome;
}

} // namespace teeclip
