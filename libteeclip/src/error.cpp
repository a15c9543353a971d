/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "teeclip/error.h"
#include <sstream>

namespace teeclip {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::NotSupported:
    return "NotSupported";

  case ErrorCode::InputError:
    return "InputError";
  case ErrorCode::NoPipedInput:
    return "NoPipedInput";

  case ErrorCode::FileWriteError:
    return "FileWriteError";

  case ErrorCode::HelperUnavailable:
    return "HelperUnavailable";
  case ErrorCode::HelperSpawnError:
    return "HelperSpawnError";
  case ErrorCode::HelperWriteError:
    return "HelperWriteError";
  case ErrorCode::HelperExitError:
    return "HelperExitError";

  case ErrorCode::TerminalUnavailableError:
    return "TerminalUnavailableError";
  case ErrorCode::FallbackWriteError:
    return "FallbackWriteError";
  case ErrorCode::ClipboardUnavailable:
    return "ClipboardUnavailable";
  case ErrorCode::EncodingError:
    return "EncodingError";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::NotSupported:
    return "Operation not supported";

  case ErrorCode::InputError:
    return "Standard input is unavailable or unreadable";
  case ErrorCode::NoPipedInput:
    return "No piped input on standard input";

  case ErrorCode::FileWriteError:
    return "Error writing output file";

  case ErrorCode::HelperUnavailable:
    return "No external clipboard helper found";
  case ErrorCode::HelperSpawnError:
    return "Clipboard helper could not be started";
  case ErrorCode::HelperWriteError:
    return "Failed to write content to clipboard helper";
  case ErrorCode::HelperExitError:
    return "Clipboard helper exited with an error";

  case ErrorCode::TerminalUnavailableError:
    return "No controlling terminal available";
  case ErrorCode::FallbackWriteError:
    return "Failed to write OSC 52 sequence to terminal";
  case ErrorCode::ClipboardUnavailable:
    return "No external clipboard helper and OSC52 failed";
  case ErrorCode::EncodingError:
    return "Failed to initialize the base64 encoder";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Caught by the delivery chain, which falls back to OSC 52
  case ErrorCode::HelperUnavailable:
  case ErrorCode::HelperSpawnError:
  case ErrorCode::HelperWriteError:
  case ErrorCode::HelperExitError:
    return true;

  default:
    return false;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  if (!message.empty()) {
    oss << message;
  } else {
    oss << error_code_description(code);
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  return oss.str();
}

} // namespace teeclip
