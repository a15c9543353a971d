/**
 * @file types.h
 * @brief Core type definitions for teeclip
 */

#ifndef TEECLIP_TYPES_H
#define TEECLIP_TYPES_H

#include "platform.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace teeclip {

// ============================================================================
// Basic Types
// ============================================================================

/// Captured payload. Raw bytes, not necessarily valid UTF-8.
using Content = std::string;

// ============================================================================
// Limits
// ============================================================================

/// Hard cap on captured input (10 MiB). Excess input is dropped.
constexpr size_t MAX_CONTENT_SIZE = 10 * 1024 * 1024;

/// Amount of helper stderr kept for diagnostics
constexpr size_t MAX_HELPER_STDERR = 4 * 1024;

/// Read/write chunk size for stream copies
constexpr size_t IO_CHUNK_SIZE = 64 * 1024;

} // namespace teeclip

#endif // TEECLIP_TYPES_H
