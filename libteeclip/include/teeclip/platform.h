/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for teeclip
 *
 * teeclip talks to X11/Wayland clipboard helpers and to the controlling
 * terminal, so only Linux is supported.
 */

#ifndef TEECLIP_PLATFORM_H
#define TEECLIP_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if defined(__linux__)
#define TEECLIP_PLATFORM_LINUX 1
#define TEECLIP_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. teeclip only supports Linux."
#endif

// ============================================================================
// Compiler Detection (GCC and Clang only)
// ============================================================================

#if defined(__clang__)
#define TEECLIP_COMPILER_CLANG 1
#define TEECLIP_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define TEECLIP_COMPILER_GCC 1
#define TEECLIP_COMPILER_NAME "GCC"
#else
#define TEECLIP_COMPILER_UNKNOWN 1
#define TEECLIP_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// Export/Import Macros
// ============================================================================

#ifdef TEECLIP_BUILDING_SHARED
#define TEECLIP_API __attribute__((visibility("default")))
#else
#define TEECLIP_API
#endif

#endif // TEECLIP_PLATFORM_H
