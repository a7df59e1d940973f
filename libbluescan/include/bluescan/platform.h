/**
 * @file platform.h
 * @brief Platform detection and abstraction macros for BlueScan
 *
 * BlueScan talks to BlueZ over D-Bus and therefore only supports Linux.
 */

#ifndef BLUESCAN_PLATFORM_H
#define BLUESCAN_PLATFORM_H

// ============================================================================
// Platform Detection (Linux only)
// ============================================================================

#if defined(__linux__)
#define BLUESCAN_PLATFORM_NAME "Linux"
#else
#error "Unsupported platform. BlueScan only supports Linux."
#endif

// ============================================================================
// Export Macros
// ============================================================================

#ifdef BLUESCAN_BUILDING_SHARED
#define BLUESCAN_API __attribute__((visibility("default")))
#else
#define BLUESCAN_API
#endif

// ============================================================================
// Utility Macros
// ============================================================================

#define BLUESCAN_UNUSED(x) (void)(x)

// ============================================================================
// Version
// ============================================================================

#define BLUESCAN_VERSION_STRING "1.0.0"

#endif // BLUESCAN_PLATFORM_H
