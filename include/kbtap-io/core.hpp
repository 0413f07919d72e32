#pragma once
/**
 * @file core.hpp
 * @brief Core library version and export macros for kbtap::io.
 *
 * This header defines library version information and symbol export macros
 * used throughout the kbtap-io library.
 *
 * For keyboard-specific types (KeyCodeInfo, RawEvent, key callbacks), include
 * `<kbtap-io/keyboard/common.hpp>` instead.
 */

#include <chrono>
#include <cstdint>
#include <thread>

#ifndef KBTAP_IO_VERSION
// Default version; CMake overrides these by defining KBTAP_IO_VERSION_* via
// -D flags.
#define KBTAP_IO_VERSION "0.4.0"
#define KBTAP_IO_VERSION_MAJOR 0
#define KBTAP_IO_VERSION_MINOR 4
#define KBTAP_IO_VERSION_PATCH 0
#endif

// Symbol export macro to support building the library as a shared object.
// CMake defines `kbtap_io_EXPORTS` when building the shared target and
// `KBTAP_IO_STATIC` for static builds.
#ifndef KBTAP_IO_API
#if defined(__GNUC__) && (__GNUC__ >= 4) && !defined(KBTAP_IO_STATIC)
#define KBTAP_IO_API __attribute__((visibility("default")))
#else
#define KBTAP_IO_API
#endif
#endif

namespace kbtap {
namespace io {

/**
 * @brief Convenience access to the library version string (mirrors
 * KBTAP_IO_VERSION).
 * @return const char* Null-terminated version string (statically allocated).
 */
inline const char *libraryVersion() noexcept { return KBTAP_IO_VERSION; }

/**
 * @brief Sleep for the given number of microseconds.
 * @param us Duration to sleep in microseconds. Zero returns immediately.
 */
inline void sleepUs(uint32_t us) noexcept {
  if (us > 0)
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

} // namespace io
} // namespace kbtap
