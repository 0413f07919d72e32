#pragma once

// kbtap-io - log.hpp
// Lightweight printf-style logging used by every backend.
//
// The threshold is read once from the KBTAP_IO_LOG_LEVEL environment variable
// (debug, info, warn, error, off; default warn) and can be changed at run time
// with kbtap::io::log::setLevel(). Messages go to stderr unless a handler is
// installed with kbtap::io::log::setHandler().
//
// Usage:
//   KBTAP_IO_LOG_WARN("Layout %s not supported", name.c_str());

#include <functional>
#include <string>

#include <kbtap-io/core.hpp>

namespace kbtap {
namespace io {
namespace log {

enum class Level : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
  Off = 4,
};

/// Receives every message that passes the level threshold.
using Handler = std::function<void(Level level, const std::string &message)>;

KBTAP_IO_API void setLevel(Level level);
[[nodiscard]] KBTAP_IO_API Level level();
[[nodiscard]] KBTAP_IO_API bool isEnabled(Level level);

/// Install a custom sink. Passing an empty handler restores stderr output.
KBTAP_IO_API void setHandler(Handler handler);

/// Parse a level name (case-insensitive). Unknown names yield `fallback`.
[[nodiscard]] KBTAP_IO_API Level parseLevel(const std::string &name,
                                            Level fallback);

KBTAP_IO_API void write(Level level, const char *file, int line,
                        const char *fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 4, 5)))
#endif
    ;

KBTAP_IO_API const char *levelName(Level level) noexcept;

} // namespace log
} // namespace io
} // namespace kbtap

#define KBTAP_IO_LOG_AT(lvl, ...)                                              \
  do {                                                                         \
    if (::kbtap::io::log::isEnabled(lvl))                                      \
      ::kbtap::io::log::write(lvl, __FILE__, __LINE__, __VA_ARGS__);           \
  } while (0)

#define KBTAP_IO_LOG_DEBUG(...)                                                \
  KBTAP_IO_LOG_AT(::kbtap::io::log::Level::Debug, __VA_ARGS__)
#define KBTAP_IO_LOG_INFO(...)                                                 \
  KBTAP_IO_LOG_AT(::kbtap::io::log::Level::Info, __VA_ARGS__)
#define KBTAP_IO_LOG_WARN(...)                                                 \
  KBTAP_IO_LOG_AT(::kbtap::io::log::Level::Warn, __VA_ARGS__)
#define KBTAP_IO_LOG_ERROR(...)                                                \
  KBTAP_IO_LOG_AT(::kbtap::io::log::Level::Error, __VA_ARGS__)
