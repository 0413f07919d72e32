#include <kbtap-io/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace kbtap::io::log {

namespace {

Level levelFromEnvironment() {
  const char *env = std::getenv("KBTAP_IO_LOG_LEVEL");
  if (!env)
    return Level::Warn;
  return parseLevel(env, Level::Warn);
}

std::atomic<int> &threshold() {
  static std::atomic<int> value{static_cast<int>(levelFromEnvironment())};
  return value;
}

std::mutex &handlerMutex() {
  static std::mutex m;
  return m;
}

Handler &handlerSlot() {
  static Handler h;
  return h;
}

// Strip directories so log lines stay short.
const char *baseName(const char *path) {
  const char *slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

} // namespace

void setLevel(Level level) { threshold().store(static_cast<int>(level)); }

Level level() { return static_cast<Level>(threshold().load()); }

bool isEnabled(Level lvl) {
  return lvl != Level::Off && static_cast<int>(lvl) >= threshold().load();
}

void setHandler(Handler handler) {
  std::lock_guard<std::mutex> lock(handlerMutex());
  handlerSlot() = std::move(handler);
}

Level parseLevel(const std::string &name, Level fallback) {
  std::string lower = name;
  std::ranges::transform(lower, lower.begin(), [](char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  if (lower == "debug" || lower == "trace")
    return Level::Debug;
  if (lower == "info")
    return Level::Info;
  if (lower == "warn" || lower == "warning")
    return Level::Warn;
  if (lower == "error")
    return Level::Error;
  if (lower == "off" || lower == "none")
    return Level::Off;
  return fallback;
}

const char *levelName(Level level) noexcept {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  case Level::Off:
    break;
  }
  return "OFF";
}

void write(Level level, const char *file, int line, const char *fmt, ...) {
  char buffer[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);

  Handler handler;
  {
    std::lock_guard<std::mutex> lock(handlerMutex());
    handler = handlerSlot();
  }
  if (handler) {
    handler(level, buffer);
    return;
  }
  std::fprintf(stderr, "[kbtap-io] [%s] %s (%s:%d)\n", levelName(level),
               buffer, baseName(file), line);
}

} // namespace kbtap::io::log
