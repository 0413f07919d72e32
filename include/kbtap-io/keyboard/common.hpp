#pragma once
/**
 * @file keyboard/common.hpp
 * @brief Core keyboard types shared by the Sender and Capture subsystems.
 *
 * This header defines the physical key description used by layouts, the raw
 * evdev event type that flows through the capture and output paths, the
 * output sink abstraction, and the callables the library accepts from its
 * embedding application (key notifications, combo parsing, pacing).
 */

#include <kbtap-io/core.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <linux/input.h>

namespace kbtap {
namespace io {
namespace keyboard {

/**
 * @brief Raw kernel input event (type, code, value, timestamp).
 *
 * Events read from grabbed devices are forwarded verbatim, so the kernel
 * structure is used directly rather than a translated copy.
 */
using RawEvent = struct input_event;

/// Values carried by EV_KEY events.
enum class KeyValue : int32_t {
  Up = 0,
  Down = 1,
  Repeat = 2,
};

/**
 * @struct KeyCodeInfo
 * @brief Physical evdev keycode plus the modifier keycodes required to
 *        produce a logical key.
 *
 * Modifiers are listed in press order. Emitters release them in reverse.
 */
struct KeyCodeInfo {
  int keycode{-1};
  std::vector<int> modifiers;

  bool operator==(const KeyCodeInfo &other) const = default;
};

/**
 * @brief Build a RawEvent with a zeroed timestamp.
 */
inline RawEvent makeEvent(uint16_t type, uint16_t code, int32_t value) {
  RawEvent ev{};
  ev.type = type;
  ev.code = code;
  ev.value = value;
  return ev;
}

/**
 * @class EventSink
 * @brief Destination for synthesized and passed-through events.
 *
 * The production implementation is a uinput virtual device
 * (`UInputDevice`). Tests substitute a recording sink.
 */
class KBTAP_IO_API EventSink {
public:
  virtual ~EventSink() = default;

  /// Whether the sink can accept events.
  [[nodiscard]] virtual bool isReady() const = 0;

  /// Write one event unchanged. Returns false on failure.
  virtual bool write(const RawEvent &ev) = 0;

  /// Convenience: emit a single event built from its parts.
  bool emit(uint16_t type, uint16_t code, int32_t value) {
    return write(makeEvent(type, code, value));
  }

  /// Emit the EV_SYN/SYN_REPORT barrier closing a batch of events.
  bool sync() { return emit(EV_SYN, SYN_REPORT, 0); }
};

/**
 * @brief Notification of a recognized physical key transition.
 *
 * `keyName` is the unshifted logical name of the physical key (qwerty
 * positions); `pressed` is true for key-down and false for key-up. Invoked
 * from the capture worker thread for every recognized key regardless of the
 * suppression outcome.
 */
using KeyCallback = std::function<void(const std::string &keyName, bool pressed)>;

/// A parsed key-combination step: logical key name and press state.
using KeyComboStep = std::pair<std::string, bool>;

/**
 * @brief Parses a key-combination expression (e.g. "ctrl_l(shift(u))") into
 *        an ordered list of press/release steps.
 */
using KeyComboParser =
    std::function<std::vector<KeyComboStep>(std::string_view expression)>;

/// Pacing hook invoked between synthesized events.
using Pacer = std::function<void()>;

} // namespace keyboard
} // namespace io
} // namespace kbtap
