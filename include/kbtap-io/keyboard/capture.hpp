#pragma once
/**
 * @file keyboard/capture.hpp
 * @brief Exclusive keyboard capture with selective suppression.
 *
 * `Capture` grabs every physical keyboard, reports each recognized key
 * transition to a callback, and re-emits the events it does not suppress
 * through a uinput virtual device so the desktop keeps receiving them.
 *
 * @par Usage:
 * @code{.cpp}
 * #include <kbtap-io/keyboard/capture.hpp>
 *
 * using namespace kbtap::io::keyboard;
 *
 * Capture capture([](const std::string &key, bool pressed) {
 *   // feed the steno engine
 * });
 * capture.suppress({"a", "s", "d", "f"});
 * if (capture.start()) {
 *   // ...
 *   capture.cancel();
 * }
 * @endcode
 */

#include <kbtap-io/keyboard/common.hpp>
#include <kbtap-io/keyboard/device.hpp>
#include <kbtap-io/keyboard/suppression.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace kbtap {
namespace io {
namespace keyboard {

/**
 * @class Capture
 * @brief Grabs keyboards and multiplexes their events on a worker thread.
 *
 * The callback runs on the worker thread for every key with a logical name,
 * whether or not the event is suppressed. Autorepeat is not reported.
 */
class KBTAP_IO_API Capture {
public:
  /// Returns the devices to grab. Defaults to `listCandidateKeyboards`.
  using DeviceProvider =
      std::function<std::vector<std::unique_ptr<InputDevice>>(
          const CaptureOptions &)>;
  /// Creates the pass-through output. Defaults to a `UInputDevice` named
  /// `CaptureOptions::reservedDeviceName`.
  using SinkFactory =
      std::function<std::shared_ptr<EventSink>(const CaptureOptions &)>;

  explicit Capture(KeyCallback callback, CaptureOptions options = {});
  Capture(KeyCallback callback, CaptureOptions options,
          DeviceProvider devices, SinkFactory sinks);

  /// Cancels a running capture.
  ~Capture();

  Capture(const Capture &) = delete;
  Capture &operator=(const Capture &) = delete;

  /**
   * @brief Discover and grab keyboards, create the pass-through device and
   *        start the worker thread.
   *
   * Blocks while a keyboard still has keys held down. On failure nothing
   * stays grabbed and false is returned.
   */
  bool start();

  /**
   * @brief Stop the worker and release every device.
   *
   * Returns once the worker has exited, every grab is released and the
   * virtual device is destroyed. Safe to call when not running.
   */
  void cancel();

  /**
   * @brief Replace the set of suppressed key names.
   *
   * May be called from any thread; the worker picks up the new set on its
   * next event.
   */
  void suppress(SuppressedKeys keys);

  /// Whether the worker thread is running.
  [[nodiscard]] bool isRunning() const;

  /// Number of devices currently grabbed.
  [[nodiscard]] std::size_t grabbedDeviceCount() const;

  [[nodiscard]] const CaptureOptions &options() const;

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace keyboard
} // namespace io
} // namespace kbtap
