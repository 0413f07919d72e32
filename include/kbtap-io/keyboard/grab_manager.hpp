#pragma once
/**
 * @file keyboard/grab_manager.hpp
 * @brief Exclusive ownership of physical keyboards.
 */

#include <kbtap-io/keyboard/device.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

namespace kbtap {
namespace io {
namespace keyboard {

/**
 * @class GrabManager
 * @brief Grabs keyboards without leaving keys stuck, and releases them on
 *        every exit path.
 *
 * A device is only grabbed once it reports no held keys. Grabbing while a key
 * is down would leave the system believing that key is pressed until it is
 * pressed and released again after the grab ends. While keys are held the
 * manager blocks on the device and discards its events.
 *
 * The manager owns the devices it grabbed; the destructor releases them.
 */
class KBTAP_IO_API GrabManager {
public:
  GrabManager() = default;
  ~GrabManager();

  GrabManager(const GrabManager &) = delete;
  GrabManager &operator=(const GrabManager &) = delete;

  /**
   * @brief Grab every device, waiting for held keys to be released first.
   *
   * On failure every device grabbed by this call is released again, the
   * remaining devices are closed, and false is returned.
   */
  bool grabAll(std::vector<std::unique_ptr<InputDevice>> devices);

  /**
   * @brief Ungrab and close every owned device.
   *
   * Failures are logged and do not stop the remaining releases.
   */
  void releaseAll();

  /**
   * @brief Release and close a single device (e.g. one that was unplugged).
   */
  void drop(InputDevice *device);

  /// Devices currently owned and grabbed, in grab order.
  [[nodiscard]] const std::vector<std::unique_ptr<InputDevice>> &
  devices() const {
    return m_devices;
  }

  /// Number of grabbed devices. Safe to call from any thread.
  [[nodiscard]] std::size_t grabbedCount() const {
    return m_grabbedCount.load();
  }

private:
  bool waitForKeyRelease(InputDevice &device);

  std::vector<std::unique_ptr<InputDevice>> m_devices;
  std::atomic<std::size_t> m_grabbedCount{0};
};

} // namespace keyboard
} // namespace io
} // namespace kbtap
