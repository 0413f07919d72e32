#pragma once
/**
 * @file keyboard/device.hpp
 * @brief Physical keyboard devices: evdev handles, capability filtering and
 *        discovery.
 *
 * Capture reads raw events from `/dev/input/event*` nodes. This header
 * declares the `InputDevice` handle abstraction (implemented by
 * `EvdevDevice` for real nodes and by pipe-backed fakes in tests), the
 * capability snapshot used to decide whether a node is a real keyboard, and
 * the discovery function that returns every candidate keyboard.
 */

#include <kbtap-io/keyboard/common.hpp>
#include <kbtap-io/keyboard/uinput_device.hpp>

#include <bitset>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kbtap {
namespace io {
namespace keyboard {

/**
 * @struct CaptureOptions
 * @brief Run-time knobs for device filtering and the capture loop.
 */
struct CaptureOptions {
  /// Evdev code whose key-down releases every grab and stops the capture.
  /// 0 disables the emergency release.
  int emergencyReleaseKey{0};
  /// Devices advertising fewer EV_KEY codes are ignored (power buttons, lid
  /// switches, media remotes).
  std::size_t minimumKeyCount{20};
  /// Name (or phys) of the pass-through virtual device; never grabbed.
  std::string reservedDeviceName{kVirtualDeviceName};
  /// Directory scanned for `event*` nodes.
  std::string inputDirectory{"/dev/input"};
};

/**
 * @struct DeviceCapabilities
 * @brief Snapshot of what an evdev node reports about itself.
 */
struct DeviceCapabilities {
  std::string name;
  std::string phys;
  std::bitset<EV_CNT> events;
  std::bitset<KEY_CNT> keys;

  /// Number of EV_KEY codes the device advertises.
  [[nodiscard]] std::size_t keyCount() const { return keys.count(); }
};

/**
 * @brief Decide whether a device is a real keyboard that capture may grab.
 *
 * Rejects the reserved synthetic device, pointer devices (EV_REL/EV_ABS),
 * switches (EV_SW), devices with fewer than `options.minimumKeyCount` keys,
 * and devices that have none of Escape, Space, Enter or Left Shift.
 */
KBTAP_IO_API bool isCandidateKeyboard(const DeviceCapabilities &caps,
                                      const CaptureOptions &options);

/**
 * @class InputDevice
 * @brief An open input event source that capture can wait on, grab and read.
 */
class KBTAP_IO_API InputDevice {
public:
  virtual ~InputDevice() = default;

  /// File descriptor suitable for poll(); reads never block.
  [[nodiscard]] virtual int fd() const = 0;

  /// Human readable identifier used in log messages.
  [[nodiscard]] virtual const std::string &name() const = 0;

  /// Whether any key is currently reported as held down, or `std::nullopt`
  /// when the key state cannot be read.
  [[nodiscard]] virtual std::optional<bool> hasActiveKeys() = 0;

  /// Take exclusive ownership of the event stream.
  virtual bool grab() = 0;

  /// Give the event stream back to the system.
  virtual bool ungrab() = 0;

  [[nodiscard]] virtual bool isGrabbed() const = 0;

  /**
   * @brief Append every event currently available to @p out.
   * @return false if the device is gone (unplugged) or unreadable; true when
   *         the queue was drained, including when nothing was pending.
   */
  virtual bool readEvents(std::vector<RawEvent> &out) = 0;
};

/**
 * @class EvdevDevice
 * @brief `InputDevice` backed by a `/dev/input/event*` node.
 */
class KBTAP_IO_API EvdevDevice final : public InputDevice {
public:
  /**
   * @brief Open @p path non-blocking and query its capabilities.
   * @return nullptr when the node cannot be opened.
   */
  static std::unique_ptr<EvdevDevice> open(const std::string &path);

  ~EvdevDevice() override;

  EvdevDevice(const EvdevDevice &) = delete;
  EvdevDevice &operator=(const EvdevDevice &) = delete;

  [[nodiscard]] int fd() const override { return m_fd; }
  [[nodiscard]] const std::string &name() const override { return m_label; }
  [[nodiscard]] std::optional<bool> hasActiveKeys() override;
  bool grab() override;
  bool ungrab() override;
  [[nodiscard]] bool isGrabbed() const override { return m_grabbed; }
  bool readEvents(std::vector<RawEvent> &out) override;

  [[nodiscard]] const std::string &path() const { return m_path; }
  [[nodiscard]] const DeviceCapabilities &capabilities() const {
    return m_caps;
  }

private:
  EvdevDevice(int fd, std::string path, DeviceCapabilities caps);

  int m_fd{-1};
  bool m_grabbed{false};
  std::string m_path;
  std::string m_label;
  DeviceCapabilities m_caps;
};

/**
 * @brief Query the capabilities of an open evdev file descriptor.
 */
KBTAP_IO_API DeviceCapabilities queryCapabilities(int fd);

/**
 * @brief Open every `event*` node in `options.inputDirectory` that passes
 *        `isCandidateKeyboard`, in ascending node number order.
 *
 * Nodes that cannot be opened (permissions) are skipped with a warning.
 */
KBTAP_IO_API std::vector<std::unique_ptr<InputDevice>>
listCandidateKeyboards(const CaptureOptions &options = {});

} // namespace keyboard
} // namespace io
} // namespace kbtap
