#pragma once
/**
 * @file keyboard/uinput_device.hpp
 * @brief uinput virtual keyboard used for synthesized and passed-through
 *        events.
 */

#include <kbtap-io/keyboard/common.hpp>

#include <string>
#include <string_view>

namespace kbtap {
namespace io {
namespace keyboard {

/// Device name (and phys) of the virtual keyboard created by this library.
/// Device discovery never grabs a device carrying this name.
inline constexpr std::string_view kVirtualDeviceName = "kbtap-io-uinput";

/**
 * @class UInputDevice
 * @brief Virtual input device exposing every KEY_* code.
 *
 * The device is created in the constructor and destroyed in the destructor.
 * When `/dev/uinput` cannot be opened the instance stays unready and every
 * write fails.
 */
class KBTAP_IO_API UInputDevice : public EventSink {
public:
  explicit UInputDevice(
      std::string_view name = kVirtualDeviceName,
      std::string_view devicePath = "/dev/uinput");
  ~UInputDevice() override;

  UInputDevice(const UInputDevice &) = delete;
  UInputDevice &operator=(const UInputDevice &) = delete;

  [[nodiscard]] bool isReady() const override { return m_fd >= 0; }
  bool write(const RawEvent &ev) override;

  [[nodiscard]] const std::string &name() const { return m_name; }

private:
  int m_fd{-1};
  std::string m_name;
};

} // namespace keyboard
} // namespace io
} // namespace kbtap
