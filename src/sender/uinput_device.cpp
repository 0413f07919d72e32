#include <kbtap-io/keyboard/uinput_device.hpp>
#include <kbtap-io/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>

namespace kbtap::io::keyboard {

namespace {

bool setBit(int fd, unsigned long request, int bit) {
  if (ioctl(fd, request, bit) < 0) {
    KBTAP_IO_LOG_DEBUG("UInputDevice: ioctl(0x%lx, %d) failed: %s", request,
                       bit, strerror(errno));
    return false;
  }
  return true;
}

} // namespace

UInputDevice::UInputDevice(std::string_view name, std::string_view devicePath)
    : m_name(name) {
  std::string path(devicePath);
  m_fd = open(path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
  if (m_fd < 0) {
    KBTAP_IO_LOG_ERROR("UInputDevice: failed to open %s: %s", path.c_str(),
                       strerror(errno));
    return;
  }

  // No EV_REP: the kernel would generate its own repeats on top of the
  // forwarded hardware ones.
  bool ok = setBit(m_fd, UI_SET_EVBIT, EV_KEY) &&
            setBit(m_fd, UI_SET_EVBIT, EV_SYN);
  setBit(m_fd, UI_SET_EVBIT, EV_MSC);
  setBit(m_fd, UI_SET_MSCBIT, MSC_SCAN);

  for (int code = 0; code < KEY_MAX; ++code)
    setBit(m_fd, UI_SET_KEYBIT, code);

  struct uinput_setup usetup{};
  std::memset(&usetup, 0, sizeof(usetup));
  usetup.id.bustype = BUS_USB;
  usetup.id.vendor = 0x1234;
  usetup.id.product = 0x5678;
  std::strncpy(usetup.name, m_name.c_str(), UINPUT_MAX_NAME_SIZE - 1);

  if (ok) {
    // phys carries the reserved name too, so discovery can match either.
    if (ioctl(m_fd, UI_SET_PHYS, m_name.c_str()) < 0)
      KBTAP_IO_LOG_DEBUG("UInputDevice: UI_SET_PHYS failed: %s",
                         strerror(errno));
    ok = ioctl(m_fd, UI_DEV_SETUP, &usetup) >= 0 &&
         ioctl(m_fd, UI_DEV_CREATE) >= 0;
  }
  if (!ok) {
    KBTAP_IO_LOG_ERROR("UInputDevice: failed to create virtual device: %s",
                       strerror(errno));
    close(m_fd);
    m_fd = -1;
    return;
  }

  // Give udev time to create the device node
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  KBTAP_IO_LOG_INFO("UInputDevice: '%s' created (fd=%d)", m_name.c_str(),
                    m_fd);
}

UInputDevice::~UInputDevice() {
  if (m_fd >= 0) {
    ioctl(m_fd, UI_DEV_DESTROY);
    close(m_fd);
    KBTAP_IO_LOG_INFO("UInputDevice: '%s' destroyed (fd=%d)", m_name.c_str(),
                      m_fd);
  }
}

bool UInputDevice::write(const RawEvent &ev) {
  if (m_fd < 0)
    return false;
  ssize_t wrote = ::write(m_fd, &ev, sizeof(ev));
  if (wrote != static_cast<ssize_t>(sizeof(ev))) {
    KBTAP_IO_LOG_ERROR(
        "UInputDevice: write failed (type=%d code=%d val=%d): %s", ev.type,
        ev.code, ev.value, strerror(errno));
    return false;
  }
  KBTAP_IO_LOG_DEBUG("UInputDevice: emit type=%d code=%d val=%d", ev.type,
                     ev.code, ev.value);
  return true;
}

} // namespace kbtap::io::keyboard
