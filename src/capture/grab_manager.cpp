#include <kbtap-io/keyboard/grab_manager.hpp>
#include <kbtap-io/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <poll.h>

namespace kbtap::io::keyboard {

GrabManager::~GrabManager() { releaseAll(); }

bool GrabManager::waitForKeyRelease(InputDevice &device) {
  std::vector<RawEvent> discarded;
  bool logged = false;
  for (;;) {
    std::optional<bool> held = device.hasActiveKeys();
    if (!held) {
      KBTAP_IO_LOG_ERROR("Cannot read the key state of %s",
                         device.name().c_str());
      return false;
    }
    if (!*held)
      return true;
    if (!logged) {
      KBTAP_IO_LOG_INFO("Waiting for keys to be released on %s",
                        device.name().c_str());
      logged = true;
    }
    struct pollfd pfd{.fd = device.fd(), .events = POLLIN, .revents = 0};
    if (poll(&pfd, 1, -1) < 0) {
      if (errno == EINTR)
        continue;
      KBTAP_IO_LOG_ERROR("poll failed on %s: %s", device.name().c_str(),
                         strerror(errno));
      return false;
    }
    discarded.clear();
    if (!device.readEvents(discarded)) {
      KBTAP_IO_LOG_ERROR("%s went away while waiting for key release",
                         device.name().c_str());
      return false;
    }
  }
}

bool GrabManager::grabAll(std::vector<std::unique_ptr<InputDevice>> devices) {
  std::size_t grabbedBefore = m_devices.size();
  for (auto &device : devices) {
    if (!waitForKeyRelease(*device) || !device->grab()) {
      KBTAP_IO_LOG_ERROR("Could not grab %s; releasing %zu grabbed device(s)",
                         device->name().c_str(),
                         m_devices.size() - grabbedBefore);
      while (m_devices.size() > grabbedBefore) {
        if (!m_devices.back()->ungrab())
          KBTAP_IO_LOG_WARN("Release of %s failed",
                            m_devices.back()->name().c_str());
        m_devices.pop_back();
      }
      m_grabbedCount.store(m_devices.size());
      return false;
    }
    m_devices.push_back(std::move(device));
    m_grabbedCount.store(m_devices.size());
  }
  return true;
}

void GrabManager::releaseAll() {
  for (auto &device : m_devices) {
    if (device->isGrabbed() && !device->ungrab())
      KBTAP_IO_LOG_WARN("Release of %s failed", device->name().c_str());
  }
  m_devices.clear();
  m_grabbedCount.store(0);
}

void GrabManager::drop(InputDevice *device) {
  auto it = std::find_if(m_devices.begin(), m_devices.end(),
                         [device](const auto &d) { return d.get() == device; });
  if (it == m_devices.end())
    return;
  // An unplugged device cannot be ungrabbed; the kernel already dropped it.
  if ((*it)->isGrabbed() && !(*it)->ungrab())
    KBTAP_IO_LOG_DEBUG("Ignoring release failure of %s",
                       (*it)->name().c_str());
  m_devices.erase(it);
  m_grabbedCount.store(m_devices.size());
}

} // namespace kbtap::io::keyboard
