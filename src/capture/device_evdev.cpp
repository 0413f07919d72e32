#include <kbtap-io/keyboard/device.hpp>
#include <kbtap-io/log.hpp>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <initializer_list>
#include <iterator>
#include <sys/ioctl.h>
#include <unistd.h>

namespace kbtap::io::keyboard {

namespace {

constexpr std::size_t kBitsPerLong = sizeof(unsigned long) * CHAR_BIT;

template <std::size_t N>
constexpr std::size_t longsFor() {
  return (N + kBitsPerLong - 1) / kBitsPerLong;
}

template <std::size_t N>
std::bitset<N> toBitset(const unsigned long *words) {
  std::bitset<N> out;
  for (std::size_t bit = 0; bit < N; ++bit) {
    if (words[bit / kBitsPerLong] & (1UL << (bit % kBitsPerLong)))
      out.set(bit);
  }
  return out;
}

std::string ioctlString(int fd, unsigned long request) {
  char buf[256] = {0};
  if (ioctl(fd, request, buf) < 0)
    return {};
  return buf;
}

// "event12" -> 12, anything else -> -1.
int eventNodeNumber(std::string_view name) {
  constexpr std::string_view prefix = "event";
  if (name.size() <= prefix.size() || name.substr(0, prefix.size()) != prefix)
    return -1;
  int n = 0;
  for (char c : name.substr(prefix.size())) {
    if (c < '0' || c > '9')
      return -1;
    n = n * 10 + (c - '0');
  }
  return n;
}

} // namespace

bool isCandidateKeyboard(const DeviceCapabilities &caps,
                         const CaptureOptions &options) {
  if (!options.reservedDeviceName.empty() &&
      (caps.name == options.reservedDeviceName ||
       caps.phys == options.reservedDeviceName)) {
    KBTAP_IO_LOG_DEBUG("Device '%s' is our own virtual device, skipping",
                       caps.name.c_str());
    return false;
  }
  if (caps.events.test(EV_REL) || caps.events.test(EV_ABS)) {
    KBTAP_IO_LOG_DEBUG("Device '%s' is a pointer device, skipping",
                       caps.name.c_str());
    return false;
  }
  if (caps.events.test(EV_SW)) {
    KBTAP_IO_LOG_DEBUG("Device '%s' reports switches, skipping",
                       caps.name.c_str());
    return false;
  }
  if (!caps.events.test(EV_KEY) || caps.keyCount() < options.minimumKeyCount) {
    KBTAP_IO_LOG_DEBUG("Device '%s' has %zu keys (< %zu), skipping",
                       caps.name.c_str(), caps.keyCount(),
                       options.minimumKeyCount);
    return false;
  }
  const std::initializer_list<int> typingKeys = {KEY_ESC, KEY_SPACE,
                                                 KEY_ENTER, KEY_LEFTSHIFT};
  if (std::none_of(typingKeys.begin(), typingKeys.end(), [&](int code) {
        return caps.keys.test(static_cast<std::size_t>(code));
      })) {
    KBTAP_IO_LOG_DEBUG("Device '%s' has no typing keys, skipping",
                       caps.name.c_str());
    return false;
  }
  return true;
}

DeviceCapabilities queryCapabilities(int fd) {
  DeviceCapabilities caps;
  caps.name = ioctlString(fd, EVIOCGNAME(256));
  caps.phys = ioctlString(fd, EVIOCGPHYS(256));

  unsigned long evBits[longsFor<EV_CNT>()] = {0};
  if (ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) >= 0)
    caps.events = toBitset<EV_CNT>(evBits);
  else
    KBTAP_IO_LOG_DEBUG("EVIOCGBIT(0) failed: %s", strerror(errno));

  unsigned long keyBits[longsFor<KEY_CNT>()] = {0};
  if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits) >= 0)
    caps.keys = toBitset<KEY_CNT>(keyBits);
  else
    KBTAP_IO_LOG_DEBUG("EVIOCGBIT(EV_KEY) failed: %s", strerror(errno));
  return caps;
}

std::unique_ptr<EvdevDevice> EvdevDevice::open(const std::string &path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    KBTAP_IO_LOG_WARN("Failed to open %s: %s", path.c_str(), strerror(errno));
    return nullptr;
  }
  return std::unique_ptr<EvdevDevice>(
      new EvdevDevice(fd, path, queryCapabilities(fd)));
}

EvdevDevice::EvdevDevice(int fd, std::string path, DeviceCapabilities caps)
    : m_fd(fd), m_path(std::move(path)), m_caps(std::move(caps)) {
  m_label = m_caps.name.empty() ? m_path : m_caps.name + " (" + m_path + ")";
}

EvdevDevice::~EvdevDevice() {
  if (m_grabbed)
    ungrab();
  if (m_fd >= 0)
    close(m_fd);
}

std::optional<bool> EvdevDevice::hasActiveKeys() {
  unsigned long state[longsFor<KEY_CNT>()] = {0};
  if (ioctl(m_fd, EVIOCGKEY(sizeof(state)), state) < 0) {
    KBTAP_IO_LOG_WARN("EVIOCGKEY failed on %s: %s", m_label.c_str(),
                      strerror(errno));
    return std::nullopt;
  }
  return std::any_of(std::begin(state), std::end(state),
                     [](unsigned long w) { return w != 0; });
}

bool EvdevDevice::grab() {
  if (ioctl(m_fd, EVIOCGRAB, 1) < 0) {
    KBTAP_IO_LOG_ERROR("Failed to grab %s: %s", m_label.c_str(),
                       strerror(errno));
    return false;
  }
  m_grabbed = true;
  KBTAP_IO_LOG_INFO("Grabbed %s", m_label.c_str());
  return true;
}

bool EvdevDevice::ungrab() {
  m_grabbed = false;
  if (ioctl(m_fd, EVIOCGRAB, 0) < 0) {
    KBTAP_IO_LOG_WARN("Failed to release %s: %s", m_label.c_str(),
                      strerror(errno));
    return false;
  }
  KBTAP_IO_LOG_INFO("Released %s", m_label.c_str());
  return true;
}

bool EvdevDevice::readEvents(std::vector<RawEvent> &out) {
  RawEvent buf[64];
  for (;;) {
    ssize_t n = read(m_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK)
        return true;
      if (errno != ENODEV)
        KBTAP_IO_LOG_ERROR("Read failed on %s: %s", m_label.c_str(),
                           strerror(errno));
      return false;
    }
    if (n == 0)
      return false;
    std::size_t count = static_cast<std::size_t>(n) / sizeof(RawEvent);
    out.insert(out.end(), buf, buf + count);
    if (count < std::size(buf))
      return true;
  }
}

std::vector<std::unique_ptr<InputDevice>>
listCandidateKeyboards(const CaptureOptions &options) {
  std::vector<std::pair<int, std::string>> nodes;
  DIR *dir = opendir(options.inputDirectory.c_str());
  if (!dir) {
    KBTAP_IO_LOG_ERROR("Cannot open %s: %s", options.inputDirectory.c_str(),
                       strerror(errno));
    return {};
  }
  while (struct dirent *entry = readdir(dir)) {
    int number = eventNodeNumber(entry->d_name);
    if (number >= 0)
      nodes.emplace_back(number, options.inputDirectory + "/" + entry->d_name);
  }
  closedir(dir);
  std::sort(nodes.begin(), nodes.end());

  std::vector<std::unique_ptr<InputDevice>> devices;
  for (const auto &[number, path] : nodes) {
    auto device = EvdevDevice::open(path);
    if (!device)
      continue;
    if (!isCandidateKeyboard(device->capabilities(), options))
      continue;
    KBTAP_IO_LOG_INFO("Keyboard candidate: %s", device->name().c_str());
    devices.push_back(std::move(device));
  }
  if (devices.empty())
    KBTAP_IO_LOG_WARN("No keyboard devices found in %s",
                      options.inputDirectory.c_str());
  return devices;
}

} // namespace kbtap::io::keyboard
