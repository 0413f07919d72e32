#include <kbtap-io/keyboard/capture.hpp>

#include <kbtap-io/keyboard/grab_manager.hpp>
#include <kbtap-io/keyboard/uinput_device.hpp>
#include <kbtap-io/log.hpp>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <mutex>
#include <poll.h>
#include <sys/eventfd.h>
#include <thread>
#include <unistd.h>

namespace kbtap::io::keyboard {

struct Capture::Impl {
  KeyCallback callback;
  CaptureOptions options;
  DeviceProvider deviceProvider;
  SinkFactory sinkFactory;

  GrabManager grabs;
  std::shared_ptr<EventSink> sink;
  SuppressionState state;

  mutable std::mutex suppressedMutex;
  std::shared_ptr<const SuppressedKeys> suppressed =
      std::make_shared<const SuppressedKeys>();

  int cancelFd{-1};
  std::thread worker;
  std::atomic<bool> running{false};

  Impl(KeyCallback cb, CaptureOptions opts, DeviceProvider devices,
       SinkFactory sinks)
      : callback(std::move(cb)), options(std::move(opts)),
        deviceProvider(std::move(devices)), sinkFactory(std::move(sinks)) {}

  ~Impl() {
    stop();
    if (cancelFd >= 0)
      close(cancelFd);
  }

  std::shared_ptr<const SuppressedKeys> currentSuppressed() const {
    std::lock_guard<std::mutex> lock(suppressedMutex);
    return suppressed;
  }

  bool start() {
    if (worker.joinable()) {
      if (running.load()) {
        KBTAP_IO_LOG_WARN("Capture: already running");
        return false;
      }
      // The previous run ended on its own (emergency release).
      worker.join();
    }

    if (cancelFd < 0) {
      cancelFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
      if (cancelFd < 0) {
        KBTAP_IO_LOG_ERROR("Capture: eventfd failed: %s", strerror(errno));
        return false;
      }
    }
    drainCancel();

    auto devices = deviceProvider(options);
    if (devices.empty()) {
      KBTAP_IO_LOG_ERROR("Capture: no keyboard to capture");
      return false;
    }
    if (!grabs.grabAll(std::move(devices)))
      return false;

    sink = sinkFactory(options);
    if (!sink || !sink->isReady()) {
      KBTAP_IO_LOG_ERROR("Capture: pass-through device unavailable");
      sink.reset();
      grabs.releaseAll();
      return false;
    }

    state.reset();
    running.store(true);
    worker = std::thread([this] { run(); });
    KBTAP_IO_LOG_INFO("Capture: started on %zu device(s)",
                      grabs.grabbedCount());
    return true;
  }

  void stop() {
    if (!worker.joinable())
      return;
    uint64_t one = 1;
    ssize_t wrote = ::write(cancelFd, &one, sizeof(one));
    if (wrote != static_cast<ssize_t>(sizeof(one)))
      KBTAP_IO_LOG_ERROR("Capture: cancel signal failed: %s", strerror(errno));
    worker.join();
    KBTAP_IO_LOG_INFO("Capture: stopped");
  }

  void drainCancel() {
    uint64_t value = 0;
    while (::read(cancelFd, &value, sizeof(value)) > 0) {
    }
  }

  // Releases the devices and the virtual device however the loop exits.
  struct Cleanup {
    Impl &impl;
    ~Cleanup() {
      impl.grabs.releaseAll();
      impl.sink.reset();
      impl.running.store(false);
    }
  };

  void run() {
    Cleanup cleanup{*this};
    try {
      loop();
    } catch (const std::exception &e) {
      KBTAP_IO_LOG_ERROR("Capture: worker failed: %s", e.what());
    } catch (...) {
      KBTAP_IO_LOG_ERROR("Capture: worker failed with an unknown exception");
    }
  }

  void loop() {
    std::vector<struct pollfd> fds;
    std::vector<RawEvent> events;
    std::vector<InputDevice *> gone;

    for (;;) {
      fds.clear();
      fds.push_back({.fd = cancelFd, .events = POLLIN, .revents = 0});
      for (const auto &device : grabs.devices())
        fds.push_back({.fd = device->fd(), .events = POLLIN, .revents = 0});

      if (poll(fds.data(), fds.size(), -1) < 0) {
        if (errno == EINTR)
          continue;
        KBTAP_IO_LOG_ERROR("Capture: poll failed: %s", strerror(errno));
        return;
      }
      if (fds[0].revents & POLLIN) {
        drainCancel();
        return;
      }

      gone.clear();
      for (std::size_t i = 1; i < fds.size(); ++i) {
        if (fds[i].revents == 0)
          continue;
        InputDevice *device = grabs.devices()[i - 1].get();
        events.clear();
        bool alive = device->readEvents(events);
        for (const auto &ev : events) {
          if (!handle(ev))
            return;
        }
        if (!alive || (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)))
          gone.push_back(device);
      }

      for (InputDevice *device : gone) {
        KBTAP_IO_LOG_WARN("Capture: %s disappeared, no longer listening to it",
                          device->name().c_str());
        grabs.drop(device);
        if (grabs.devices().empty())
          KBTAP_IO_LOG_WARN("Capture: no keyboard left, waiting for cancel");
      }
    }
  }

  // Returns false when the loop must end.
  bool handle(const RawEvent &ev) {
    if (options.emergencyReleaseKey != 0 && ev.type == EV_KEY &&
        ev.code == options.emergencyReleaseKey &&
        ev.value == static_cast<int32_t>(KeyValue::Down)) {
      KBTAP_IO_LOG_WARN("Capture: emergency release key pressed, releasing "
                        "all keyboards");
      return false;
    }

    auto keys = currentSuppressed();
    Decision decision = state.classify(ev, *keys);
    if (decision.keyName && callback)
      callback(*decision.keyName, decision.pressed);
    if (decision.passThrough && !sink->write(ev))
      KBTAP_IO_LOG_DEBUG("Capture: dropped event type=%d code=%d", ev.type,
                         ev.code);
    return true;
  }
};

namespace {

std::vector<std::unique_ptr<InputDevice>>
discoverKeyboards(const CaptureOptions &options) {
  return listCandidateKeyboards(options);
}

std::shared_ptr<EventSink> createVirtualDevice(const CaptureOptions &options) {
  return std::make_shared<UInputDevice>(options.reservedDeviceName);
}

} // namespace

Capture::Capture(KeyCallback callback, CaptureOptions options)
    : Capture(std::move(callback), std::move(options), discoverKeyboards,
              createVirtualDevice) {}

Capture::Capture(KeyCallback callback, CaptureOptions options,
                 DeviceProvider devices, SinkFactory sinks)
    : m_impl(std::make_unique<Impl>(std::move(callback), std::move(options),
                                    std::move(devices), std::move(sinks))) {}

Capture::~Capture() = default;

bool Capture::start() { return m_impl->start(); }

void Capture::cancel() { m_impl->stop(); }

void Capture::suppress(SuppressedKeys keys) {
  auto next = std::make_shared<const SuppressedKeys>(std::move(keys));
  std::lock_guard<std::mutex> lock(m_impl->suppressedMutex);
  m_impl->suppressed = std::move(next);
}

bool Capture::isRunning() const { return m_impl->running.load(); }

std::size_t Capture::grabbedDeviceCount() const {
  return m_impl->grabs.grabbedCount();
}

const CaptureOptions &Capture::options() const { return m_impl->options; }

} // namespace kbtap::io::keyboard
