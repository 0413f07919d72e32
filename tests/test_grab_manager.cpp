#include <catch2/catch_all.hpp>

#include <kbtap-io/keyboard/grab_manager.hpp>

#include "support/fake_devices.hpp"
#include "support/log_capture.hpp"

#include <chrono>
#include <future>
#include <thread>

using namespace kbtap::io::keyboard;
using namespace kbtap::io::test;
using namespace std::chrono_literals;

TEST_CASE("grab waits until held keys are released", "[grab]") {
  auto control = std::make_shared<FakeKeyboardControl>();
  std::vector<std::unique_ptr<InputDevice>> devices;
  devices.push_back(FakeKeyboard::create("held", control, {KEY_A}));
  REQUIRE(devices.back());

  GrabManager grabs;
  auto result = std::async(std::launch::async, [&] {
    return grabs.grabAll(std::move(devices));
  });

  // Still held: the grab must not happen, however long we wait.
  CHECK(result.wait_for(200ms) == std::future_status::timeout);
  CHECK(control->grabCalls.load() == 0);
  CHECK_FALSE(control->grabbed.load());

  // Autorepeat keeps the key held.
  control->key(KEY_A, 2);
  CHECK(result.wait_for(100ms) == std::future_status::timeout);
  CHECK(control->grabCalls.load() == 0);

  control->key(KEY_A, 0);
  REQUIRE(result.wait_for(2s) == std::future_status::ready);
  CHECK(result.get());
  CHECK(control->grabbed.load());
  CHECK(grabs.grabbedCount() == 1);

  grabs.releaseAll();
  CHECK_FALSE(control->grabbed.load());
  CHECK(control->destroyed.load());
  CHECK(grabs.grabbedCount() == 0);
}

TEST_CASE("idle devices are grabbed immediately", "[grab]") {
  auto first = std::make_shared<FakeKeyboardControl>();
  auto second = std::make_shared<FakeKeyboardControl>();
  std::vector<std::unique_ptr<InputDevice>> devices;
  devices.push_back(FakeKeyboard::create("first", first));
  devices.push_back(FakeKeyboard::create("second", second));

  GrabManager grabs;
  REQUIRE(grabs.grabAll(std::move(devices)));
  CHECK(grabs.grabbedCount() == 2);
  CHECK(grabs.devices().size() == 2);
  CHECK(first->grabbed.load());
  CHECK(second->grabbed.load());
}

TEST_CASE("a failed grab releases the devices grabbed before it", "[grab]") {
  auto first = std::make_shared<FakeKeyboardControl>();
  auto second = std::make_shared<FakeKeyboardControl>();
  auto third = std::make_shared<FakeKeyboardControl>();
  second->failGrab = true;

  std::vector<std::unique_ptr<InputDevice>> devices;
  devices.push_back(FakeKeyboard::create("first", first));
  devices.push_back(FakeKeyboard::create("second", second));
  devices.push_back(FakeKeyboard::create("third", third));

  LogCapture errors(kbtap::io::log::Level::Error);
  GrabManager grabs;
  CHECK_FALSE(grabs.grabAll(std::move(devices)));

  CHECK(grabs.grabbedCount() == 0);
  CHECK(first->grabCalls.load() == 1);
  CHECK(first->ungrabCalls.load() == 1);
  CHECK_FALSE(first->grabbed.load());
  CHECK_FALSE(second->grabbed.load());
  CHECK(third->grabCalls.load() == 0);
  CHECK(first->destroyed.load());
  CHECK(third->destroyed.load());
  CHECK(errors.contains("second"));
}

TEST_CASE("an unreadable key state fails the grab", "[grab]") {
  auto first = std::make_shared<FakeKeyboardControl>();
  auto broken = std::make_shared<FakeKeyboardControl>();
  broken->failKeyState = true;

  std::vector<std::unique_ptr<InputDevice>> devices;
  devices.push_back(FakeKeyboard::create("first", first));
  devices.push_back(FakeKeyboard::create("broken", broken));

  LogCapture errors(kbtap::io::log::Level::Error);
  GrabManager grabs;
  CHECK_FALSE(grabs.grabAll(std::move(devices)));

  CHECK(broken->grabCalls.load() == 0);
  CHECK_FALSE(first->grabbed.load());
  CHECK(grabs.grabbedCount() == 0);
  CHECK(errors.contains("key state of broken"));
}

TEST_CASE("destroying the manager releases every grab", "[grab]") {
  auto control = std::make_shared<FakeKeyboardControl>();
  {
    std::vector<std::unique_ptr<InputDevice>> devices;
    devices.push_back(FakeKeyboard::create("kbd", control));
    GrabManager grabs;
    REQUIRE(grabs.grabAll(std::move(devices)));
    REQUIRE(control->grabbed.load());
  }
  CHECK_FALSE(control->grabbed.load());
  CHECK(control->destroyed.load());
}

TEST_CASE("drop releases a single device", "[grab]") {
  auto a = std::make_shared<FakeKeyboardControl>();
  auto b = std::make_shared<FakeKeyboardControl>();
  std::vector<std::unique_ptr<InputDevice>> devices;
  devices.push_back(FakeKeyboard::create("a", a));
  devices.push_back(FakeKeyboard::create("b", b));

  GrabManager grabs;
  REQUIRE(grabs.grabAll(std::move(devices)));
  grabs.drop(grabs.devices().front().get());
  CHECK(grabs.grabbedCount() == 1);
  CHECK(a->destroyed.load());
  CHECK_FALSE(b->destroyed.load());
  CHECK(grabs.devices().front()->name() == "b");
}
