#include <catch2/catch_all.hpp>

#include <kbtap-io/keyboard/device.hpp>

#include <initializer_list>

using namespace kbtap::io::keyboard;

namespace {

// A full-size keyboard: EV_KEY/EV_MSC/EV_LED/EV_REP with the usual keys.
DeviceCapabilities keyboardCaps(const std::string &name = "AT Keyboard") {
  DeviceCapabilities caps;
  caps.name = name;
  caps.phys = "isa0060/serio0/input0";
  for (int ev : {EV_SYN, EV_KEY, EV_MSC, EV_LED, EV_REP})
    caps.events.set(ev);
  for (int code = KEY_ESC; code <= KEY_KPDOT; ++code)
    caps.keys.set(code);
  return caps;
}

} // namespace

TEST_CASE("a regular keyboard is a candidate", "[device]") {
  CaptureOptions options;
  CHECK(isCandidateKeyboard(keyboardCaps(), options));
}

TEST_CASE("the library's own virtual device is never grabbed", "[device]") {
  CaptureOptions options;
  CHECK_FALSE(
      isCandidateKeyboard(keyboardCaps(std::string(kVirtualDeviceName)),
                          options));

  DeviceCapabilities byPhys = keyboardCaps("Some name");
  byPhys.phys = std::string(kVirtualDeviceName);
  CHECK_FALSE(isCandidateKeyboard(byPhys, options));

  options.reservedDeviceName = "other-uinput";
  CHECK(isCandidateKeyboard(keyboardCaps(std::string(kVirtualDeviceName)),
                            options));
}

TEST_CASE("pointer devices and switches are rejected", "[device]") {
  CaptureOptions options;

  DeviceCapabilities mouse = keyboardCaps("Gaming Mouse");
  mouse.events.set(EV_REL);
  CHECK_FALSE(isCandidateKeyboard(mouse, options));

  DeviceCapabilities touchpad = keyboardCaps("Touchpad");
  touchpad.events.set(EV_ABS);
  CHECK_FALSE(isCandidateKeyboard(touchpad, options));

  DeviceCapabilities lid = keyboardCaps("Lid Switch");
  lid.events.set(EV_SW);
  CHECK_FALSE(isCandidateKeyboard(lid, options));
}

TEST_CASE("devices with too few keys are rejected", "[device]") {
  CaptureOptions options;

  DeviceCapabilities power;
  power.name = "Power Button";
  power.events.set(EV_KEY);
  power.keys.set(KEY_POWER);
  CHECK_FALSE(isCandidateKeyboard(power, options));

  // Enough keys, and all the required ones, but under a raised threshold.
  DeviceCapabilities small = power;
  for (int code : {KEY_ESC, KEY_SPACE, KEY_ENTER, KEY_LEFTSHIFT})
    small.keys.set(code);
  for (int code = KEY_Q; code <= KEY_P; ++code)
    small.keys.set(code);
  for (int code = KEY_A; code <= KEY_L; ++code)
    small.keys.set(code);
  REQUIRE(small.keyCount() == 24);
  CHECK(isCandidateKeyboard(small, options));
  options.minimumKeyCount = 25;
  CHECK_FALSE(isCandidateKeyboard(small, options));
}

TEST_CASE("one typing key is enough to be a keyboard", "[device]") {
  CaptureOptions options;
  for (int code : {KEY_ESC, KEY_SPACE, KEY_ENTER, KEY_LEFTSHIFT}) {
    CAPTURE(code);
    DeviceCapabilities caps = keyboardCaps("Compact Keyboard");
    caps.keys.reset(code);
    CHECK(isCandidateKeyboard(caps, options));
  }

  // 82 keys without a dedicated Escape.
  DeviceCapabilities noEscape = keyboardCaps("Compact Keyboard");
  noEscape.keys.reset(KEY_ESC);
  REQUIRE(noEscape.keyCount() == 82);
  CHECK(isCandidateKeyboard(noEscape, options));
}

TEST_CASE("devices without any typing key are rejected", "[device]") {
  CaptureOptions options;
  DeviceCapabilities caps = keyboardCaps("Macro Pad");
  for (int code : {KEY_ESC, KEY_SPACE, KEY_ENTER, KEY_LEFTSHIFT})
    caps.keys.reset(code);
  REQUIRE(caps.keyCount() >= options.minimumKeyCount);
  CHECK_FALSE(isCandidateKeyboard(caps, options));
}

TEST_CASE("discovery of a missing input directory finds nothing",
          "[device]") {
  CaptureOptions options;
  options.inputDirectory = "/nonexistent/kbtap-io/input";
  CHECK(listCandidateKeyboards(options).empty());
}
