#include <catch2/catch_all.hpp>

#include <kbtap-io/keyboard/suppression.hpp>

using namespace kbtap::io::keyboard;

namespace {

RawEvent key(int code, KeyValue value) {
  return makeEvent(EV_KEY, static_cast<uint16_t>(code),
                   static_cast<int32_t>(value));
}

} // namespace

TEST_CASE("plain keys are reported and suppressed by name", "[suppression]") {
  SuppressionState state;
  const SuppressedKeys suppressed{"a"};

  Decision down = state.classify(key(KEY_A, KeyValue::Down), suppressed);
  CHECK_FALSE(down.passThrough);
  REQUIRE(down.keyName);
  CHECK(*down.keyName == "a");
  CHECK(down.pressed);

  Decision up = state.classify(key(KEY_A, KeyValue::Up), suppressed);
  CHECK_FALSE(up.passThrough);
  REQUIRE(up.keyName);
  CHECK(*up.keyName == "a");
  CHECK_FALSE(up.pressed);

  Decision other = state.classify(key(KEY_B, KeyValue::Down), suppressed);
  CHECK(other.passThrough);
  CHECK(other.keyName == "b");
}

TEST_CASE("modifiers always pass through and are tracked", "[suppression]") {
  SuppressionState state;
  const SuppressedKeys suppressed{"shift", "control"};

  Decision shift = state.classify(key(KEY_LEFTSHIFT, KeyValue::Down),
                                  suppressed);
  CHECK(shift.passThrough);
  CHECK(shift.keyName == "shift");
  CHECK(state.downModifiers().contains(KEY_LEFTSHIFT));

  Decision repeat = state.classify(key(KEY_LEFTSHIFT, KeyValue::Repeat),
                                   suppressed);
  CHECK(repeat.passThrough);
  CHECK_FALSE(repeat.keyName);

  Decision release = state.classify(key(KEY_LEFTSHIFT, KeyValue::Up),
                                    suppressed);
  CHECK(release.passThrough);
  CHECK_FALSE(release.pressed);
  CHECK(state.downModifiers().empty());
}

TEST_CASE("a chorded key is released to the system even after its modifier",
          "[suppression]") {
  SuppressionState state;
  const SuppressedKeys suppressed{"a"};

  CHECK(state.classify(key(KEY_LEFTCTRL, KeyValue::Down), suppressed)
            .passThrough);

  Decision down = state.classify(key(KEY_A, KeyValue::Down), suppressed);
  CHECK(down.passThrough);
  CHECK(down.keyName == "a");
  CHECK(state.keysDownWithModifier().contains(KEY_A));

  CHECK(state.classify(key(KEY_A, KeyValue::Repeat), suppressed).passThrough);

  CHECK(state.classify(key(KEY_LEFTCTRL, KeyValue::Up), suppressed)
            .passThrough);

  Decision up = state.classify(key(KEY_A, KeyValue::Up), suppressed);
  CHECK(up.passThrough);
  CHECK(up.keyName == "a");
  CHECK_FALSE(up.pressed);
  CHECK(state.keysDownWithModifier().empty());

  // Once released, the key is plain again.
  CHECK_FALSE(
      state.classify(key(KEY_A, KeyValue::Down), suppressed).passThrough);
}

TEST_CASE("autorepeat is never reported", "[suppression]") {
  SuppressionState state;
  const SuppressedKeys suppressed{"a"};

  Decision suppressedRepeat =
      state.classify(key(KEY_A, KeyValue::Repeat), suppressed);
  CHECK_FALSE(suppressedRepeat.passThrough);
  CHECK_FALSE(suppressedRepeat.keyName);

  Decision plainRepeat = state.classify(key(KEY_B, KeyValue::Repeat), suppressed);
  CHECK(plainRepeat.passThrough);
  CHECK_FALSE(plainRepeat.keyName);
}

TEST_CASE("unmapped codes and non-key events pass through silently",
          "[suppression]") {
  SuppressionState state;
  const SuppressedKeys suppressed{"a"};

  Decision unmapped = state.classify(key(KEY_MACRO1, KeyValue::Down),
                                     suppressed);
  CHECK(unmapped.passThrough);
  CHECK_FALSE(unmapped.keyName);

  Decision syn = state.classify(makeEvent(EV_SYN, SYN_REPORT, 0), suppressed);
  CHECK(syn.passThrough);
  CHECK_FALSE(syn.keyName);

  // MSC_SCAN carries the scan code of KEY_A's position; it is not a key event.
  Decision scan = state.classify(makeEvent(EV_MSC, MSC_SCAN, KEY_A), suppressed);
  CHECK(scan.passThrough);
  CHECK_FALSE(scan.keyName);
}

TEST_CASE("reset forgets held modifiers", "[suppression]") {
  SuppressionState state;
  const SuppressedKeys suppressed{"a"};
  (void)state.classify(key(KEY_RIGHTALT, KeyValue::Down), suppressed);
  (void)state.classify(key(KEY_A, KeyValue::Down), suppressed);
  state.reset();
  CHECK(state.downModifiers().empty());
  CHECK(state.keysDownWithModifier().empty());
  CHECK_FALSE(
      state.classify(key(KEY_A, KeyValue::Up), suppressed).passThrough);
}
