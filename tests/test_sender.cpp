#include <catch2/catch_all.hpp>

#include <kbtap-io/keyboard/sender.hpp>

#include "support/fake_devices.hpp"
#include "support/log_capture.hpp"

#include <memory>
#include <string_view>
#include <tuple>
#include <vector>

using namespace kbtap::io::keyboard;
using kbtap::io::test::LogCapture;
using kbtap::io::test::RecordingSink;

namespace {

using Ev = std::tuple<int, int, int>;

std::vector<Ev> all(const RecordingSink &sink) {
  std::vector<Ev> out;
  for (const auto &ev : sink.events())
    out.emplace_back(ev.type, ev.code, ev.value);
  return out;
}

struct Fixture {
  std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
  Sender sender{sink};
  int paces = 0;

  Fixture() {
    sender.setPacer([this] { ++paces; });
  }
};

} // namespace

TEST_CASE("sendString brackets shifted characters and syncs every toggle",
          "[sender]") {
  Fixture f;
  REQUIRE(f.sender.isReady());
  REQUIRE(f.sender.sendString("Hi"));

  const Ev syn{EV_SYN, SYN_REPORT, 0};
  std::vector<Ev> expected = {
      {EV_KEY, KEY_LEFTSHIFT, 1}, syn, {EV_KEY, KEY_H, 1}, syn,
      {EV_KEY, KEY_H, 0},         syn, {EV_KEY, KEY_LEFTSHIFT, 0}, syn,
      {EV_KEY, KEY_I, 1},         syn, {EV_KEY, KEY_I, 0},         syn,
  };
  CHECK(all(*f.sink) == expected);
}

TEST_CASE("pacer runs after modifiers and between characters", "[sender]") {
  Fixture f;
  REQUIRE(f.sender.sendString("ab"));
  CHECK(f.paces == 3);

  f.paces = 0;
  REQUIRE(f.sender.sendString(""));
  CHECK(f.paces == 0);
  CHECK(f.sink->keyEvents().size() == 4);
}

TEST_CASE("sendBackspaces taps backspace", "[sender]") {
  Fixture f;
  REQUIRE(f.sender.sendBackspaces(3));
  auto keys = f.sink->keyEvents();
  REQUIRE(keys.size() == 6);
  for (std::size_t i = 0; i < keys.size(); ++i) {
    CHECK(keys[i].first == KEY_BACKSPACE);
    CHECK(keys[i].second == (i % 2 == 0 ? 1 : 0));
  }

  f.sink->clear();
  REQUIRE(f.sender.sendBackspaces(0));
  CHECK(f.sink->events().empty());
}

TEST_CASE("layout selection changes the emitted scan codes", "[sender]") {
  Fixture f;
  CHECK(f.sender.layoutName() == "qwerty");
  f.sender.setLayout("qwertz");
  CHECK(f.sender.layoutName() == "qwertz");
  REQUIRE(f.sender.sendString("z"));
  CHECK(f.sink->keyEvents() ==
        std::vector<std::pair<int, int>>{{KEY_Y, 1}, {KEY_Y, 0}});

  LogCapture warnings;
  f.sender.setLayout("nope");
  CHECK(f.sender.layoutName() == "qwerty");
  CHECK(warnings.contains("nope"));
}

TEST_CASE("characters outside the layout use the Unicode entry sequence",
          "[sender]") {
  Fixture f;
  REQUIRE(f.sender.sendString("\xC3\xA9")); // U+00E9

  std::vector<std::pair<int, int>> expected = {
      {KEY_LEFTCTRL, 1}, {KEY_LEFTSHIFT, 1}, {KEY_U, 1},     {KEY_U, 0},
      {KEY_LEFTSHIFT, 0}, {KEY_LEFTCTRL, 0}, {KEY_E, 1},     {KEY_E, 0},
      {KEY_9, 1},         {KEY_9, 0},        {KEY_ENTER, 1}, {KEY_ENTER, 0},
  };
  CHECK(f.sink->keyEvents() == expected);
}

TEST_CASE("sendUnicode writes lowercase hex digits", "[sender]") {
  Fixture f;
  REQUIRE(f.sender.sendUnicode(U'\U0001F600'));

  std::vector<int> digits;
  auto keys = f.sink->keyEvents();
  // Skip the six trigger events and the trailing Enter press/release.
  REQUIRE(keys.size() == 6 + 5 * 2 + 2);
  for (std::size_t i = 6; i + 2 < keys.size(); i += 2)
    digits.push_back(keys[i].first);
  CHECK(digits == std::vector<int>{KEY_1, KEY_F, KEY_6, KEY_0, KEY_0});
}

TEST_CASE("sendKeyCombination emits parsed steps and skips unknown names",
          "[sender]") {
  Fixture f;

  SECTION("without a parser the call is refused") {
    LogCapture warnings;
    CHECK_FALSE(f.sender.sendKeyCombination("ctrl_l(c)"));
    CHECK(f.sink->events().empty());
    CHECK(warnings.contains("parser"));
  }

  SECTION("each step is one key event") {
    f.sender.setComboParser([](std::string_view expr) {
      CHECK(expr == "ctrl_l(c)");
      return std::vector<KeyComboStep>{
          {"ctrl_l", true}, {"c", true}, {"c", false}, {"ctrl_l", false}};
    });
    REQUIRE(f.sender.sendKeyCombination("ctrl_l(c)"));
    CHECK(f.sink->keyEvents() ==
          std::vector<std::pair<int, int>>{{KEY_LEFTCTRL, 1},
                                           {KEY_C, 1},
                                           {KEY_C, 0},
                                           {KEY_LEFTCTRL, 0}});
    CHECK(f.paces == 3);
  }

  SECTION("unresolvable names warn and are dropped") {
    f.sender.setComboParser([](std::string_view) {
      return std::vector<KeyComboStep>{{"bogus", true},
                                       {"a", true},
                                       {"a", false},
                                       {"bogus", false}};
    });
    LogCapture warnings;
    CHECK_FALSE(f.sender.sendKeyCombination("bogus(a)"));
    CHECK(f.sink->keyEvents() ==
          std::vector<std::pair<int, int>>{{KEY_A, 1}, {KEY_A, 0}});
    CHECK(warnings.contains("bogus"));
  }
}

TEST_CASE("keyDown and keyUp press modifiers around the key", "[sender]") {
  Fixture f;
  REQUIRE(f.sender.keyDown("A"));
  REQUIRE(f.sender.keyUp("A"));
  CHECK(f.sink->keyEvents() ==
        std::vector<std::pair<int, int>>{{KEY_LEFTSHIFT, 1},
                                         {KEY_A, 1},
                                         {KEY_A, 0},
                                         {KEY_LEFTSHIFT, 0}});

  f.sink->clear();
  REQUIRE(f.sender.tap("f5"));
  CHECK(f.sink->keyEvents() ==
        std::vector<std::pair<int, int>>{{KEY_F5, 1}, {KEY_F5, 0}});

  LogCapture warnings;
  CHECK_FALSE(f.sender.keyDown("hyper_x"));
}

TEST_CASE("an unready sink fails every send", "[sender]") {
  auto sink = std::make_shared<RecordingSink>();
  sink->ready = false;
  Sender sender(sink);
  sender.setKeyDelay(0);

  LogCapture errors(kbtap::io::log::Level::Error);
  CHECK_FALSE(sender.isReady());
  CHECK_FALSE(sender.sendString("a"));
  CHECK(sink->events().empty());
  CHECK(errors.contains("not ready"));
}

TEST_CASE("flush emits a lone barrier", "[sender]") {
  Fixture f;
  f.sender.flush();
  REQUIRE(f.sink->events().size() == 1);
  CHECK(f.sink->events()[0].type == EV_SYN);
}
