#include <catch2/catch_all.hpp>

#include <kbtap-io/log.hpp>

#include <string>
#include <vector>

using namespace kbtap::io;

namespace {

struct HandlerReset {
  ~HandlerReset() {
    log::setHandler(nullptr);
    log::setLevel(log::Level::Warn);
  }
};

} // namespace

TEST_CASE("a handler may log from inside the handler", "[log]") {
  HandlerReset reset;
  log::setLevel(log::Level::Info);

  std::vector<std::string> seen;
  log::setHandler([&seen](log::Level level, const std::string &message) {
    seen.push_back(message);
    if (level == log::Level::Warn)
      KBTAP_IO_LOG_INFO("echo: %s", message.c_str());
  });

  KBTAP_IO_LOG_WARN("device %d gone", 3);
  REQUIRE(seen.size() == 2);
  CHECK(seen[0] == "device 3 gone");
  CHECK(seen[1] == "echo: device 3 gone");
}

TEST_CASE("a handler may replace itself", "[log]") {
  HandlerReset reset;

  int firstCalls = 0;
  int secondCalls = 0;
  log::setHandler([&](log::Level, const std::string &) {
    ++firstCalls;
    log::setHandler([&](log::Level, const std::string &) { ++secondCalls; });
  });

  KBTAP_IO_LOG_ERROR("one");
  KBTAP_IO_LOG_ERROR("two");
  CHECK(firstCalls == 1);
  CHECK(secondCalls == 1);
}

TEST_CASE("messages below the threshold are dropped", "[log]") {
  HandlerReset reset;
  log::setLevel(log::Level::Error);

  int calls = 0;
  log::setHandler([&calls](log::Level, const std::string &) { ++calls; });
  KBTAP_IO_LOG_WARN("quiet");
  KBTAP_IO_LOG_ERROR("loud");
  CHECK(calls == 1);
}

TEST_CASE("level names parse case-insensitively", "[log]") {
  CHECK(log::parseLevel("debug", log::Level::Warn) == log::Level::Debug);
  CHECK(log::parseLevel("ERROR", log::Level::Warn) == log::Level::Error);
  CHECK(log::parseLevel("verbose", log::Level::Info) == log::Level::Info);
}
