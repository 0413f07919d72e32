#include <kbtap-io/keyboard/sender.hpp>

#include <kbtap-io/keyboard/uinput_device.hpp>
#include <kbtap-io/log.hpp>

#include "common/utf8.hpp"

#include <cstdio>
#include <ranges>
#include <vector>

namespace kbtap::io::keyboard {

namespace {

// Default IBus/fcitx5 Unicode entry trigger, i.e. "ctrl_l(shift(u))".
const std::vector<KeyComboStep> &unicodeTrigger() {
  static const std::vector<KeyComboStep> steps = {
      {"control_l", true}, {"shift", true},   {"u", true},
      {"u", false},        {"shift", false}, {"control_l", false},
  };
  return steps;
}

std::string lowercaseHex(char32_t codepoint) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%x", static_cast<unsigned>(codepoint));
  return buf;
}

} // namespace

struct Sender::Impl {
  std::shared_ptr<EventSink> sink;
  Layout layout;
  uint32_t keyDelayUs{1000};
  Pacer pacer;
  KeyComboParser comboParser;

  Impl(std::shared_ptr<EventSink> s, Layout l)
      : sink(std::move(s)), layout(std::move(l)) {}

  bool ready() const { return sink && sink->isReady(); }

  void pace() {
    if (pacer)
      pacer();
    else
      sleepUs(keyDelayUs);
  }

  bool pressKey(int code, bool down) {
    if (!ready()) {
      KBTAP_IO_LOG_ERROR("Sender: output device not ready");
      return false;
    }
    bool ok = sink->emit(EV_KEY, static_cast<uint16_t>(code), down ? 1 : 0);
    ok = sink->sync() && ok;
    KBTAP_IO_LOG_DEBUG("Sender: key code=%d %s", code, down ? "down" : "up");
    return ok;
  }

  bool typeResolved(const KeyCodeInfo &info) {
    bool ok = true;
    for (int mod : info.modifiers)
      ok = pressKey(mod, true) && ok;
    pace();
    ok = pressKey(info.keycode, true) && ok;
    ok = pressKey(info.keycode, false) && ok;
    for (int mod : std::views::reverse(info.modifiers))
      ok = pressKey(mod, false) && ok;
    return ok;
  }

  bool typeCharacter(char32_t cp) {
    std::string ch = detail::encodeUtf8(cp);
    if (auto info = layout.resolve(ch))
      return typeResolved(*info);
    KBTAP_IO_LOG_DEBUG("Sender: no key for U+%04X, using Unicode entry",
                       static_cast<unsigned>(cp));
    return typeUnicode(cp);
  }

  bool typeText(std::string_view utf8Text) {
    bool ok = true;
    bool first = true;
    for (char32_t cp : detail::decodeUtf8(utf8Text)) {
      if (!first)
        pace();
      first = false;
      ok = typeCharacter(cp) && ok;
    }
    return ok;
  }

  bool sendSteps(const std::vector<KeyComboStep> &steps) {
    bool ok = true;
    bool first = true;
    for (const auto &[name, pressed] : steps) {
      if (!first)
        pace();
      first = false;
      auto info = layout.resolve(name);
      if (!info) {
        KBTAP_IO_LOG_WARN("Key %s is not valid!", name.c_str());
        ok = false;
        continue;
      }
      ok = pressKey(info->keycode, pressed) && ok;
    }
    return ok;
  }

  bool typeUnicode(char32_t cp) {
    bool ok = sendSteps(unicodeTrigger());
    pace();
    ok = typeText(lowercaseHex(cp)) && ok;
    pace();
    auto enter = layout.resolve("\n");
    if (!enter) {
      KBTAP_IO_LOG_ERROR("Sender: layout %s has no newline key",
                         layout.name().c_str());
      return false;
    }
    return typeResolved(*enter) && ok;
  }
};

Sender::Sender()
    : Sender(std::make_shared<UInputDevice>(), Layout::physical()) {}

Sender::Sender(std::shared_ptr<EventSink> sink, Layout layout)
    : m_impl(std::make_unique<Impl>(std::move(sink), std::move(layout))) {
  KBTAP_IO_LOG_INFO("Sender: constructed, layout=%s ready=%u",
                    m_impl->layout.name().c_str(),
                    static_cast<unsigned>(m_impl->ready()));
}

Sender::~Sender() = default;
Sender::Sender(Sender &&) noexcept = default;
Sender &Sender::operator=(Sender &&) noexcept = default;

bool Sender::isReady() const { return m_impl && m_impl->ready(); }

const std::string &Sender::layoutName() const { return m_impl->layout.name(); }

void Sender::setLayout(std::string_view name) {
  m_impl->layout = Layout::byName(name);
  KBTAP_IO_LOG_INFO("Sender: layout set to %s", m_impl->layout.name().c_str());
}

void Sender::setLayout(Layout layout) { m_impl->layout = std::move(layout); }

void Sender::setKeyDelay(uint32_t delayUs) {
  KBTAP_IO_LOG_DEBUG("Sender::setKeyDelay(%u)", delayUs);
  m_impl->keyDelayUs = delayUs;
}

void Sender::setPacer(Pacer pacer) { m_impl->pacer = std::move(pacer); }

void Sender::setComboParser(KeyComboParser parser) {
  m_impl->comboParser = std::move(parser);
}

bool Sender::sendString(std::string_view utf8Text) {
  return m_impl->typeText(utf8Text);
}

bool Sender::sendBackspaces(std::size_t count) {
  bool ok = true;
  for (std::size_t i = 0; i < count; ++i)
    ok = m_impl->typeCharacter(U'\b') && ok;
  return ok;
}

bool Sender::sendKeyCombination(std::string_view combo) {
  if (!m_impl->comboParser) {
    KBTAP_IO_LOG_WARN("Sender: no key combination parser installed, "
                      "dropping '%.*s'",
                      static_cast<int>(combo.size()), combo.data());
    return false;
  }
  return m_impl->sendSteps(m_impl->comboParser(combo));
}

bool Sender::sendUnicode(char32_t codepoint) {
  return m_impl->typeUnicode(codepoint);
}

bool Sender::keyDown(std::string_view keyName) {
  auto info = m_impl->layout.resolve(keyName);
  if (!info) {
    KBTAP_IO_LOG_WARN("Key %.*s is not valid!",
                      static_cast<int>(keyName.size()), keyName.data());
    return false;
  }
  bool ok = true;
  for (int mod : info->modifiers)
    ok = m_impl->pressKey(mod, true) && ok;
  return m_impl->pressKey(info->keycode, true) && ok;
}

bool Sender::keyUp(std::string_view keyName) {
  auto info = m_impl->layout.resolve(keyName);
  if (!info) {
    KBTAP_IO_LOG_WARN("Key %.*s is not valid!",
                      static_cast<int>(keyName.size()), keyName.data());
    return false;
  }
  bool ok = m_impl->pressKey(info->keycode, false);
  for (int mod : std::views::reverse(info->modifiers))
    ok = m_impl->pressKey(mod, false) && ok;
  return ok;
}

bool Sender::tap(std::string_view keyName) {
  if (!keyDown(keyName))
    return false;
  m_impl->pace();
  return keyUp(keyName);
}

void Sender::flush() {
  if (m_impl->ready())
    m_impl->sink->sync();
}

} // namespace kbtap::io::keyboard
