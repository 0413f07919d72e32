/**
 * @file keyboard/layout.cpp
 * @brief Layout lookup, bundled layout registry and reverse mapping.
 */

#include <kbtap-io/keyboard/layout.hpp>
#include <kbtap-io/log.hpp>

#include "keyboard/common/linux_layout.hpp"
#include "keyboard/layout_tables.hpp"

#include <linux/input-event-codes.h>

#include <algorithm>
#include <map>
#include <stdexcept>

namespace kbtap::io::keyboard {

namespace {

// string.printable without "\t\n\r\x0b\x0c"; newline and backspace are
// checked separately because the emitter relies on them.
const std::string &requiredCharacters() {
  static const std::string chars =
      "0123456789"
      "abcdefghijklmnopqrstuvwxyz"
      "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
      "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~"
      " \n\b";
  return chars;
}

struct Registry {
  std::map<std::string, Layout, std::less<>> layouts;

  Registry() {
    add(Layout(std::string(kDefaultLayoutName), detail::qwertyEntries()));
    add(Layout("qwertz", detail::qwertzEntries()));
    add(Layout("colemak", detail::colemakEntries()));
    add(Layout("colemak-dh", detail::colemakDhEntries()));
  }

  void add(Layout layout) {
    std::string missing = layout.missingPrintable();
    if (!missing.empty()) {
      throw std::logic_error("kbtap-io: bundled layout '" + layout.name() +
                             "' cannot type " +
                             std::to_string(missing.size()) +
                             " required characters");
    }
    std::string name = layout.name();
    layouts.emplace(std::move(name), std::move(layout));
  }
};

const Registry &registry() {
  static const Registry instance;
  return instance;
}

std::optional<Layout> layoutFromSessionXkb() {
  detail::XkbRuleNamesStrings names = detail::detectXkbRuleNames();
  KBTAP_IO_LOG_INFO("Layout: deriving from XKB layout='%s' variant='%s'",
                    names.layout.c_str(), names.variant.c_str());
  return Layout::fromXkb(names.rules, names.model, names.layout,
                         names.variant, names.options);
}

} // namespace

Layout::Layout(std::string name, std::vector<Entry> entries)
    : m_name(std::move(name)) {
  m_entries.reserve(entries.size());
  for (auto &entry : entries) {
    auto it = m_index.find(entry.first);
    if (it != m_index.end()) {
      m_entries[it->second].second = std::move(entry.second);
      continue;
    }
    m_index.emplace(entry.first, m_entries.size());
    m_entries.push_back(std::move(entry));
  }
}

Layout Layout::byName(std::string_view name) {
  const Registry &reg = registry();
  auto it = reg.layouts.find(name);
  if (it != reg.layouts.end())
    return it->second;

  if (name == kAutoLayoutName) {
    std::string detected =
        detail::bundledLayoutFor(detail::detectXkbRuleNames());
    KBTAP_IO_LOG_INFO("Layout: auto-selected %s", detected.c_str());
    return reg.layouts.find(detected)->second;
  }

  if (name == kXkbLayoutName) {
    if (auto derived = layoutFromSessionXkb())
      return std::move(*derived);
    KBTAP_IO_LOG_WARN("Layout: could not derive a layout from XKB. Falling "
                      "back to %s.",
                      std::string(kDefaultLayoutName).c_str());
    return physical();
  }

  KBTAP_IO_LOG_WARN("Layout %s not supported. Falling back to %s.",
                    std::string(name).c_str(),
                    std::string(kDefaultLayoutName).c_str());
  return physical();
}

const Layout &Layout::physical() {
  return registry().layouts.find(kDefaultLayoutName)->second;
}

std::vector<std::string> Layout::bundledLayoutNames() {
  std::vector<std::string> names;
  for (const auto &[name, layout] : registry().layouts)
    names.push_back(name);
  names.emplace_back(kAutoLayoutName);
  names.emplace_back(kXkbLayoutName);
  return names;
}

std::optional<KeyCodeInfo> Layout::resolve(std::string_view key) const {
  auto it = m_index.find(std::string(key));
  if (it == m_index.end())
    return std::nullopt;
  return m_entries[it->second].second;
}

std::string Layout::missingPrintable() const {
  std::string missing;
  for (char c : requiredCharacters()) {
    if (m_index.find(std::string(1, c)) == m_index.end())
      missing.push_back(c);
  }
  return missing;
}

ReverseLayout ReverseLayout::fromLayout(const Layout &layout) {
  ReverseLayout reverse;
  for (const auto &[name, info] : layout.entries()) {
    if (!info.modifiers.empty())
      continue;
    reverse.m_names[info.keycode] = name;
  }
  KBTAP_IO_LOG_DEBUG("ReverseLayout: %zu keycodes from layout %s",
                     reverse.m_names.size(), layout.name().c_str());
  return reverse;
}

const ReverseLayout &ReverseLayout::physical() {
  static const ReverseLayout instance = fromLayout(Layout::physical());
  return instance;
}

std::optional<std::string> ReverseLayout::reverseResolve(int keycode) const {
  auto it = m_names.find(keycode);
  if (it == m_names.end())
    return std::nullopt;
  return it->second;
}

const std::vector<int> &modifierCodes() {
  static const std::vector<int> codes = {
      KEY_LEFTSHIFT, KEY_RIGHTSHIFT, KEY_LEFTCTRL, KEY_RIGHTCTRL,
      KEY_LEFTALT,   KEY_RIGHTALT,   KEY_LEFTMETA, KEY_RIGHTMETA,
  };
  return codes;
}

bool isModifierCode(int keycode) noexcept {
  switch (keycode) {
  case KEY_LEFTSHIFT:
  case KEY_RIGHTSHIFT:
  case KEY_LEFTCTRL:
  case KEY_RIGHTCTRL:
  case KEY_LEFTALT:
  case KEY_RIGHTALT:
  case KEY_LEFTMETA:
  case KEY_RIGHTMETA:
    return true;
  default:
    return false;
  }
}

} // namespace kbtap::io::keyboard
