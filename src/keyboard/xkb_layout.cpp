/**
 * @file keyboard/xkb_layout.cpp
 * @brief Layout derived from an XKB keymap through libxkbcommon.
 *
 * Mirrors the physical keycode scan used by the uinput sender: every XKB
 * keycode is probed at the base, Shift and AltGr levels and the produced
 * character is recorded with the modifiers needed to type it.
 */

#include <kbtap-io/keyboard/layout.hpp>
#include <kbtap-io/log.hpp>

#include "keyboard/layout_tables.hpp"

#include <linux/input-event-codes.h>
#include <xkbcommon/xkbcommon.h>

#include <unordered_set>

namespace kbtap::io::keyboard {

namespace {

// xkbcommon keycodes are evdev keycodes offset by 8.
constexpr xkb_keycode_t kEvdevOffset = 8;

struct LevelModifiers {
  xkb_level_index_t level;
  std::vector<int> modifiers;
};

const char *nullIfEmpty(const std::string &s) {
  return s.empty() ? nullptr : s.c_str();
}

// Named keys and control characters survive from the base table; single
// printable characters come from the keymap instead.
bool keepFromBase(const std::string &name) {
  if (name.size() != 1)
    return true;
  auto c = static_cast<unsigned char>(name[0]);
  return c < 0x20;
}

} // namespace

std::optional<Layout> Layout::fromXkb(const std::string &rules,
                                      const std::string &model,
                                      const std::string &layout,
                                      const std::string &variant,
                                      const std::string &options) {
  struct xkb_context *ctx = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
  if (!ctx) {
    KBTAP_IO_LOG_ERROR("Layout (xkb): xkb_context_new() failed");
    return std::nullopt;
  }

  struct xkb_rule_names names{};
  names.rules = nullIfEmpty(rules);
  names.model = nullIfEmpty(model);
  names.layout = nullIfEmpty(layout);
  names.variant = nullIfEmpty(variant);
  names.options = nullIfEmpty(options);

  struct xkb_keymap *keymap =
      xkb_keymap_new_from_names(ctx, &names, XKB_KEYMAP_COMPILE_NO_FLAGS);
  if (!keymap) {
    KBTAP_IO_LOG_ERROR(
        "Layout (xkb): xkb_keymap_new_from_names() failed for layout='%s'",
        layout.c_str());
    xkb_context_unref(ctx);
    return std::nullopt;
  }

  std::vector<Entry> entries;
  for (auto &entry : detail::baseEntries()) {
    if (keepFromBase(entry.first))
      entries.push_back(std::move(entry));
  }

  const LevelModifiers levels[] = {
      {0, {}},
      {1, {KEY_LEFTSHIFT}},
      {2, {KEY_RIGHTALT}},
  };

  std::unordered_set<std::string> seen;
  const xkb_keycode_t minKey = xkb_keymap_min_keycode(keymap);
  const xkb_keycode_t maxKey = xkb_keymap_max_keycode(keymap);

  // Lower levels first so a character reachable without modifiers is never
  // typed through a chord.
  for (const auto &lvl : levels) {
    for (xkb_keycode_t xkbKey = minKey; xkbKey <= maxKey; ++xkbKey) {
      if (xkbKey <= kEvdevOffset)
        continue;
      if (lvl.level >= xkb_keymap_num_levels_for_key(keymap, xkbKey, 0))
        continue;

      const xkb_keysym_t *syms = nullptr;
      int count =
          xkb_keymap_key_get_syms_by_level(keymap, xkbKey, 0, lvl.level, &syms);
      if (count != 1)
        continue;

      char utf8[8] = {0};
      if (xkb_keysym_to_utf8(syms[0], utf8, sizeof(utf8)) <= 0)
        continue;
      std::string ch(utf8);
      if (ch.empty() || (ch.size() == 1 &&
                         (static_cast<unsigned char>(ch[0]) < 0x20 ||
                          ch[0] == 0x7f)))
        continue;
      if (!seen.insert(ch).second)
        continue;

      entries.emplace_back(
          ch, KeyCodeInfo{static_cast<int>(xkbKey - kEvdevOffset),
                          lvl.modifiers});
    }
  }

  xkb_keymap_unref(keymap);
  xkb_context_unref(ctx);

  Layout result(std::string(kXkbLayoutName), std::move(entries));
  std::string missing = result.missingPrintable();
  if (!missing.empty()) {
    KBTAP_IO_LOG_WARN("Layout (xkb): %zu printable characters have no key and "
                      "will be typed through Unicode entry",
                      missing.size());
  }
  KBTAP_IO_LOG_INFO("Layout (xkb): derived %zu entries", result.size());
  return result;
}

} // namespace kbtap::io::keyboard
