#pragma once
/**
 * @file keyboard/common/linux_layout.hpp
 * @brief Internal helpers for detecting the session's XKB keyboard layout.
 *
 * This header is intentionally placed under `src/` (not installed) because it
 * is an internal implementation detail of the layout registry.
 */

#include <string>

namespace kbtap::io::keyboard::detail {

/**
 * @brief Container for XKB rule names components.
 *
 * These fields correspond to `struct xkb_rule_names` fields. Callers populate
 * an `xkb_rule_names` instance by assigning `.c_str()` pointers from these
 * strings; empty fields are passed as nullptr so libxkbcommon uses its own
 * defaults.
 */
struct XkbRuleNamesStrings {
  std::string rules;
  std::string model;
  std::string layout;
  std::string variant;
  std::string options;

  bool empty() const {
    return rules.empty() && model.empty() && layout.empty() &&
           variant.empty() && options.empty();
  }
};

/**
 * @brief Detect XKB rule names for the current session.
 *
 * Detection strategy (best-effort):
 * 1) `XKB_DEFAULT_*` environment variables.
 * 2) `/etc/default/keyboard` (Debian/Ubuntu-style), filling missing fields.
 * 3) If the layout is still missing, guess it from the locale (`LC_ALL`,
 *    `LC_MESSAGES`, `LANG`).
 *
 * The function does not invoke external commands.
 */
XkbRuleNamesStrings detectXkbRuleNames();

/**
 * @brief Parse `/etc/default/keyboard`-style content into @p out.
 *
 * Only empty fields of @p out are filled. Exposed for tests.
 */
void applyKeyboardDefaults(const std::string &content,
                           XkbRuleNamesStrings &out);

/**
 * @brief Name of the bundled layout closest to an XKB layout/variant pair.
 *
 * "de"/"at"/"ch" map to qwertz, the colemak variants to colemak or
 * colemak-dh; anything else maps to qwerty.
 */
std::string bundledLayoutFor(const XkbRuleNamesStrings &names);

} // namespace kbtap::io::keyboard::detail
