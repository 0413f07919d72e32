#pragma once
/**
 * @file keyboard/layout.hpp
 * @brief Logical key name to physical evdev keycode tables.
 *
 * A `Layout` maps logical key names (lowercase words such as "shift_l" or
 * "page_up", single characters such as "a", "?" or "ü", and the control
 * characters "\b" and "\n") to the physical keycode and modifiers needed to
 * type them. Layouts are immutable once built and are passed by value into
 * the components that need them.
 *
 * The output side (`Sender`) honours the configured layout. The capture side
 * always classifies scan codes with `ReverseLayout::physical()`, because evdev
 * keycodes describe hardware positions, not the active logical layout.
 *
 * @par Usage:
 * @code{.cpp}
 * using namespace kbtap::io::keyboard;
 * Layout layout = Layout::byName("colemak");
 * if (auto info = layout.resolve("f")) {
 *   // info->keycode == KEY_E
 * }
 * @endcode
 */

#include <kbtap-io/keyboard/common.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kbtap {
namespace io {
namespace keyboard {

/// Name of the default bundled layout.
inline constexpr std::string_view kDefaultLayoutName = "qwerty";

/// Name selecting a layout derived from the session's XKB configuration.
inline constexpr std::string_view kXkbLayoutName = "xkb";

/// Name selecting the bundled layout closest to the session's XKB layout.
inline constexpr std::string_view kAutoLayoutName = "auto";

/**
 * @class Layout
 * @brief Immutable, ordered logical-name to KeyCodeInfo table.
 */
class KBTAP_IO_API Layout {
public:
  using Entry = std::pair<std::string, KeyCodeInfo>;

  /**
   * @brief Build a layout from entries in declaration order.
   *
   * A later entry with the same name replaces the earlier one in place.
   */
  Layout(std::string name, std::vector<Entry> entries);

  /**
   * @brief Look up a bundled layout (or "xkb" / "auto") by name.
   *
   * Unknown names, and an "xkb" layout that cannot be derived, log a warning
   * and fall back to qwerty. "auto" picks the bundled table matching the
   * detected XKB layout and variant.
   *
   * @throws std::logic_error on first use if a bundled table does not cover
   *         printable ASCII.
   */
  static Layout byName(std::string_view name);

  /// The qwerty layout, describing physical key positions.
  static const Layout &physical();

  /// Names accepted by `byName` without falling back.
  static std::vector<std::string> bundledLayoutNames();

  /**
   * @brief Derive a layout from an XKB keymap compiled from rule names.
   *
   * Keysyms at shift levels 1, 2 and 3 become unmodified, Shift and AltGr
   * entries layered over the shared named keys.
   *
   * @return The layout, or std::nullopt if libxkbcommon fails.
   */
  static std::optional<Layout> fromXkb(const std::string &rules,
                                       const std::string &model,
                                       const std::string &layout,
                                       const std::string &variant,
                                       const std::string &options);

  [[nodiscard]] const std::string &name() const { return m_name; }

  /// Resolve a logical key name to its keycode and modifiers.
  [[nodiscard]] std::optional<KeyCodeInfo> resolve(std::string_view key) const;

  /// Entries in declaration order.
  [[nodiscard]] const std::vector<Entry> &entries() const { return m_entries; }

  [[nodiscard]] std::size_t size() const { return m_entries.size(); }

  /**
   * @brief Printable ASCII characters this layout cannot type.
   *
   * Covers `string.printable` minus the tab, newline, carriage return,
   * vertical tab and form feed characters.
   */
  [[nodiscard]] std::string missingPrintable() const;

private:
  std::string m_name;
  std::vector<Entry> m_entries;
  std::unordered_map<std::string, std::size_t> m_index;
};

/**
 * @class ReverseLayout
 * @brief Keycode to unshifted logical key name.
 */
class KBTAP_IO_API ReverseLayout {
public:
  /**
   * @brief Invert a layout, keeping only entries without modifiers.
   *
   * Entries are applied in declaration order, so the last name declared for
   * a keycode wins.
   */
  static ReverseLayout fromLayout(const Layout &layout);

  /// Reverse map of `Layout::physical()`, built once.
  static const ReverseLayout &physical();

  [[nodiscard]] std::optional<std::string> reverseResolve(int keycode) const;

  [[nodiscard]] std::size_t size() const { return m_names.size(); }

private:
  std::unordered_map<int, std::string> m_names;
};

/// True for the left and right Shift, Ctrl, Alt and Meta keycodes.
[[nodiscard]] KBTAP_IO_API bool isModifierCode(int keycode) noexcept;

/// The modifier keycodes recognized by the capture state machine.
[[nodiscard]] KBTAP_IO_API const std::vector<int> &modifierCodes();

} // namespace keyboard
} // namespace io
} // namespace kbtap
