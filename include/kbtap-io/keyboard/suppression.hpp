#pragma once
/**
 * @file keyboard/suppression.hpp
 * @brief Per-event pass-through/suppress decision for captured keys.
 */

#include <kbtap-io/keyboard/common.hpp>
#include <kbtap-io/keyboard/layout.hpp>

#include <optional>
#include <set>
#include <string>
#include <unordered_set>

namespace kbtap {
namespace io {
namespace keyboard {

/// Logical key names whose plain (unchorded) events are swallowed.
using SuppressedKeys = std::unordered_set<std::string>;

/**
 * @struct Decision
 * @brief Outcome of classifying one raw event.
 */
struct Decision {
  /// Re-emit the raw event through the virtual device.
  bool passThrough{true};
  /// Logical key name to report to the key callback, if any.
  std::optional<std::string> keyName;
  /// Press state reported with `keyName`.
  bool pressed{false};
};

/**
 * @class SuppressionState
 * @brief Tracks held modifiers and chorded keys, and decides per event
 *        whether it reaches the system.
 *
 * Rules, in order:
 *  - events that are not EV_KEY, or whose code has no logical name, pass
 *    through without notification;
 *  - modifiers always pass through and are reported;
 *  - a key pressed while a modifier is held is "chorded": it is reported and
 *    its press, repeats and release all pass through, even if the modifier is
 *    released first;
 *  - any other press or release is reported and suppressed iff its name is
 *    in the suppressed set;
 *  - autorepeat is never reported, and follows the same pass/suppress rule as
 *    the press that started it.
 *
 * Not thread-safe; owned by the capture worker.
 */
class KBTAP_IO_API SuppressionState {
public:
  explicit SuppressionState(
      const ReverseLayout &reverse = ReverseLayout::physical());

  [[nodiscard]] Decision classify(const RawEvent &ev,
                                  const SuppressedKeys &suppressed);

  /// Forget every held modifier and chorded key.
  void reset();

  [[nodiscard]] const std::set<int> &downModifiers() const {
    return m_downModifiers;
  }
  [[nodiscard]] const std::set<int> &keysDownWithModifier() const {
    return m_keysDownWithModifier;
  }

private:
  const ReverseLayout &m_reverse;
  std::set<int> m_downModifiers;
  std::set<int> m_keysDownWithModifier;
};

} // namespace keyboard
} // namespace io
} // namespace kbtap
