#include <kbtap-io/keyboard/suppression.hpp>

namespace kbtap::io::keyboard {

SuppressionState::SuppressionState(const ReverseLayout &reverse)
    : m_reverse(reverse) {}

void SuppressionState::reset() {
  m_downModifiers.clear();
  m_keysDownWithModifier.clear();
}

Decision SuppressionState::classify(const RawEvent &ev,
                                    const SuppressedKeys &suppressed) {
  if (ev.type != EV_KEY)
    return {};
  auto name = m_reverse.reverseResolve(ev.code);
  if (!name)
    return {};

  const int code = ev.code;
  const auto value = static_cast<KeyValue>(ev.value);

  if (isModifierCode(code)) {
    if (value == KeyValue::Down)
      m_downModifiers.insert(code);
    else if (value == KeyValue::Up)
      m_downModifiers.erase(code);
    if (value == KeyValue::Repeat)
      return {};
    return {.passThrough = true,
            .keyName = std::move(name),
            .pressed = value == KeyValue::Down};
  }

  switch (value) {
  case KeyValue::Down:
    if (!m_downModifiers.empty()) {
      m_keysDownWithModifier.insert(code);
      return {.passThrough = true, .keyName = std::move(name), .pressed = true};
    }
    return {.passThrough = !suppressed.contains(*name),
            .keyName = std::move(name),
            .pressed = true};
  case KeyValue::Up:
    if (m_keysDownWithModifier.erase(code) > 0)
      return {.passThrough = true, .keyName = std::move(name), .pressed = false};
    return {.passThrough = !suppressed.contains(*name),
            .keyName = std::move(name),
            .pressed = false};
  case KeyValue::Repeat:
    if (m_keysDownWithModifier.contains(code))
      return {};
    return {.passThrough = !suppressed.contains(*name)};
  }
  // Unknown EV_KEY values go through untouched.
  return {};
}

} // namespace kbtap::io::keyboard
