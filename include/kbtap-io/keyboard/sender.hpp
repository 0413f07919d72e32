#pragma once

/**
 * @file keyboard/sender.hpp
 * @brief Layout-aware keystroke and text synthesis through uinput.
 *
 * This header declares the `kbtap::io::keyboard::Sender` class that turns
 * strings, backspace counts and key-combination expressions into physical
 * key events on a virtual input device.
 *
 * Characters the active layout can type are emitted as modifier-bracketed
 * key presses. Anything else goes through the desktop input method's Unicode
 * entry sequence (Ctrl+Shift+U, hex digits, Enter). That fallback needs an
 * IME such as IBus or fcitx5 bound to the default trigger, and fast emission
 * can outrun slower clients; raise the key delay if characters get lost.
 *
 * @par Usage:
 * @code{.cpp}
 * #include <kbtap-io/keyboard/sender.hpp>
 *
 * int main() {
 *   using namespace kbtap::io::keyboard;
 *   Sender sender;
 *   if (sender.isReady()) {
 *     sender.setLayout("qwerty");
 *     sender.sendString("Hello, world");
 *     sender.sendBackspaces(5);
 *   }
 *   return 0;
 * }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <kbtap-io/keyboard/common.hpp>
#include <kbtap-io/keyboard/layout.hpp>

namespace kbtap {
namespace io {
namespace keyboard {

/**
 * @class Sender
 * @brief Synthetic output emulator.
 *
 * Every key toggle is followed by an EV_SYN/SYN_REPORT barrier so the input
 * stack never observes a half-applied chord. Not thread-safe; use one Sender
 * per thread.
 */
class KBTAP_IO_API Sender {
public:
  /**
   * @brief Create a Sender writing to a new uinput device, using qwerty.
   */
  Sender();

  /**
   * @brief Create a Sender writing to an existing sink.
   * @param sink Destination for synthesized events (a `UInputDevice`, or a
   *             recording sink in tests).
   * @param layout Layout used to resolve characters and key names.
   */
  explicit Sender(std::shared_ptr<EventSink> sink,
                  Layout layout = Layout::physical());

  ~Sender();

  // Non-copyable, movable
  Sender(const Sender &) = delete;
  Sender &operator=(const Sender &) = delete;
  Sender(Sender &&) noexcept;
  Sender &operator=(Sender &&) noexcept;

  // --- Info ---
  /**
   * @brief Check whether the output device is ready to accept events.
   */
  [[nodiscard]] bool isReady() const;

  /// Name of the active layout.
  [[nodiscard]] const std::string &layoutName() const;

  // --- Configuration ---
  /**
   * @brief Select the layout by name.
   *
   * Unknown names log a warning and select qwerty.
   */
  void setLayout(std::string_view name);

  /// Use an already-built layout.
  void setLayout(Layout layout);

  /**
   * @brief Set the delay used by the default pacer.
   * @param delayUs Delay in microseconds (0 disables pacing).
   */
  void setKeyDelay(uint32_t delayUs);

  /**
   * @brief Replace the pacing policy.
   *
   * The pacer runs between characters of `sendString`, after the modifiers of
   * a chorded character are pressed, between steps of `sendKeyCombination`,
   * and around the hex digits of a Unicode entry. An empty pacer restores the
   * key-delay sleep.
   */
  void setPacer(Pacer pacer);

  /**
   * @brief Install the parser used by `sendKeyCombination`.
   */
  void setComboParser(KeyComboParser parser);

  // --- Output ---
  /**
   * @brief Type UTF-8 text.
   * @return true if every event was written.
   */
  bool sendString(std::string_view utf8Text);

  /**
   * @brief Press and release Backspace @p count times.
   */
  bool sendBackspaces(std::size_t count);

  /**
   * @brief Emit the press/release steps of a key-combination expression.
   *
   * Each step is one key event; the expression decides the press and release
   * order. Key names the layout cannot resolve are logged and skipped.
   *
   * @return false if no parser is installed, a step was skipped, or a write
   *         failed.
   */
  bool sendKeyCombination(std::string_view combo);

  /**
   * @brief Enter one code point through the IME Unicode sequence.
   */
  bool sendUnicode(char32_t codepoint);

  // --- Physical key events ---
  /**
   * @brief Press a logical key (and its required modifiers, in order).
   */
  bool keyDown(std::string_view keyName);

  /**
   * @brief Release a logical key, then its modifiers in reverse order.
   */
  bool keyUp(std::string_view keyName);

  /**
   * @brief Convenience: keyDown, pace, keyUp.
   */
  bool tap(std::string_view keyName);

  /**
   * @brief Emit a standalone synchronization barrier.
   */
  void flush();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace keyboard
} // namespace io
} // namespace kbtap
