/**
 * @file keyboard/layout_tables.cpp
 * @brief Static layout data for the bundled layouts.
 *
 * Layouts list only what differs from the shared base; a later entry with the
 * same name replaces the earlier one when the Layout is built.
 */

#include "keyboard/layout_tables.hpp"

#include <linux/input-event-codes.h>

#include <cstddef>
#include <iterator>
#include <string>

namespace kbtap::io::keyboard::detail {

namespace {

using Entries = std::vector<Layout::Entry>;

void key(Entries &out, std::string name, int code) {
  out.emplace_back(std::move(name), KeyCodeInfo{code, {}});
}

void shifted(Entries &out, std::string name, int code) {
  out.emplace_back(std::move(name), KeyCodeInfo{code, {KEY_LEFTSHIFT}});
}

void altgr(Entries &out, std::string name, int code) {
  out.emplace_back(std::move(name), KeyCodeInfo{code, {KEY_RIGHTALT}});
}

// Unshifted and shifted character on one physical key.
void pair(Entries &out, std::string plain, std::string shift, int code) {
  key(out, std::move(plain), code);
  shifted(out, std::move(shift), code);
}

// Lowercase letters typed on consecutive physical keys of a row, with their
// uppercase variants on Shift.
void letters(Entries &out, const char *chars, const int *codes) {
  for (std::size_t i = 0; chars[i] != '\0'; ++i) {
    const char lower = chars[i];
    const char upper = static_cast<char>(lower - 'a' + 'A');
    pair(out, std::string(1, lower), std::string(1, upper), codes[i]);
  }
}

constexpr int kTopRow[] = {KEY_Q, KEY_W, KEY_E, KEY_R, KEY_T,
                           KEY_Y, KEY_U, KEY_I, KEY_O, KEY_P};
constexpr int kHomeRow[] = {KEY_A, KEY_S, KEY_D, KEY_F, KEY_G,
                            KEY_H, KEY_J, KEY_K, KEY_L, KEY_SEMICOLON};
constexpr int kBottomRow[] = {KEY_Z, KEY_X, KEY_C, KEY_V,
                              KEY_B, KEY_N, KEY_M};

// US punctuation keys right of the letter rows.
void usPunctuation(Entries &out) {
  pair(out, "[", "{", KEY_LEFTBRACE);
  pair(out, "]", "}", KEY_RIGHTBRACE);
  pair(out, "\\", "|", KEY_BACKSLASH);
  pair(out, ";", ":", KEY_SEMICOLON);
  pair(out, "'", "\"", KEY_APOSTROPHE);
  pair(out, ",", "<", KEY_COMMA);
  pair(out, ".", ">", KEY_DOT);
  pair(out, "/", "?", KEY_SLASH);
}

} // namespace

Entries baseEntries() {
  Entries out;
  out.reserve(160);

  // Modifiers
  key(out, "alt_l", KEY_LEFTALT);
  key(out, "alt_r", KEY_RIGHTALT);
  key(out, "alt", KEY_LEFTALT);
  key(out, "ctrl_l", KEY_LEFTCTRL);
  key(out, "ctrl_r", KEY_RIGHTCTRL);
  key(out, "ctrl", KEY_LEFTCTRL);
  key(out, "control_l", KEY_LEFTCTRL);
  key(out, "control_r", KEY_RIGHTCTRL);
  key(out, "control", KEY_LEFTCTRL);
  key(out, "shift_l", KEY_LEFTSHIFT);
  key(out, "shift_r", KEY_RIGHTSHIFT);
  key(out, "shift", KEY_LEFTSHIFT);
  key(out, "super_l", KEY_LEFTMETA);
  key(out, "super_r", KEY_RIGHTMETA);
  key(out, "super", KEY_LEFTMETA);

  // Number row (US symbols; other layouts override)
  pair(out, "`", "~", KEY_GRAVE);
  pair(out, "1", "!", KEY_1);
  pair(out, "2", "@", KEY_2);
  pair(out, "3", "#", KEY_3);
  pair(out, "4", "$", KEY_4);
  pair(out, "5", "%", KEY_5);
  pair(out, "6", "^", KEY_6);
  pair(out, "7", "&", KEY_7);
  pair(out, "8", "*", KEY_8);
  pair(out, "9", "(", KEY_9);
  pair(out, "0", ")", KEY_0);
  pair(out, "-", "_", KEY_MINUS);
  pair(out, "=", "+", KEY_EQUAL);
  key(out, "\b", KEY_BACKSPACE);

  // Whitespace and editing
  key(out, " ", KEY_SPACE);
  key(out, "\n", KEY_ENTER);
  key(out, "return", KEY_ENTER);
  key(out, "tab", KEY_TAB);
  key(out, "backspace", KEY_BACKSPACE);
  key(out, "delete", KEY_DELETE);
  key(out, "escape", KEY_ESC);
  key(out, "clear", KEY_CLEAR);

  // Navigation
  key(out, "up", KEY_UP);
  key(out, "down", KEY_DOWN);
  key(out, "left", KEY_LEFT);
  key(out, "right", KEY_RIGHT);
  key(out, "page_up", KEY_PAGEUP);
  key(out, "page_down", KEY_PAGEDOWN);
  key(out, "home", KEY_HOME);
  key(out, "insert", KEY_INSERT);
  key(out, "end", KEY_END);
  key(out, "space", KEY_SPACE);
  key(out, "print", KEY_PRINT);

  // Function keys
  key(out, "fn", KEY_FN);
  constexpr int kFunctionKeys[] = {
      KEY_F1,  KEY_F2,  KEY_F3,  KEY_F4,  KEY_F5,  KEY_F6,
      KEY_F7,  KEY_F8,  KEY_F9,  KEY_F10, KEY_F11, KEY_F12,
      KEY_F13, KEY_F14, KEY_F15, KEY_F16, KEY_F17, KEY_F18,
      KEY_F19, KEY_F20, KEY_F21, KEY_F22, KEY_F23, KEY_F24};
  for (std::size_t i = 0; i < std::size(kFunctionKeys); ++i)
    key(out, "f" + std::to_string(i + 1), kFunctionKeys[i]);

  // Numpad
  constexpr int kKeypadDigits[] = {KEY_KP0, KEY_KP1, KEY_KP2, KEY_KP3,
                                   KEY_KP4, KEY_KP5, KEY_KP6, KEY_KP7,
                                   KEY_KP8, KEY_KP9};
  for (int digit = 1; digit <= 9; ++digit)
    key(out, "kp_" + std::to_string(digit), kKeypadDigits[digit]);
  key(out, "kp_0", KEY_KP0);
  key(out, "kp_add", KEY_KPPLUS);
  key(out, "kp_decimal", KEY_KPDOT);
  key(out, "kp_delete", KEY_DELETE); // no dedicated keypad delete code
  key(out, "kp_divide", KEY_KPSLASH);
  key(out, "kp_enter", KEY_KPENTER);
  key(out, "kp_equal", KEY_KPEQUAL);
  key(out, "kp_multiply", KEY_KPASTERISK);
  key(out, "kp_subtract", KEY_KPMINUS);

  // Media and system keys
  key(out, "audioraisevolume", KEY_VOLUMEUP);
  key(out, "audiolowervolume", KEY_VOLUMEDOWN);
  key(out, "monbrightnessup", KEY_BRIGHTNESSUP);
  key(out, "monbrightnessdown", KEY_BRIGHTNESSDOWN);
  key(out, "audiomute", KEY_MUTE);
  key(out, "num_lock", KEY_NUMLOCK);
  key(out, "eject", KEY_EJECTCD);
  key(out, "audiopause", KEY_PAUSE);
  key(out, "audionext", KEY_NEXT);
  key(out, "audioplay", KEY_PLAY);
  key(out, "audiorewind", KEY_REWIND);
  key(out, "kbdbrightnessup", KEY_KBDILLUMUP);
  key(out, "kbdbrightnessdown", KEY_KBDILLUMDOWN);

  return out;
}

Entries qwertyEntries() {
  Entries out = baseEntries();
  letters(out, "qwertyuiop", kTopRow);
  letters(out, "asdfghjkl", kHomeRow);
  letters(out, "zxcvbnm", kBottomRow);
  usPunctuation(out);
  return out;
}

// German T1 layout. AltGr symbols are listed so the table covers printable
// ASCII. "^" and "`" are dead keys on this layout.
Entries qwertzEntries() {
  Entries out = baseEntries();

  // Number row
  key(out, "^", KEY_GRAVE);
  shifted(out, "°", KEY_GRAVE);
  pair(out, "1", "!", KEY_1);
  pair(out, "2", "\"", KEY_2);
  altgr(out, "²", KEY_2);
  pair(out, "3", "§", KEY_3);
  altgr(out, "³", KEY_3);
  pair(out, "4", "$", KEY_4);
  pair(out, "5", "%", KEY_5);
  pair(out, "6", "&", KEY_6);
  pair(out, "7", "/", KEY_7);
  altgr(out, "{", KEY_7);
  pair(out, "8", "(", KEY_8);
  altgr(out, "[", KEY_8);
  pair(out, "9", ")", KEY_9);
  altgr(out, "]", KEY_9);
  pair(out, "0", "=", KEY_0);
  altgr(out, "}", KEY_0);
  pair(out, "ß", "?", KEY_MINUS);
  altgr(out, "\\", KEY_MINUS);
  pair(out, "´", "`", KEY_EQUAL);

  // Top row
  letters(out, "qwertzuiop", kTopRow);
  altgr(out, "@", KEY_Q);
  altgr(out, "€", KEY_E);
  pair(out, "ü", "Ü", KEY_LEFTBRACE);
  pair(out, "+", "*", KEY_RIGHTBRACE);
  altgr(out, "~", KEY_RIGHTBRACE);

  // Middle row
  letters(out, "asdfghjkl", kHomeRow);
  pair(out, "ö", "Ö", KEY_SEMICOLON);
  pair(out, "ä", "Ä", KEY_APOSTROPHE);
  pair(out, "#", "'", KEY_BACKSLASH);

  // Bottom row
  pair(out, "<", ">", KEY_102ND);
  altgr(out, "|", KEY_102ND);
  letters(out, "yxcvbnm", kBottomRow);
  altgr(out, "µ", KEY_M);
  pair(out, ",", ";", KEY_COMMA);
  pair(out, ".", ":", KEY_DOT);
  pair(out, "-", "_", KEY_SLASH);

  return out;
}

Entries colemakEntries() {
  Entries out = baseEntries();
  usPunctuation(out);
  letters(out, "qwfpgjluy", kTopRow);
  pair(out, ";", ":", KEY_P);
  letters(out, "arstdhneio", kHomeRow);
  letters(out, "zxcvbkm", kBottomRow);
  return out;
}

// Colemak Mod-DH, angle-mod bottom row: "z" moves to the B position.
Entries colemakDhEntries() {
  Entries out = baseEntries();
  usPunctuation(out);
  letters(out, "qwfpbjluy", kTopRow);
  pair(out, ";", ":", KEY_P);
  letters(out, "arstgmneio", kHomeRow);
  letters(out, "xcdvzkh", kBottomRow);
  return out;
}

} // namespace kbtap::io::keyboard::detail
