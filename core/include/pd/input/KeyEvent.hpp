#pragma once
#include <cstdint>

namespace pd {

enum class Key : std::uint8_t {
  Up, Down, Left, Right,
  PageUp, PageDown, Home, End,
  Enter, Escape, Tab, ShiftTab, Space,
  Num1, Num2, Num3, Num4, Num5,
  Char      // literal character in KeyEvent::ch
};

struct KeyEvent {
  Key key{Key::Char};
  char ch{0};

  static KeyEvent named(Key k) { return KeyEvent{k, 0}; }
  static KeyEvent character(char c) { return KeyEvent{Key::Char, c}; }

  bool isChar(char c) const { return key == Key::Char && ch == c; }
};

inline bool operator==(const KeyEvent& a, const KeyEvent& b) {
  return a.key == b.key && (a.key != Key::Char || a.ch == b.ch);
}
inline bool operator!=(const KeyEvent& a, const KeyEvent& b) { return !(a == b); }

const char* keyName(Key k);

} // namespace pd
