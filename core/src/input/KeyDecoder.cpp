#include "pd/input/KeyDecoder.hpp"

namespace pd {

namespace {

struct KeyMapping {
  unsigned code;
  Key key;
  char ch;
};

constexpr KeyMapping kKeyMap[] = {
  {KEY_ESC,      Key::Escape,   0},
  {KEY_ENTER,    Key::Enter,    0},
  {KEY_KPENTER,  Key::Enter,    0},
  {KEY_TAB,      Key::Tab,      0},
  {KEY_SPACE,    Key::Space,    0},
  {KEY_UP,       Key::Up,       0},
  {KEY_DOWN,     Key::Down,     0},
  {KEY_LEFT,     Key::Left,     0},
  {KEY_RIGHT,    Key::Right,    0},
  {KEY_PAGEUP,   Key::PageUp,   0},
  {KEY_PAGEDOWN, Key::PageDown, 0},
  {KEY_HOME,     Key::Home,     0},
  {KEY_END,      Key::End,      0},
  {KEY_1,        Key::Num1,     0},
  {KEY_2,        Key::Num2,     0},
  {KEY_3,        Key::Num3,     0},
  {KEY_4,        Key::Num4,     0},
  {KEY_5,        Key::Num5,     0},
  {KEY_Q,        Key::Char,     'q'},
  {KEY_W,        Key::Char,     'w'},
  {KEY_R,        Key::Char,     'r'},
  {KEY_H,        Key::Char,     'h'},
  {KEY_J,        Key::Char,     'j'},
  {KEY_K,        Key::Char,     'k'},
  {KEY_L,        Key::Char,     'l'},
  {KEY_C,        Key::Char,     'c'},
  {KEY_M,        Key::Char,     'm'},
};

} // namespace

const char* keyName(Key k) {
  switch (k) {
    case Key::Up:       return "Up";
    case Key::Down:     return "Down";
    case Key::Left:     return "Left";
    case Key::Right:    return "Right";
    case Key::PageUp:   return "PageUp";
    case Key::PageDown: return "PageDown";
    case Key::Home:     return "Home";
    case Key::End:      return "End";
    case Key::Enter:    return "Enter";
    case Key::Escape:   return "Escape";
    case Key::Tab:      return "Tab";
    case Key::ShiftTab: return "ShiftTab";
    case Key::Space:    return "Space";
    case Key::Num1:     return "1";
    case Key::Num2:     return "2";
    case Key::Num3:     return "3";
    case Key::Num4:     return "4";
    case Key::Num5:     return "5";
    case Key::Char:     return "Char";
  }
  return "?";
}

bool KeyDecoder::mapCode(unsigned code, bool shift, KeyEvent& out) {
  for (const auto& m : kKeyMap) {
    if (m.code != code) continue;
    out.key = (m.key == Key::Tab && shift) ? Key::ShiftTab : m.key;
    out.ch = m.ch;
    return true;
  }
  return false;
}

void KeyDecoder::reset() {
  pressed_.reset();
  leftShift_ = false;
  rightShift_ = false;
}

bool KeyDecoder::decode(const input_event& ev, KeyEvent& out) {
  if (ev.type != EV_KEY || ev.code >= KEY_CNT) return false;

  // value: 0 = release, 1 = press, 2 = autorepeat
  if (ev.code == KEY_LEFTSHIFT)  { leftShift_ = ev.value != 0; return false; }
  if (ev.code == KEY_RIGHTSHIFT) { rightShift_ = ev.value != 0; return false; }

  if (ev.value == 0) {
    pressed_.reset(ev.code);
    return false;
  }
  if (ev.value == 2) {
    if (!emitRepeats_ || !pressed_.test(ev.code)) return false;
    return mapCode(ev.code, shiftHeld(), out);
  }
  if (ev.value != 1 || pressed_.test(ev.code)) return false;

  pressed_.set(ev.code);
  return mapCode(ev.code, shiftHeld(), out);
}

} // namespace pd
