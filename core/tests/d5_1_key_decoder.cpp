// D5.1: Key decoder
// Tests:
//   1. Mapping table: named keys and literal characters
//   2. Escape held down yields exactly one event across polls
//   3. Release without a prior press yields nothing; release re-arms
//   4. Autorepeat dropped by default, emitted when enabled
//   5. Shift + Tab -> ShiftTab, either shift key
//   6. Unmapped codes and non-key events yield nothing

#include "pd/input/KeyDecoder.hpp"
#include "pd/input/KeyEvent.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static input_event keyEv(unsigned code, int value) {
  input_event ev;
  std::memset(&ev, 0, sizeof(ev));
  ev.type = EV_KEY;
  ev.code = static_cast<__u16>(code);
  ev.value = value;
  return ev;
}

static input_event synEv() {
  input_event ev;
  std::memset(&ev, 0, sizeof(ev));
  ev.type = EV_SYN;
  ev.code = SYN_REPORT;
  return ev;
}

int main() {
  // --- Test 1: mapping table ---
  {
    struct Expect { unsigned code; pd::KeyEvent ev; };
    const Expect table[] = {
      {KEY_ESC, pd::KeyEvent::named(pd::Key::Escape)},
      {KEY_ENTER, pd::KeyEvent::named(pd::Key::Enter)},
      {KEY_KPENTER, pd::KeyEvent::named(pd::Key::Enter)},
      {KEY_TAB, pd::KeyEvent::named(pd::Key::Tab)},
      {KEY_SPACE, pd::KeyEvent::named(pd::Key::Space)},
      {KEY_UP, pd::KeyEvent::named(pd::Key::Up)},
      {KEY_DOWN, pd::KeyEvent::named(pd::Key::Down)},
      {KEY_LEFT, pd::KeyEvent::named(pd::Key::Left)},
      {KEY_RIGHT, pd::KeyEvent::named(pd::Key::Right)},
      {KEY_PAGEUP, pd::KeyEvent::named(pd::Key::PageUp)},
      {KEY_PAGEDOWN, pd::KeyEvent::named(pd::Key::PageDown)},
      {KEY_HOME, pd::KeyEvent::named(pd::Key::Home)},
      {KEY_END, pd::KeyEvent::named(pd::Key::End)},
      {KEY_1, pd::KeyEvent::named(pd::Key::Num1)},
      {KEY_5, pd::KeyEvent::named(pd::Key::Num5)},
      {KEY_Q, pd::KeyEvent::character('q')},
      {KEY_C, pd::KeyEvent::character('c')},
      {KEY_H, pd::KeyEvent::character('h')},
      {KEY_L, pd::KeyEvent::character('l')},
      {KEY_M, pd::KeyEvent::character('m')},
    };
    for (const auto& e : table) {
      pd::KeyEvent got;
      requireTrue(pd::KeyDecoder::mapCode(e.code, false, got), "mapped");
      if (got != e.ev) {
        std::fprintf(stderr, "code %u -> %s\n", e.code, pd::keyName(got.key));
        requireTrue(false, "mapping matches table");
      }
    }
    pd::KeyEvent unused;
    requireTrue(!pd::KeyDecoder::mapCode(KEY_F1, false, unused), "F1 unmapped");
    requireTrue(pd::KeyEvent::character('q').isChar('q'), "isChar");
    requireTrue(pd::KeyEvent::character('q') != pd::KeyEvent::character('w'), "chars differ");
    std::printf("  Test 1 (mapping table): PASS\n");
  }

  // --- Test 2: held escape ---
  {
    pd::KeyDecoder dec;
    pd::KeyEvent out;
    int events = 0;
    if (dec.decode(keyEv(KEY_ESC, 1), out)) events++;
    requireTrue(events == 1 && out.key == pd::Key::Escape, "press emits Escape");
    requireTrue(dec.isPressed(KEY_ESC), "tracked as pressed");
    // Many frames later the key is still down; a duplicate press report
    // and autorepeats must not emit again.
    for (int frame = 0; frame < 60; frame++) {
      if (dec.decode(keyEv(KEY_ESC, 2), out)) events++;
      if (dec.decode(keyEv(KEY_ESC, 1), out)) events++;
      if (dec.decode(synEv(), out)) events++;
    }
    requireTrue(events == 1, "exactly one Escape while held");
    std::printf("  Test 2 (edge-triggered escape): PASS\n");
  }

  // --- Test 3: release handling ---
  {
    pd::KeyDecoder dec;
    pd::KeyEvent out;
    requireTrue(!dec.decode(keyEv(KEY_ENTER, 0), out), "release without press");
    requireTrue(dec.decode(keyEv(KEY_ENTER, 1), out), "press");
    requireTrue(!dec.decode(keyEv(KEY_ENTER, 0), out), "release emits nothing");
    requireTrue(!dec.isPressed(KEY_ENTER), "released");
    requireTrue(dec.decode(keyEv(KEY_ENTER, 1), out), "second press after release");
    dec.reset();
    requireTrue(!dec.isPressed(KEY_ENTER), "reset clears state");
    std::printf("  Test 3 (release handling): PASS\n");
  }

  // --- Test 4: autorepeat ---
  {
    pd::KeyDecoder quiet;
    pd::KeyDecoder repeating(true);
    pd::KeyEvent out;
    requireTrue(quiet.decode(keyEv(KEY_DOWN, 1), out), "press");
    requireTrue(repeating.decode(keyEv(KEY_DOWN, 1), out), "press");
    int quietCount = 0, repeatCount = 0;
    for (int i = 0; i < 5; i++) {
      if (quiet.decode(keyEv(KEY_DOWN, 2), out)) quietCount++;
      if (repeating.decode(keyEv(KEY_DOWN, 2), out)) {
        repeatCount++;
        requireTrue(out.key == pd::Key::Down, "repeat is Down");
      }
    }
    requireTrue(quietCount == 0, "repeats dropped by default");
    requireTrue(repeatCount == 5, "repeats emitted when enabled");
    requireTrue(!repeating.decode(keyEv(KEY_UP, 2), out), "repeat without press ignored");
    std::printf("  Test 4 (autorepeat): PASS\n");
  }

  // --- Test 5: shift-tab ---
  {
    pd::KeyDecoder dec;
    pd::KeyEvent out;
    requireTrue(!dec.decode(keyEv(KEY_LEFTSHIFT, 1), out), "shift alone emits nothing");
    requireTrue(dec.shiftHeld(), "shift held");
    requireTrue(dec.decode(keyEv(KEY_TAB, 1), out) && out.key == pd::Key::ShiftTab,
                "left shift + tab");
    dec.decode(keyEv(KEY_TAB, 0), out);
    dec.decode(keyEv(KEY_LEFTSHIFT, 0), out);
    requireTrue(!dec.shiftHeld(), "shift released");
    requireTrue(dec.decode(keyEv(KEY_TAB, 1), out) && out.key == pd::Key::Tab, "plain tab");
    dec.decode(keyEv(KEY_TAB, 0), out);
    dec.decode(keyEv(KEY_RIGHTSHIFT, 1), out);
    requireTrue(dec.decode(keyEv(KEY_TAB, 1), out) && out.key == pd::Key::ShiftTab,
                "right shift + tab");
    std::printf("  Test 5 (shift-tab): PASS\n");
  }

  // --- Test 6: ignored input ---
  {
    pd::KeyDecoder dec;
    pd::KeyEvent out;
    requireTrue(!dec.decode(keyEv(KEY_F5, 1), out), "unmapped key");
    requireTrue(!dec.decode(synEv(), out), "EV_SYN");
    input_event rel = keyEv(0, 5);
    rel.type = EV_REL;
    requireTrue(!dec.decode(rel, out), "EV_REL");
    requireTrue(!dec.decode(keyEv(KEY_CNT + 1, 1), out), "out of range code");
    std::printf("  Test 6 (ignored input): PASS\n");
  }

  std::printf("D5.1 key decoder: ALL PASS\n");
  return 0;
}
