#pragma once
#include "pd/input/KeyEvent.hpp"

#include <linux/input.h>

#include <bitset>

namespace pd {

// Raw evdev -> semantic keys, edge-triggered: a key yields one event on
// its released -> pressed transition and nothing while held. Shift state
// is tracked for Shift+Tab. Unmapped codes and non-key events yield
// nothing.
class KeyDecoder {
public:
  explicit KeyDecoder(bool emitRepeats = false) : emitRepeats_(emitRepeats) {}

  // Returns true and fills `out` when `ev` produces a semantic key.
  bool decode(const input_event& ev, KeyEvent& out);

  // Mapping table lookup for a code, ignoring press state.
  static bool mapCode(unsigned code, bool shift, KeyEvent& out);

  bool shiftHeld() const { return leftShift_ || rightShift_; }
  bool isPressed(unsigned code) const { return code < KEY_CNT && pressed_.test(code); }

  void reset();

private:
  std::bitset<KEY_CNT> pressed_;
  bool leftShift_{false};
  bool rightShift_{false};
  bool emitRepeats_{false};
};

} // namespace pd
