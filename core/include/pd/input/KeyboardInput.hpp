#pragma once
#include "pd/input/KeyDecoder.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace pd {

// Owns one evdev keyboard fd opened O_NONBLOCK. pollEvents() drains
// whatever is queued and never blocks; with no device it returns nothing.
class KeyboardInput {
public:
  explicit KeyboardInput(bool emitRepeats = false) : decoder_(emitRepeats) {}
  ~KeyboardInput();

  KeyboardInput(const KeyboardInput&) = delete;
  KeyboardInput& operator=(const KeyboardInput&) = delete;

  // Opens a specific event node.
  bool open(const std::string& path);

  // Scans /dev/input/event0..maxIndex-1 for the first keyboard.
  bool openFirstKeyboard(int maxIndex = 32);

  // Takes ownership of an already-open fd and makes it non-blocking.
  void adoptFd(int fd, const std::string& label = "fd");

  void close();
  bool isOpen() const { return fd_ >= 0; }
  const std::string& devicePath() const { return path_; }

  std::vector<KeyEvent> pollEvents();

  // EV_KEY with KEY_A, KEY_Z and KEY_SPACE.
  static bool isKeyboard(int fd);

private:
  int fd_{-1};
  std::string path_;
  KeyDecoder decoder_;
  std::vector<std::uint8_t> partial_;  // bytes of an incomplete input_event
};

} // namespace pd
