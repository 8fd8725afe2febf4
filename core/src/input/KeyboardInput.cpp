#include "pd/input/KeyboardInput.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace pd {

namespace {

constexpr std::size_t kBitsPerLong = sizeof(unsigned long) * 8;
constexpr std::size_t longsFor(std::size_t bits) { return (bits + kBitsPerLong - 1) / kBitsPerLong; }

bool testBit(const unsigned long* bits, unsigned bit) {
  return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

} // namespace

KeyboardInput::~KeyboardInput() {
  close();
}

bool KeyboardInput::isKeyboard(int fd) {
  unsigned long evBits[longsFor(EV_CNT)] = {};
  if (ioctl(fd, EVIOCGBIT(0, sizeof(evBits)), evBits) < 0) return false;
  if (!testBit(evBits, EV_KEY)) return false;

  unsigned long keyBits[longsFor(KEY_CNT)] = {};
  if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits) < 0) return false;
  return testBit(keyBits, KEY_A) && testBit(keyBits, KEY_Z) && testBit(keyBits, KEY_SPACE);
}

bool KeyboardInput::open(const std::string& path) {
  close();
  int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    std::fprintf(stderr, "KeyboardInput: cannot open %s: %s\n", path.c_str(),
                 std::strerror(errno));
    return false;
  }
  fd_ = fd;
  path_ = path;
  return true;
}

bool KeyboardInput::openFirstKeyboard(int maxIndex) {
  close();
  for (int i = 0; i < maxIndex; i++) {
    std::string path = "/dev/input/event" + std::to_string(i);
    int fd = ::open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) continue;
    if (isKeyboard(fd)) {
      fd_ = fd;
      path_ = path;
      std::fprintf(stderr, "KeyboardInput: using %s\n", path.c_str());
      return true;
    }
    ::close(fd);
  }
  std::fprintf(stderr, "KeyboardInput: no keyboard found under /dev/input\n");
  return false;
}

void KeyboardInput::adoptFd(int fd, const std::string& label) {
  close();
  if (fd < 0) return;
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0 && !(flags & O_NONBLOCK)) {
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      std::fprintf(stderr, "KeyboardInput: cannot make %s non-blocking: %s\n",
                   label.c_str(), std::strerror(errno));
    }
  }
  fd_ = fd;
  path_ = label;
}

void KeyboardInput::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  partial_.clear();
  decoder_.reset();
}

std::vector<KeyEvent> KeyboardInput::pollEvents() {
  std::vector<KeyEvent> out;
  if (fd_ < 0) return out;

  std::uint8_t buf[64 * sizeof(input_event)];
  for (;;) {
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) break;
      if (errno == ENODEV) {
        std::fprintf(stderr, "KeyboardInput: %s was unplugged\n", path_.c_str());
        close();
        break;
      }
      std::fprintf(stderr, "KeyboardInput: read failed on %s: %s\n", path_.c_str(),
                   std::strerror(errno));
      break;
    }
    if (n == 0) break;

    partial_.insert(partial_.end(), buf, buf + n);
    std::size_t whole = partial_.size() / sizeof(input_event);
    for (std::size_t i = 0; i < whole; i++) {
      input_event ev;
      std::memcpy(&ev, partial_.data() + i * sizeof(input_event), sizeof(ev));
      KeyEvent key;
      if (decoder_.decode(ev, key)) out.push_back(key);
    }
    partial_.erase(partial_.begin(),
                   partial_.begin() + static_cast<std::ptrdiff_t>(whole * sizeof(input_event)));
  }
  return out;
}

} // namespace pd
