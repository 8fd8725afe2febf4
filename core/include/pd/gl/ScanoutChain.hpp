#pragma once

namespace pd {

// Which locked buffer objects are on screen or queued for scanout.
// Methods return the buffer the caller may give back to the allocator,
// or nullptr when nothing is free yet.
template <typename Bo>
class ScanoutChain {
public:
  // `next` is on screen (mode set done or flip event received).
  Bo* commit(Bo* next) {
    Bo* freed = front_;
    front_ = next;
    return freed;
  }

  // A flip to `next` was queued but never reported. Either buffer may be
  // scanning out, so both stay locked until teardown.
  void stall(Bo* next) { pending_ = next; }

  bool stalled() const { return pending_ != nullptr; }
  Bo* front() const { return front_; }
  Bo* pending() const { return pending_; }

  // Teardown: hand back every locked buffer, pending first.
  template <typename ReleaseFn>
  void releaseAll(ReleaseFn&& release) {
    if (pending_) release(pending_);
    if (front_) release(front_);
    pending_ = nullptr;
    front_ = nullptr;
  }

private:
  Bo* front_{nullptr};
  Bo* pending_{nullptr};
};

} // namespace pd
