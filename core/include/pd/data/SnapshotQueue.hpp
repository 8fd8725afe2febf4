#pragma once
#include <cstddef>
#include <deque>
#include <mutex>

namespace pd {

// Bounded hand-off from producer threads to the render loop. Producers
// push whole values; a full queue drops its oldest entry. The consumer
// never blocks.
template <typename T>
class SnapshotQueue {
public:
  explicit SnapshotQueue(std::size_t maxCapacity = 4)
      : maxCap_(maxCapacity > 0 ? maxCapacity : 1) {}

  void push(T item) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.size() >= maxCap_) {
      queue_.pop_front(); // drop oldest
    }
    queue_.push_back(std::move(item));
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
  }

  // Newest entry; older ones are discarded. False leaves `out` untouched.
  bool drainLatest(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.back());
    queue_.clear();
    return true;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.clear();
  }

private:
  mutable std::mutex mtx_;
  std::deque<T> queue_;
  std::size_t maxCap_;
};

} // namespace pd
