#pragma once

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace telemetry::state {

/*
  Bounded FIFO. Pushing into a full buffer silently drops the oldest entry.

  Not thread-safe; owners guard it.
*/
template <typename T>
class RingBuffer {
 public:
  explicit RingBuffer(std::size_t capacity = 0) : capacity_(capacity) {
  }

  void Push(T value) {
    if (capacity_ == 0) {
      return;
    }
    if (items_.size() == capacity_) {
      items_.pop_front();
    }
    items_.push_back(std::move(value));
  }

  void Clear() {
    items_.clear();
  }

  std::size_t size() const {
    return items_.size();
  }

  bool empty() const {
    return items_.empty();
  }

  std::size_t capacity() const {
    return capacity_;
  }

  const T& operator[](std::size_t index) const {
    return items_[index];
  }

  const T& back() const {
    return items_.back();
  }

  std::vector<T> ToVector() const {
    return std::vector<T>(items_.begin(), items_.end());
  }

 private:
  std::size_t   capacity_;
  std::deque<T> items_;
};

} // namespace telemetry::state
