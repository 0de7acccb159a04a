#include "delivery_queue.hpp"

#include <utility>

namespace telemetry::transport {

DeliveryQueue::DeliveryQueue(std::size_t capacity) : capacity_(capacity > 0 ? capacity : kDefaultCapacity) {
}

bool DeliveryQueue::Enqueue(Message message) {
  bool kept_all = true;
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return true;
    if (queue_.size() >= capacity_) {
      queue_.pop();
      ++dropped_;
      kept_all = false;
    }
    queue_.push(std::move(message));
  }
  cv_.notify_one();
  return kept_all;
}

std::optional<Message> DeliveryQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Message message = std::move(queue_.front());
  queue_.pop();
  return message;
}

void DeliveryQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void DeliveryQueue::Reset() {
  std::lock_guard lock(mutex_);
  shutdown_ = false;
  std::queue<Message>().swap(queue_);
}

std::size_t DeliveryQueue::size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::uint64_t DeliveryQueue::dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace telemetry::transport
