#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace telemetry::transport {

struct Message {
  std::string topic;
  std::string payload;
};

/*
  Thread-safe blocking queue feeding one client's delivery thread.

  Bounded: when full, the oldest queued message is dropped to make room,
  since a newer sample supersedes an older one.
*/
class DeliveryQueue {
 public:
  static constexpr std::size_t kDefaultCapacity = 1024;

  explicit DeliveryQueue(std::size_t capacity = kDefaultCapacity);

  // Returns false when an older message had to be dropped.
  bool Enqueue(Message message);

  // blocking wait; nullopt once shut down and drained
  std::optional<Message> Dequeue();

  void Shutdown();

  // Reopens a shut down queue and drops anything left in it.
  void Reset();

  std::size_t size() const;
  std::size_t capacity() const {
    return capacity_;
  }
  // Total messages dropped for lack of room.
  std::uint64_t dropped() const;

 private:
  const std::size_t       capacity_;
  std::uint64_t           dropped_ = 0;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Message>     queue_;
  bool                    shutdown_ = false;
};

} // namespace telemetry::transport
