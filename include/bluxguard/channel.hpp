#pragma once

// bluxguard/channel.hpp - Bounded blocking MPSC channel.
//
// Producers (sensor agents, stdin readers) push; one consumer drains.
// A full channel BLOCKS the producer. Nothing is ever dropped: an event
// stream that silently loses records is worse than one that slows its
// producers down.
//
// close() wakes everyone. After close, push() returns false and pop() keeps
// returning queued items until the queue is empty, then std::nullopt.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace bluxguard {

template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  bool push(T item) {
    std::unique_lock<std::mutex> lock(mu_);
    cv_capacity_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) return false;
    queue_.push_back(std::move(item));
    cv_.notify_one();
    return true;
  }

  // Non-blocking variant; false when full or closed.
  bool try_push(T item) {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_ || queue_.size() >= capacity_) return false;
    queue_.push_back(std::move(item));
    cv_.notify_one();
    return true;
  }

  std::optional<T> pop() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    cv_capacity_.notify_one();
    return item;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
    cv_capacity_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable cv_capacity_;
  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace bluxguard
