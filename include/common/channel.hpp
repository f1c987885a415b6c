// include/common/channel.hpp

#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @class BoundedChannel
 * @brief Fixed-capacity queue connecting one producing task with one consumer.
 *
 * Sends never block: a full channel rejects the new item and the producer
 * decides what to log. Either side may close the channel; the other side
 * observes the closure on its next send (CLOSED) or once the remaining items
 * are drained (is_closed() && empty).
 */
template <typename T> class BoundedChannel {
public:
  enum class SendResult { OK, FULL, CLOSED };

  explicit BoundedChannel(size_t capacity) : capacity_(capacity) {}

  BoundedChannel(const BoundedChannel &) = delete;
  BoundedChannel &operator=(const BoundedChannel &) = delete;

  // appends the item unless the channel is full or closed
  SendResult try_send(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return SendResult::CLOSED;
    if (queue_.size() >= capacity_)
      return SendResult::FULL;
    queue_.push_back(std::move(item));
    return SendResult::OK;
  }

  // removes the oldest item, if any
  std::optional<T> try_recv() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
      return std::nullopt;
    T item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  std::deque<T> queue_;
  bool closed_ = false;
  mutable std::mutex mutex_;
};

template <typename T>
std::shared_ptr<BoundedChannel<T>> make_channel(size_t capacity) {
  return std::make_shared<BoundedChannel<T>>(capacity);
}
