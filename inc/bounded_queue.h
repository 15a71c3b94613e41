#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

enum class QueueStatus { ok, timeout, closed };

// Multi-producer multi-consumer FIFO. A capacity of 0 makes the queue
// unbounded; otherwise push blocks while the queue is full. After close()
// producers are refused and consumers drain what is left.
template <typename T> class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity = 0) : capacity_(capacity) {}

  BoundedQueue(const BoundedQueue &) = delete;
  BoundedQueue &operator=(const BoundedQueue &) = delete;

  bool push(T item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]() {
      return closed_ || capacity_ == 0 || items_.size() < capacity_;
    });
    if (closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
  }

  bool try_pop(T &item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
      return false;
    }
    take(item);
    return true;
  }

  // Blocks until an item arrives or the queue is closed and empty.
  QueueStatus pop(T &item) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return QueueStatus::closed;
    }
    take(item);
    return QueueStatus::ok;
  }

  QueueStatus pop_for(T &item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this]() {
          return closed_ || !items_.empty();
        })) {
      return QueueStatus::timeout;
    }
    if (items_.empty()) {
      return QueueStatus::closed;
    }
    take(item);
    return QueueStatus::ok;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

private:
  void take(T &item) {
    item = std::move(items_.front());
    items_.pop_front();
    not_full_.notify_one();
  }

  const size_t capacity_;
  std::deque<T> items_;
  bool closed_ = false;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
};
