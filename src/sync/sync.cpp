#include "../../inc/sync.h"
#include <stdexcept>

bool TerminationSignal::broadcast() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (set_.exchange(true)) {
    return false;
  }
  cv_.notify_all();
  return true;
}

bool TerminationSignal::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return set_.load(); });
}

void CompletionLatch::count_down() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count_ == 0) {
    throw std::logic_error("CompletionLatch counted down below zero");
  }
  if (--count_ == 0) {
    cv_.notify_all();
  }
}

void CompletionLatch::wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return count_ == 0; });
}

bool CompletionLatch::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return count_ == 0; });
}

size_t CompletionLatch::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

void WorkCounter::add(size_t n) {
  std::lock_guard<std::mutex> lock(mutex_);
  outstanding_ += n;
}

size_t WorkCounter::done() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (outstanding_ == 0) {
    throw std::logic_error("WorkCounter finished more work than was added");
  }
  if (--outstanding_ == 0) {
    cv_.notify_all();
  }
  return outstanding_;
}

size_t WorkCounter::value() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outstanding_;
}

void WorkCounter::wait_zero() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return outstanding_ == 0; });
}

bool WorkCounter::wait_zero_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() { return outstanding_ == 0; });
}
