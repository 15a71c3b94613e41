#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <mutex>

// One-shot stop notification shared by every crawl worker.
class TerminationSignal {
public:
  // Sets the signal and wakes all waiters. Only the first call has an effect;
  // it returns true, later calls return false.
  bool broadcast();

  bool is_set() const { return set_.load(); }

  // Returns true if the signal was set before the timeout expired.
  bool wait_for(std::chrono::milliseconds timeout);

private:
  std::atomic<bool> set_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

// Counts down once per exiting worker; the dispatcher waits for zero.
class CompletionLatch {
public:
  explicit CompletionLatch(size_t count) : count_(count) {}

  void count_down();
  void wait();
  bool wait_for(std::chrono::milliseconds timeout);
  size_t count() const;

private:
  size_t count_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

// Number of fetch requests in flight: queued, being fetched, or waiting to be
// indexed. The crawl is finished when it drops to zero.
class WorkCounter {
public:
  void add(size_t n = 1);
  // Returns the remaining amount of outstanding work.
  size_t done();
  size_t value() const;
  void wait_zero();
  bool wait_zero_for(std::chrono::milliseconds timeout);

private:
  size_t outstanding_ = 0;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};
