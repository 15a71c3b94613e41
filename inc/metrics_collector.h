#pragma once
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

class MetricsCollector {
public:
  struct OperationMetrics {
    double total_time_ms = 0;
    size_t count = 0;
    double min_time_ms = 0;
    double max_time_ms = 0;
    size_t error_count = 0;
  };

  static MetricsCollector &instance();

  void record_metric(const std::string &operation, double time_ms,
                     bool success = true);

  void reset();

  std::unordered_map<std::string, OperationMetrics> get_metrics();

  void print_report(std::ostream &os = std::cout);

  void increment_pages_fetched() { ++pages_fetched_; }
  void increment_fetch_failures() { ++fetch_failures_; }
  void increment_pages_indexed() { ++pages_indexed_; }
  void add_links_enqueued(size_t count) { links_enqueued_ += count; }
  void add_bytes_downloaded(size_t bytes) { total_bytes_downloaded_ += bytes; }

  size_t pages_fetched() const { return pages_fetched_; }
  size_t fetch_failures() const { return fetch_failures_; }
  size_t pages_indexed() const { return pages_indexed_; }
  size_t links_enqueued() const { return links_enqueued_; }

private:
  MetricsCollector() = default;
  ~MetricsCollector() = default;
  MetricsCollector(const MetricsCollector &) = delete;
  MetricsCollector &operator=(const MetricsCollector &) = delete;

  double elapsed_seconds() const;

  std::mutex metrics_mutex_;
  std::unordered_map<std::string, OperationMetrics> metrics_;

  std::atomic<size_t> pages_fetched_{0};
  std::atomic<size_t> fetch_failures_{0};
  std::atomic<size_t> pages_indexed_{0};
  std::atomic<size_t> links_enqueued_{0};
  std::atomic<size_t> total_bytes_downloaded_{0};
  std::chrono::steady_clock::time_point start_time_ =
      std::chrono::steady_clock::now();
};
