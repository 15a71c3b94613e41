#include "../../inc/metrics_collector.h"

MetricsCollector &MetricsCollector::instance() {
  static MetricsCollector instance;
  return instance;
}

void MetricsCollector::record_metric(const std::string &operation,
                                     double time_ms, bool success) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);

  auto &metric = metrics_[operation];
  metric.total_time_ms += time_ms;
  metric.count++;

  if (metric.count == 1 || time_ms < metric.min_time_ms) {
    metric.min_time_ms = time_ms;
  }
  if (metric.count == 1 || time_ms > metric.max_time_ms) {
    metric.max_time_ms = time_ms;
  }

  if (!success) {
    metric.error_count++;
  }
}

void MetricsCollector::reset() {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  metrics_.clear();
  pages_fetched_ = 0;
  fetch_failures_ = 0;
  pages_indexed_ = 0;
  links_enqueued_ = 0;
  total_bytes_downloaded_ = 0;

  start_time_ = std::chrono::steady_clock::now();
}

std::unordered_map<std::string, MetricsCollector::OperationMetrics>
MetricsCollector::get_metrics() {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  return metrics_;
}

double MetricsCollector::elapsed_seconds() const {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now -
                                                               start_time_)
             .count() /
         1000.0;
}

void MetricsCollector::print_report(std::ostream &os) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);

  double total_runtime_sec = elapsed_seconds();

  os << "===== Crawl Report =====\n";
  os << "Runtime: " << std::fixed << std::setprecision(2) << total_runtime_sec
     << " seconds\n";
  os << "Pages fetched: " << pages_fetched_ << "\n";
  os << "Fetch failures: " << fetch_failures_ << "\n";
  os << "Pages indexed: " << pages_indexed_ << "\n";
  os << "Links scheduled: " << links_enqueued_ << "\n";
  os << "Downloaded: " << (total_bytes_downloaded_ / 1024.0) << " KiB\n";
  os << "Processing rate: "
     << (total_runtime_sec > 0 ? pages_fetched_ / total_runtime_sec : 0)
     << " URLs/second\n";

  for (const auto &entry : metrics_) {
    const OperationMetrics &metric = entry.second;
    os << entry.first << ": " << metric.count << " calls, avg "
       << (metric.count ? metric.total_time_ms / metric.count : 0)
       << " ms, min " << metric.min_time_ms << " ms, max "
       << metric.max_time_ms << " ms, errors " << metric.error_count << "\n";
  }
}
