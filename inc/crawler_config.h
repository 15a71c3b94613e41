#pragma once
#include <cstddef>
#include <string>

enum class TerminationMode { counter, debounce };

struct CrawlerConfig {
  size_t fetch_workers = 10;
  size_t index_workers = 10;

  // 0 = unbounded.
  size_t request_queue_capacity = 0;
  size_t page_queue_capacity = 400;
  // 0 = eight slots per worker.
  size_t status_queue_capacity = 0;

  int poll_interval_ms = 10;
  int debounce_ms = 2000;
  TerminationMode termination = TerminationMode::counter;

  // Newly discovered links scheduled per page, 0 = no limit.
  size_t max_links_per_page = 0;

  std::string user_agent = "sitemapper/1.0";
  int request_timeout_sec = 30;
  bool follow_redirects = true;

  std::string log_filename = "logs.txt";
  bool verbose_logging = true;

  // SQLite export of the finished sitemap, empty = no export.
  std::string db_name;

  size_t total_workers() const { return fetch_workers + index_workers; }

  static CrawlerConfig load_from_file(const std::string &filename);
};
