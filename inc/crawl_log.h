#pragma once
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

// Run log shared by all crawl threads. Lines are written whole, one writer at
// a time, each prefixed with the local time.
class CrawlLog {
public:
  CrawlLog(const std::string &filename, bool verbose);
  ~CrawlLog();

  CrawlLog(const CrawlLog &) = delete;
  CrawlLog &operator=(const CrawlLog &) = delete;

  bool enabled() const { return verbose_ && file_.is_open(); }
  void write(const std::string &line);

private:
  std::ofstream file_;
  bool verbose_;
  std::mutex mutex_;
};

// Expects a CrawlLog reference named crawl_log in scope.
#define LOG(msg)                                                               \
  if (crawl_log.enabled()) {                                                   \
    std::ostringstream log_line_;                                              \
    log_line_ << msg;                                                          \
    crawl_log.write(log_line_.str());                                          \
  }
