#include "../../inc/crawl_log.h"
#include <ctime>
#include <iomanip>

CrawlLog::CrawlLog(const std::string &filename, bool verbose)
    : verbose_(verbose) {
  if (!filename.empty()) {
    file_.open(filename, std::ios::trunc);
  }
}

CrawlLog::~CrawlLog() {
  if (file_.is_open()) {
    file_.flush();
  }
}

void CrawlLog::write(const std::string &line) {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);

  std::lock_guard<std::mutex> lock(mutex_);
  file_ << std::put_time(&local, "%Y/%m/%d %H:%M:%S") << ' ' << line
        << std::endl;
}
