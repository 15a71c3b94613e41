#pragma once
#include "../inc/fetcher.h"
#include "../inc/url_utils.h"
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// In-memory web site served through the Fetcher interface. Pages are looked up
// by path on a single host; every request is recorded.
class FakeSite : public Fetcher {
public:
  explicit FakeSite(const std::string &host = "test.local") : host_(host) {}

  void add_page(const std::string &path, const std::string &html) {
    pages_[path] = html;
  }

  void throw_on(const std::string &path) { throwing_.insert(path); }

  void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }

  bool fetch(const std::string &url, FetchResponse &response) override {
    std::string host = UrlUtils::extract_domain(url);
    std::string path = UrlUtils::extract_path(url);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requested_.push_back(url);
      if (host == host_) {
        counts_[path]++;
      }
    }

    if (latency_.count() > 0) {
      std::this_thread::sleep_for(latency_);
    }

    if (throwing_.count(path)) {
      throw std::runtime_error("connection reset by peer");
    }

    response.url = url;
    auto it = pages_.find(path);
    if (host != host_ || it == pages_.end()) {
      response.http_code = 404;
      return false;
    }
    response.http_code = 200;
    response.content = it->second;
    return true;
  }

  size_t fetch_count(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(path);
    return it == counts_.end() ? 0 : it->second;
  }

  std::map<std::string, size_t> fetch_counts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
  }

  std::vector<std::string> requested_urls() {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
  }

private:
  std::string host_;
  std::map<std::string, std::string> pages_;
  std::set<std::string> throwing_;
  std::chrono::milliseconds latency_{0};

  std::mutex mutex_;
  std::map<std::string, size_t> counts_;
  std::vector<std::string> requested_;
};

inline std::string html_with_links(const std::vector<std::string> &hrefs,
                                   const std::string &extra = "") {
  std::string html = "<html><head><title>t</title></head><body>";
  for (const auto &href : hrefs) {
    html += "<a href=\"" + href + "\">link</a>";
  }
  html += extra;
  html += "</body></html>";
  return html;
}
