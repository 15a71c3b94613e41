#pragma once
#include "crawl_log.h"
#include "crawler_config.h"
#include <string>

struct FetchResponse {
  // Final URL after redirects.
  std::string url;
  long http_code = 0;
  std::string content;
};

class Fetcher {
public:
  virtual ~Fetcher() = default;

  // Returns false when the page could not be retrieved; the reason is logged.
  virtual bool fetch(const std::string &url, FetchResponse &response) = 0;
};

class CurlFetcher : public Fetcher {
public:
  CurlFetcher(const CrawlerConfig &config, CrawlLog &crawl_log);

  bool fetch(const std::string &url, FetchResponse &response) override;

private:
  std::string user_agent;
  long timeout_sec;
  bool follow_redirects;
  CrawlLog &crawl_log;
};

// Process-wide libcurl setup. Create one before any worker thread starts.
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal &) = delete;
  CurlGlobal &operator=(const CurlGlobal &) = delete;
};
