#pragma once
#include "crawl_log.h"
#include "crawler_config.h"
#include "fetcher.h"
#include "htmlparser.h"
#include "page.h"
#include <string>

// Maps every page reachable through same-host links from a seed URL.
class Crawler {
public:
  Crawler(const CrawlerConfig &config, Fetcher &fetcher, PageParser &parser,
          CrawlLog &crawl_log);

  // Runs one crawl to completion. A seed without scheme gets http://.
  // Throws std::invalid_argument before any work starts if the seed is not a
  // valid http(s) URL.
  Site crawl(const std::string &seed);

  static std::string resolve_seed(const std::string &seed);

private:
  const CrawlerConfig &config;
  Fetcher &fetcher;
  PageParser &parser;
  CrawlLog &crawl_log;
};
