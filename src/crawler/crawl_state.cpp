#include "../../inc/crawl_state.h"

static size_t status_capacity(const CrawlerConfig &config) {
  if (config.status_queue_capacity > 0)
    return config.status_queue_capacity;
  return config.total_workers() * 8;
}

CrawlState::CrawlState(const CrawlerConfig &config, const std::string &domain,
                       CrawlLog &crawl_log)
    : config(config), sitemap(domain), requests(config.request_queue_capacity),
      pages(config.page_queue_capacity), statuses(status_capacity(config)),
      latch(config.total_workers()), crawl_log(crawl_log) {}

void CrawlState::finish_request() { outstanding.done(); }

void CrawlState::terminate() {
  if (done.broadcast()) {
    LOG("Crawl is quiescent, stopping " << config.total_workers()
                                        << " workers");
  }
  requests.close();
  pages.close();
  statuses.close();
}
