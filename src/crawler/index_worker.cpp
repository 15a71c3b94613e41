#include "../../inc/index_worker.h"
#include "../../inc/metrics_collector.h"
#include "../../inc/url_utils.h"

IndexWorker::IndexWorker(int id, CrawlState &state)
    : Worker<Page>(id, state, state.pages) {}

std::vector<std::string>
IndexWorker::claim_new_links(const std::vector<std::string> &links) {
  const size_t limit = state.config.max_links_per_page;
  std::vector<std::string> discovered;

  for (const auto &link : links) {
    if (!UrlUtils::is_same_host(link, state.sitemap.domain())) {
      continue;
    }

    if (limit > 0 && discovered.size() >= limit) {
      LOG("[" << id_ << "] link limit of " << limit
              << " reached, not scheduling the rest");
      break;
    }

    std::string path = UrlUtils::extract_path(link);
    if (path.empty()) {
      continue;
    }

    // Check and placeholder insert happen under one lock, so only one worker
    // can win a path.
    if (state.sitemap.claim(path)) {
      discovered.push_back(link);
    }
  }

  return discovered;
}

void IndexWorker::process(Page &page) {
  const std::string url = page.url;
  const std::vector<std::string> links = page.links;

  state.sitemap.store(std::move(page));
  LOG("[" << id_ << "] indexed " << url);
  MetricsCollector::instance().increment_pages_indexed();

  std::vector<std::string> discovered = claim_new_links(links);

  // No sitemap lock is held here, a full request queue may block.
  state.outstanding.add(discovered.size());
  size_t scheduled =
      push_counted(state.requests, discovered, state.outstanding);
  if (scheduled < discovered.size()) {
    LOG("[" << id_ << "] request queue closed, dropped "
            << discovered.size() - scheduled << " links");
  }
  MetricsCollector::instance().add_links_enqueued(scheduled);

  state.finish_request();
}
