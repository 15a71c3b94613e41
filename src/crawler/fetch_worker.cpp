#include "../../inc/fetch_worker.h"
#include "../../inc/metrics_collector.h"
#include "../../inc/url_utils.h"
#include <chrono>

FetchWorker::FetchWorker(int id, CrawlState &state, Fetcher &fetcher,
                         PageParser &parser)
    : Worker<std::string>(id, state, state.requests), fetcher(fetcher),
      parser(parser) {}

ParsedPage FetchWorker::parse(const FetchResponse &response) {
  try {
    return parser.parse(response.content, response.url);
  } catch (const std::exception &e) {
    LOG("[" << id_ << "] parse failed for URL: " << response.url << ": "
            << e.what());
    return {};
  }
}

void FetchWorker::process(std::string &url) {
  auto start = std::chrono::steady_clock::now();
  FetchResponse response;
  bool ok = fetcher.fetch(url, response);
  double elapsed_ms = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count() /
                      1000.0;
  MetricsCollector::instance().record_metric("fetch", elapsed_ms, ok);

  if (!ok) {
    LOG("[" << id_ << "] request failed for URL: " << url);
    MetricsCollector::instance().increment_fetch_failures();
    state.finish_request();
    return;
  }
  LOG("[" << id_ << "] requested " << url);
  MetricsCollector::instance().increment_pages_fetched();

  ParsedPage parsed = parse(response);

  std::vector<std::string> links;
  links.reserve(parsed.links.size());
  for (auto &link : parsed.links) {
    if (UrlUtils::is_same_host(link, state.sitemap.domain())) {
      links.push_back(std::move(link));
    }
  }

  Page page(url, std::move(links), std::move(parsed.assets));
  if (!state.pages.push(std::move(page))) {
    LOG("[" << id_ << "] page queue closed, dropping " << url);
    state.finish_request();
  }
}
