#include "../../inc/crawler.h"
#include "../../inc/crawl_state.h"
#include "../../inc/fetch_worker.h"
#include "../../inc/index_worker.h"
#include "../../inc/metrics_collector.h"
#include "../../inc/quiescence_monitor.h"
#include "../../inc/url_utils.h"
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

Crawler::Crawler(const CrawlerConfig &config, Fetcher &fetcher,
                 PageParser &parser, CrawlLog &crawl_log)
    : config(config), fetcher(fetcher), parser(parser), crawl_log(crawl_log) {
  if (config.fetch_workers == 0 || config.index_workers == 0) {
    throw std::invalid_argument("Crawler needs at least one fetch and one "
                                "index worker");
  }
}

std::string Crawler::resolve_seed(const std::string &seed) {
  const char *whitespace = " \t\r\n";
  size_t start = seed.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    throw std::invalid_argument("Malformed URL: empty seed");
  }
  size_t end = seed.find_last_not_of(whitespace);
  std::string url =
      UrlUtils::apply_default_scheme(seed.substr(start, end - start + 1));

  if (!UrlUtils::is_http_url(url)) {
    throw std::invalid_argument("Malformed URL: " + seed);
  }
  return UrlUtils::normalize_url(url);
}

Site Crawler::crawl(const std::string &seed) {
  const std::string seed_url = resolve_seed(seed);

  CrawlState state(config, seed_url, crawl_log);
  LOG("Crawling " << seed_url << " with " << config.fetch_workers
                  << " fetch workers and " << config.index_workers
                  << " index workers");

  state.sitemap.claim(UrlUtils::extract_path(seed_url));
  state.outstanding.add();
  if (!state.requests.push(seed_url)) {
    throw std::logic_error("Request queue closed before the crawl started");
  }
  MetricsCollector::instance().add_links_enqueued(1);

  int next_id = 0;
  std::vector<std::unique_ptr<FetchWorker>> fetch_workers;
  for (size_t i = 0; i < config.fetch_workers; ++i) {
    fetch_workers.push_back(
        std::make_unique<FetchWorker>(next_id++, state, fetcher, parser));
  }
  std::vector<std::unique_ptr<IndexWorker>> index_workers;
  for (size_t i = 0; i < config.index_workers; ++i) {
    index_workers.push_back(std::make_unique<IndexWorker>(next_id++, state));
  }
  QuiescenceMonitor monitor(state);

  std::vector<std::thread> threads;
  threads.reserve(config.total_workers() + 1);
  try {
    for (auto &worker : fetch_workers) {
      threads.emplace_back(&FetchWorker::run, worker.get());
    }
    for (auto &worker : index_workers) {
      threads.emplace_back(&IndexWorker::run, worker.get());
    }
    threads.emplace_back(&QuiescenceMonitor::run, &monitor);
  } catch (const std::system_error &e) {
    LOG("Failed to start crawl threads: " << e.what());
    state.terminate();
    for (auto &thread : threads) {
      thread.join();
    }
    throw;
  }

  state.latch.wait();
  for (auto &thread : threads) {
    thread.join();
  }

  Site site = state.sitemap.release();
  LOG("Crawl of " << seed_url << " finished with " << site.pages.size()
                  << " pages");
  return site;
}
