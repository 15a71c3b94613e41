#pragma once
#include "bounded_queue.h"
#include "crawl_log.h"
#include "crawler_config.h"
#include "page.h"
#include "sitemap.h"
#include "sync.h"
#include <exception>
#include <utility>
#include <string>
#include <vector>

// Everything the workers and the monitor of one crawl share.
struct CrawlState {
  CrawlState(const CrawlerConfig &config, const std::string &domain,
             CrawlLog &crawl_log);

  CrawlState(const CrawlState &) = delete;
  CrawlState &operator=(const CrawlState &) = delete;

  // Accounts for one URL leaving the crawl: fetch failed, page dropped, or
  // page fully indexed.
  void finish_request();

  // Broadcasts the termination signal and closes every queue so that blocked
  // workers wake up.
  void terminate();

  bool reports_status() const {
    return config.termination == TerminationMode::debounce;
  }

  const CrawlerConfig &config;
  Sitemap sitemap;
  BoundedQueue<std::string> requests;
  BoundedQueue<Page> pages;
  BoundedQueue<WorkerStatus> statuses;
  TerminationSignal done;
  CompletionLatch latch;
  WorkCounter outstanding;
  CrawlLog &crawl_log;
};

// Pushes items whose work has already been added to counter. Items the closed
// queue refuses, and items left over when a push throws, are settled so the
// counter can still reach zero. Returns the number of items handed over.
template <typename T>
size_t push_counted(BoundedQueue<T> &queue, std::vector<T> &items,
                    WorkCounter &counter) {
  size_t pushed = 0;
  size_t next = 0;
  try {
    for (; next < items.size(); ++next) {
      if (queue.push(std::move(items[next]))) {
        ++pushed;
      } else {
        counter.done();
      }
    }
  } catch (const std::exception &) {
    for (; next < items.size(); ++next) {
      counter.done();
    }
    throw;
  }
  return pushed;
}
