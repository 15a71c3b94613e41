#pragma once
#include "crawl_state.h"
#include <chrono>
#include <exception>

// Common loop of fetch and index workers: take an item, process it, and keep
// the monitor informed about busy/idle transitions until the crawl stops.
template <typename Item> class Worker {
public:
  Worker(int id, CrawlState &state, BoundedQueue<Item> &input)
      : id_(id), state(state), input(input), crawl_log(state.crawl_log) {}
  virtual ~Worker() = default;

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  void run() {
    const std::chrono::milliseconds poll(state.config.poll_interval_ms);

    while (true) {
      Item item;
      QueueStatus status = state.reports_status() ? input.pop_for(item, poll)
                                                  : input.pop(item);
      if (status == QueueStatus::ok) {
        report(true);
        try {
          process(item);
        } catch (const std::exception &e) {
          LOG("[" << id_ << "] dropped work item: " << e.what());
          state.finish_request();
        }
        continue;
      }

      if (status == QueueStatus::closed || state.done.is_set()) {
        break;
      }
      report(false);
    }

    LOG("[" << id_ << "] terminated");
    state.latch.count_down();
  }

protected:
  // Handles one item. Handing the item over to the next stage, or calling
  // CrawlState::finish_request, must be the last thing it does.
  virtual void process(Item &item) = 0;

  const int id_;
  CrawlState &state;
  BoundedQueue<Item> &input;
  CrawlLog &crawl_log;

private:
  // Status reports go out on a change only.
  void report(bool busy) {
    if (!state.reports_status() || (reported_ && busy_ == busy)) {
      return;
    }
    if (state.statuses.push(WorkerStatus{id_, busy})) {
      reported_ = true;
      busy_ = busy;
    }
  }

  bool reported_ = false;
  bool busy_ = false;
};
