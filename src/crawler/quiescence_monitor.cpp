#include "../../inc/quiescence_monitor.h"

QuiescenceMonitor::QuiescenceMonitor(CrawlState &state)
    : state(state), crawl_log(state.crawl_log),
      expected_workers(state.config.total_workers()),
      debounce(state.config.debounce_ms) {}

void QuiescenceMonitor::record(const WorkerStatus &status) {
  workers[status.id] = status.busy;
}

bool QuiescenceMonitor::all_idle() const {
  if (workers.size() < expected_workers) {
    return false;
  }
  for (const auto &worker : workers) {
    if (worker.second) {
      return false;
    }
  }
  return true;
}

bool QuiescenceMonitor::observe(Clock::time_point now) {
  if (!all_idle()) {
    tentatively_quiescent_ = false;
    return false;
  }

  if (!tentatively_quiescent_) {
    tentatively_quiescent_ = true;
    quiet_since = now;
    return false;
  }

  return now - quiet_since >= debounce;
}

void QuiescenceMonitor::run() {
  if (state.reports_status()) {
    run_debounce();
  } else {
    run_counter();
  }
  state.terminate();
}

void QuiescenceMonitor::run_debounce() {
  const std::chrono::milliseconds poll(state.config.poll_interval_ms);

  while (true) {
    WorkerStatus status;
    QueueStatus result = state.statuses.pop_for(status, poll);
    if (result == QueueStatus::closed) {
      return;
    }
    if (result == QueueStatus::ok) {
      record(status);
      while (state.statuses.try_pop(status)) {
        record(status);
      }
    }

    if (observe(Clock::now())) {
      LOG("All " << expected_workers << " workers idle for "
                 << debounce.count() << " ms");
      return;
    }
  }
}

void QuiescenceMonitor::run_counter() {
  state.outstanding.wait_zero();
  LOG("No outstanding requests left");
}
