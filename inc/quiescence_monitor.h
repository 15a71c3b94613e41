#pragma once
#include "crawl_state.h"
#include <chrono>
#include <unordered_map>

// Decides when the crawl is finished and stops every worker.
//
// In debounce mode the monitor keeps the last reported status of every
// worker. Once all of them have reported and all are idle, the state has to
// persist for debounce_ms before it is trusted: right after the seed page is
// indexed every worker is idle for a moment although new links are about to
// be fetched.
//
// In counter mode the monitor simply waits for the outstanding work counter
// to drop to zero.
class QuiescenceMonitor {
public:
  using Clock = std::chrono::steady_clock;

  explicit QuiescenceMonitor(CrawlState &state);

  // Blocks until the crawl is quiescent, then terminates it.
  void run();

  void record(const WorkerStatus &status);

  // Every spawned worker has reported and the latest report of each is idle.
  bool all_idle() const;

  // Applies the debounce rule to the current table. Returns true once the
  // workers have stayed idle for the whole debounce interval.
  bool observe(Clock::time_point now);

  bool tentatively_quiescent() const { return tentatively_quiescent_; }

private:
  void run_debounce();
  void run_counter();

  CrawlState &state;
  CrawlLog &crawl_log;
  const size_t expected_workers;
  const std::chrono::milliseconds debounce;
  std::unordered_map<int, bool> workers;
  bool tentatively_quiescent_ = false;
  Clock::time_point quiet_since;
};
