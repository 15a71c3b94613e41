#include "catch2/catch.hpp"
#include "../inc/crawl_state.h"
#include "../inc/quiescence_monitor.h"
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

static CrawlerConfig monitor_config(TerminationMode mode) {
  CrawlerConfig config;
  config.fetch_workers = 1;
  config.index_workers = 1;
  config.poll_interval_ms = 5;
  config.debounce_ms = 100;
  config.termination = mode;
  config.log_filename = "";
  return config;
}

TEST_CASE("Quiescence needs an idle report from every worker",
          "[quiescence_monitor]") {
  CrawlerConfig config = monitor_config(TerminationMode::debounce);
  CrawlLog crawl_log("", false);
  CrawlState state(config, "http://example.com/", crawl_log);
  QuiescenceMonitor monitor(state);

  CHECK_FALSE(monitor.all_idle());
  monitor.record(WorkerStatus{0, false});
  CHECK_FALSE(monitor.all_idle());
  monitor.record(WorkerStatus{1, true});
  CHECK_FALSE(monitor.all_idle());
  monitor.record(WorkerStatus{1, false});
  CHECK(monitor.all_idle());
}

TEST_CASE("Idle state must persist for the debounce interval",
          "[quiescence_monitor]") {
  CrawlerConfig config = monitor_config(TerminationMode::debounce);
  CrawlLog crawl_log("", false);
  CrawlState state(config, "http://example.com/", crawl_log);
  QuiescenceMonitor monitor(state);
  auto t0 = QuiescenceMonitor::Clock::now();

  monitor.record(WorkerStatus{0, false});
  monitor.record(WorkerStatus{1, false});

  SECTION("Uninterrupted quiet period") {
    CHECK_FALSE(monitor.observe(t0));
    CHECK(monitor.tentatively_quiescent());
    CHECK_FALSE(monitor.observe(t0 + 50ms));
    CHECK(monitor.observe(t0 + 100ms));
  }

  SECTION("A busy worker resets the timer") {
    CHECK_FALSE(monitor.observe(t0));
    monitor.record(WorkerStatus{0, true});
    CHECK_FALSE(monitor.observe(t0 + 60ms));
    CHECK_FALSE(monitor.tentatively_quiescent());

    monitor.record(WorkerStatus{0, false});
    CHECK_FALSE(monitor.observe(t0 + 70ms));
    CHECK_FALSE(monitor.observe(t0 + 120ms));
    CHECK(monitor.observe(t0 + 170ms));
  }
}

TEST_CASE("Debouncing monitor stops the crawl after a quiet period",
          "[quiescence_monitor]") {
  CrawlerConfig config = monitor_config(TerminationMode::debounce);
  CrawlLog crawl_log("", false);
  CrawlState state(config, "http://example.com/", crawl_log);
  QuiescenceMonitor monitor(state);

  REQUIRE(state.statuses.push(WorkerStatus{0, false}));
  REQUIRE(state.statuses.push(WorkerStatus{1, false}));

  auto start = std::chrono::steady_clock::now();
  std::thread runner(&QuiescenceMonitor::run, &monitor);
  runner.join();

  CHECK(std::chrono::steady_clock::now() - start >= 100ms);
  CHECK(state.done.is_set());
  CHECK(state.requests.closed());
  CHECK(state.pages.closed());
}

TEST_CASE("Counting monitor stops the crawl when no work is outstanding",
          "[quiescence_monitor]") {
  CrawlerConfig config = monitor_config(TerminationMode::counter);
  CrawlLog crawl_log("", false);
  CrawlState state(config, "http://example.com/", crawl_log);
  QuiescenceMonitor monitor(state);

  state.outstanding.add(2);
  std::thread runner(&QuiescenceMonitor::run, &monitor);

  state.finish_request();
  std::this_thread::sleep_for(20ms);
  CHECK_FALSE(state.done.is_set());

  state.finish_request();
  runner.join();
  CHECK(state.done.is_set());
  CHECK(state.requests.closed());
}
