#include "catch2/catch.hpp"
#include "../inc/crawler_config.h"
#include <cstdio>
#include <fstream>
#include <string>

static void write_file(const std::string &path, const std::string &content) {
  std::ofstream file(path);
  REQUIRE(file.is_open());
  file << content;
}

TEST_CASE("Crawler configuration", "[crawler_config]") {
  CrawlerConfig config;

  SECTION("Default configuration") {
    CHECK(config.fetch_workers == 10);
    CHECK(config.index_workers == 10);
    CHECK(config.total_workers() == 20);
    CHECK(config.request_queue_capacity == 0);
    CHECK(config.page_queue_capacity == 400);
    CHECK(config.debounce_ms == 2000);
    CHECK(config.termination == TerminationMode::counter);
    CHECK(config.max_links_per_page == 0);
    CHECK(config.user_agent == "sitemapper/1.0");
    CHECK(config.db_name.empty());
  }

  SECTION("Load custom configuration") {
    write_file("test_config.json", R"({
            "fetch_workers": 4,
            "index_workers": 2,
            "page_queue_capacity": 16,
            "debounce_ms": 500,
            "termination": "debounce",
            "max_links_per_page": 50,
            "user_agent": "TestCrawler/1.0",
            "follow_redirects": false,
            "db_name": "sitemap.db"
        })");

    config = CrawlerConfig::load_from_file("test_config.json");

    CHECK(config.fetch_workers == 4);
    CHECK(config.index_workers == 2);
    CHECK(config.page_queue_capacity == 16);
    CHECK(config.request_queue_capacity == 0);
    CHECK(config.debounce_ms == 500);
    CHECK(config.termination == TerminationMode::debounce);
    CHECK(config.max_links_per_page == 50);
    CHECK(config.user_agent == "TestCrawler/1.0");
    CHECK_FALSE(config.follow_redirects);
    CHECK(config.db_name == "sitemap.db");

    std::remove("test_config.json");
  }

  SECTION("Missing file keeps defaults") {
    config = CrawlerConfig::load_from_file("does_not_exist.json");
    CHECK(config.fetch_workers == 10);
    CHECK(config.termination == TerminationMode::counter);
  }

  SECTION("Invalid JSON keeps defaults") {
    write_file("test_bad_config.json", "{ \"fetch_workers\": ");
    config = CrawlerConfig::load_from_file("test_bad_config.json");
    CHECK(config.fetch_workers == 10);
    std::remove("test_bad_config.json");
  }

  SECTION("Empty worker pools fall back to defaults") {
    write_file("test_zero_config.json",
               R"({"fetch_workers": 0, "index_workers": 3})");
    config = CrawlerConfig::load_from_file("test_zero_config.json");
    CHECK(config.fetch_workers == 10);
    CHECK(config.index_workers == 3);
    std::remove("test_zero_config.json");
  }

  SECTION("Unknown termination mode keeps the default") {
    write_file("test_mode_config.json", R"({"termination": "sometimes"})");
    config = CrawlerConfig::load_from_file("test_mode_config.json");
    CHECK(config.termination == TerminationMode::counter);
    std::remove("test_mode_config.json");
  }
}
