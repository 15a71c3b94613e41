#include "../../inc/crawler_config.h"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static TerminationMode parse_termination(const std::string &value,
                                         TerminationMode fallback) {
  if (value == "counter")
    return TerminationMode::counter;
  if (value == "debounce")
    return TerminationMode::debounce;
  std::cerr << "Unknown termination mode '" << value << "', keeping default"
            << std::endl;
  return fallback;
}

CrawlerConfig CrawlerConfig::load_from_file(const std::string &filename) {
  CrawlerConfig config;

  try {
    std::ifstream file(filename);
    if (!file.is_open()) {
      std::cerr << "Could not open config file: " << filename << std::endl;
      return config;
    }

    json j;
    file >> j;

    if (j.contains("fetch_workers"))
      config.fetch_workers = j["fetch_workers"];

    if (j.contains("index_workers"))
      config.index_workers = j["index_workers"];

    if (j.contains("request_queue_capacity"))
      config.request_queue_capacity = j["request_queue_capacity"];

    if (j.contains("page_queue_capacity"))
      config.page_queue_capacity = j["page_queue_capacity"];

    if (j.contains("status_queue_capacity"))
      config.status_queue_capacity = j["status_queue_capacity"];

    if (j.contains("poll_interval_ms"))
      config.poll_interval_ms = j["poll_interval_ms"];

    if (j.contains("debounce_ms"))
      config.debounce_ms = j["debounce_ms"];

    if (j.contains("termination"))
      config.termination = parse_termination(
          j["termination"].get<std::string>(), config.termination);

    if (j.contains("max_links_per_page"))
      config.max_links_per_page = j["max_links_per_page"];

    if (j.contains("user_agent"))
      config.user_agent = j["user_agent"].get<std::string>();

    if (j.contains("request_timeout_sec"))
      config.request_timeout_sec = j["request_timeout_sec"];

    if (j.contains("follow_redirects"))
      config.follow_redirects = j["follow_redirects"];

    if (j.contains("log_filename"))
      config.log_filename = j["log_filename"].get<std::string>();

    if (j.contains("verbose_logging"))
      config.verbose_logging = j["verbose_logging"];

    if (j.contains("db_name"))
      config.db_name = j["db_name"].get<std::string>();

  } catch (const std::exception &e) {
    std::cerr << "Error loading config: " << e.what() << std::endl;
    return CrawlerConfig();
  }

  if (config.fetch_workers == 0 || config.index_workers == 0) {
    std::cerr << "Worker pools need at least one worker, using defaults"
              << std::endl;
    CrawlerConfig defaults;
    if (config.fetch_workers == 0)
      config.fetch_workers = defaults.fetch_workers;
    if (config.index_workers == 0)
      config.index_workers = defaults.index_workers;
  }

  return config;
}
