#include "../../inc/crawler.h"
#include "../../inc/crawler_config.h"
#include "../../inc/database.h"
#include "../../inc/metrics_collector.h"
#include "../../inc/sitemap_report.h"
#include <iostream>
#include <stdexcept>

static void export_site(const Site &site, const std::string &db_name) {
  Database db;
  if (db.connect(db_name) && db.create_tables() && db.save_site(site)) {
    std::cerr << "Sitemap saved to " << db_name << std::endl;
  } else {
    std::cerr << "Could not export sitemap to " << db_name << std::endl;
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2 || argc > 3) {
    std::cerr << "Usage: " << argv[0] << " [url] [config.json]" << std::endl;
    return 1;
  }

  try {
    CrawlerConfig config;
    if (argc > 2) {
      config = CrawlerConfig::load_from_file(argv[2]);
    }

    std::string seed;
    try {
      seed = Crawler::resolve_seed(argv[1]);
    } catch (const std::invalid_argument &e) {
      std::cerr << "Error! Malformed URL. " << e.what() << std::endl;
      return 2;
    }

    CurlGlobal curl;
    CrawlLog crawl_log(config.log_filename, config.verbose_logging);
    CurlFetcher fetcher(config, crawl_log);
    HTMLParser parser;
    Crawler crawler(config, fetcher, parser, crawl_log);

    MetricsCollector::instance().reset();
    Site site = crawler.crawl(seed);

    SitemapReport::print(site, std::cout);

    if (!config.db_name.empty()) {
      export_site(site, config.db_name);
    }

    MetricsCollector::instance().print_report(std::cerr);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
