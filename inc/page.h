#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

// A page of the crawled site with the same-host links and static assets found
// on it. A page with an empty url is a placeholder claimed by an index worker
// before the real fetch completes.
struct Page {
  std::string url;
  std::vector<std::string> links;
  std::vector<std::string> assets;

  Page() = default;
  Page(std::string url, std::vector<std::string> links,
       std::vector<std::string> assets)
      : url(std::move(url)), links(std::move(links)),
        assets(std::move(assets)) {}

  bool is_placeholder() const { return url.empty(); }
};

// Finished crawl result. Keys are normalized page paths.
struct Site {
  std::string domain;
  std::map<std::string, Page> pages;
};

struct WorkerStatus {
  int id = 0;
  bool busy = false;
};
