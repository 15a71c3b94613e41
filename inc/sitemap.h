#pragma once
#include "page.h"
#include <mutex>
#include <string>

// Shared path -> page map of a crawl in progress. Every operation takes the
// lock once and releases it before returning.
class Sitemap {
public:
  explicit Sitemap(const std::string &domain);

  // Inserts a placeholder for path unless the path is already known.
  // Returns true when the caller won the path and must schedule its fetch.
  bool claim(const std::string &path);

  // Stores page at its normalized path, replacing a placeholder. Returns the
  // key used.
  std::string store(Page page);

  size_t size() const;
  const std::string &domain() const { return domain_; }

  // Hands the finished map over to the caller. Paths that were claimed but
  // never stored (failed fetches) are left out. The sitemap is empty
  // afterwards.
  Site release();

private:
  const std::string domain_;
  std::map<std::string, Page> pages_;
  mutable std::mutex mutex_;
};
