#include "../../inc/sitemap.h"
#include "../../inc/url_utils.h"

Sitemap::Sitemap(const std::string &domain) : domain_(domain) {}

bool Sitemap::claim(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return pages_.emplace(path, Page()).second;
}

std::string Sitemap::store(Page page) {
  std::string path = UrlUtils::extract_path(page.url);
  std::lock_guard<std::mutex> lock(mutex_);
  pages_[path] = std::move(page);
  return path;
}

size_t Sitemap::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pages_.size();
}

Site Sitemap::release() {
  Site site;
  site.domain = domain_;

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = pages_.begin(); it != pages_.end();) {
    if (it->second.is_placeholder()) {
      it = pages_.erase(it);
    } else {
      ++it;
    }
  }
  site.pages.swap(pages_);
  return site;
}
