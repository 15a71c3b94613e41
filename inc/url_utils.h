#pragma once
#include <algorithm>
#include <string>

class UrlUtils {
public:
  struct Parts {
    std::string scheme;
    std::string host;
    std::string path;
    std::string query;
    std::string fragment;
  };

  // Splits an absolute URL. Returns false when the scheme or host is missing.
  static bool parse(const std::string &url, Parts &parts);

  static bool is_absolute(const std::string &url);

  static bool is_http_url(const std::string &url);

  static std::string apply_default_scheme(const std::string &url);

  static std::string normalize_url(const std::string &url);

  static std::string make_absolute_url(const std::string &base_url,
                                       const std::string &relative_url);

  static bool is_same_host(const std::string &url, const std::string &other);

  static std::string extract_domain(const std::string &url);

  // Sitemap key of a URL: the path without query and fragment, "/" if empty.
  static std::string extract_path(const std::string &url);

  static std::string remove_dot_segments(const std::string &path);
};
