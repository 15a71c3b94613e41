#include "../../inc/url_utils.h"
#include <cctype>
#include <vector>

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
static bool is_scheme(const std::string &s) {
  if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) {
    return false;
  }
  return std::all_of(s.begin() + 1, s.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
  });
}

// True when url starts with "<scheme>:".
static bool has_scheme(const std::string &url) {
  size_t colon = url.find_first_of(":/?#");
  return colon != std::string::npos && url[colon] == ':' &&
         is_scheme(url.substr(0, colon));
}

bool UrlUtils::parse(const std::string &url, Parts &parts) {
  size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos ||
      !is_scheme(url.substr(0, scheme_end))) {
    return false;
  }

  size_t authority_start = scheme_end + 3;
  size_t authority_end = url.find_first_of("/?#", authority_start);
  if (authority_end == std::string::npos) {
    authority_end = url.size();
  }
  std::string authority =
      url.substr(authority_start, authority_end - authority_start);

  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }
  if (authority.empty() ||
      std::any_of(authority.begin(), authority.end(),
                  [](unsigned char c) { return std::isspace(c); })) {
    return false;
  }

  size_t fragment_start = url.find('#', authority_end);
  if (fragment_start == std::string::npos) {
    fragment_start = url.size();
  }
  size_t query_start = url.find('?', authority_end);
  if (query_start == std::string::npos || query_start > fragment_start) {
    query_start = fragment_start;
  }

  parts.scheme = to_lower(url.substr(0, scheme_end));
  parts.host = to_lower(authority);
  parts.path = url.substr(authority_end, query_start - authority_end);
  parts.query = url.substr(query_start, fragment_start - query_start);
  parts.fragment = url.substr(fragment_start);
  return true;
}

bool UrlUtils::is_absolute(const std::string &url) {
  Parts parts;
  return parse(url, parts);
}

bool UrlUtils::is_http_url(const std::string &url) {
  Parts parts;
  if (!parse(url, parts)) {
    return false;
  }
  return parts.scheme == "http" || parts.scheme == "https";
}

std::string UrlUtils::apply_default_scheme(const std::string &url) {
  if (url.size() >= 2 && url[0] == '/' && url[1] == '/') {
    return "http:" + url;
  }
  if (url.find("://") != std::string::npos) {
    return url;
  }
  return "http://" + url;
}

std::string UrlUtils::remove_dot_segments(const std::string &path) {
  if (path.empty()) {
    return "/";
  }

  std::vector<std::string> input;
  size_t start = path[0] == '/' ? 1 : 0;
  while (true) {
    size_t slash = path.find('/', start);
    if (slash == std::string::npos) {
      input.push_back(path.substr(start));
      break;
    }
    input.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }

  std::vector<std::string> output;
  for (size_t i = 0; i < input.size(); ++i) {
    const std::string &segment = input[i];
    bool last = i + 1 == input.size();

    if (segment == ".") {
      if (last)
        output.push_back("");
      continue;
    }
    if (segment == "..") {
      if (!output.empty())
        output.pop_back();
      if (last)
        output.push_back("");
      continue;
    }
    output.push_back(segment);
  }

  std::string result = "/";
  for (size_t i = 0; i < output.size(); ++i) {
    if (i > 0)
      result += '/';
    result += output[i];
  }
  return result;
}

static std::string normalize_path(const std::string &path) {
  std::string collapsed;
  collapsed.reserve(path.size());
  for (char c : path) {
    if (c == '/' && !collapsed.empty() && collapsed.back() == '/') {
      continue;
    }
    collapsed += c;
  }
  return UrlUtils::remove_dot_segments(collapsed);
}

std::string UrlUtils::normalize_url(const std::string &url) {
  Parts parts;
  if (!parse(url, parts)) {
    return url;
  }
  return parts.scheme + "://" + parts.host + normalize_path(parts.path) +
         parts.query;
}

std::string UrlUtils::make_absolute_url(const std::string &base_url,
                                        const std::string &relative_url) {
  if (relative_url.empty()) {
    return normalize_url(base_url);
  }

  if (has_scheme(relative_url)) {
    if (is_absolute(relative_url)) {
      return normalize_url(relative_url);
    }
    return relative_url;
  }

  Parts base;
  if (!parse(base_url, base)) {
    return relative_url;
  }
  std::string origin = base.scheme + "://" + base.host;

  if (relative_url.size() >= 2 && relative_url[0] == '/' &&
      relative_url[1] == '/') {
    return normalize_url(base.scheme + ":" + relative_url);
  }

  if (relative_url[0] == '/') {
    return normalize_url(origin + relative_url);
  }

  std::string base_path = base.path.empty() ? "/" : base.path;

  if (relative_url[0] == '?') {
    return normalize_url(origin + base_path + relative_url);
  }

  if (relative_url[0] == '#') {
    return normalize_url(origin + base_path + base.query);
  }

  size_t last_slash = base_path.find_last_of('/');
  std::string directory = base_path.substr(0, last_slash + 1);

  return normalize_url(origin + directory + relative_url);
}

std::string UrlUtils::extract_domain(const std::string &url) {
  Parts parts;
  if (!parse(url, parts)) {
    return "";
  }
  return parts.host;
}

bool UrlUtils::is_same_host(const std::string &url, const std::string &other) {
  std::string host = extract_domain(url);
  return !host.empty() && host == extract_domain(other);
}

std::string UrlUtils::extract_path(const std::string &url) {
  Parts parts;
  if (!parse(url, parts)) {
    return "";
  }
  return normalize_path(parts.path);
}
