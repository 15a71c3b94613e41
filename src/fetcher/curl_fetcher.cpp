#include "../../inc/fetcher.h"
#include "../../inc/metrics_collector.h"
#include <curl/curl.h>
#include <memory>
#include <stdexcept>

static size_t WriteCallback(void *contents, size_t size, size_t nmemb,
                            std::string *output) {
  size_t totalSize = size * nmemb;
  output->append((char *)contents, totalSize);
  return totalSize;
}

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize libcurl");
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

CurlFetcher::CurlFetcher(const CrawlerConfig &config, CrawlLog &crawl_log)
    : user_agent(config.user_agent),
      timeout_sec(static_cast<long>(config.request_timeout_sec)),
      follow_redirects(config.follow_redirects), crawl_log(crawl_log) {}

bool CurlFetcher::fetch(const std::string &url, FetchResponse &response) {
  response = FetchResponse();
  response.url = url;

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                           curl_easy_cleanup);
  if (!curl) {
    LOG("Error: Failed to initialize CURL for URL: " << url);
    return false;
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.content);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION,
                   follow_redirects ? 1L : 0L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_sec);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl.get());

  if (res != CURLE_OK) {
    LOG("Error: curl_easy_perform() failed for URL: "
        << url << " with error: " << curl_easy_strerror(res));
    return false;
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.http_code);

  char *effective_url = nullptr;
  if (curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective_url) ==
          CURLE_OK &&
      effective_url) {
    response.url = effective_url;
  }

  LOG("HTTP response code for URL " << url << ": " << response.http_code);

  if (response.http_code >= 200 && response.http_code < 400) {
    if (response.content.empty()) {
      LOG("Warning: Empty content with successful HTTP code for URL: " << url);
    }

    MetricsCollector::instance().add_bytes_downloaded(response.content.size());
    return true;
  }

  if (response.http_code == 404) {
    LOG("URL not found (404): " << url);
  } else if (response.http_code >= 400 && response.http_code < 500) {
    LOG("Client error for URL: " << url
                                 << " with HTTP code: " << response.http_code);
  } else if (response.http_code >= 500) {
    LOG("Server error for URL: " << url
                                 << " with HTTP code: " << response.http_code);
  } else {
    LOG("Unexpected HTTP code " << response.http_code << " for URL: " << url);
  }

  return false;
}
