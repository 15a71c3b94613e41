#pragma once
#include "fetcher.h"
#include "htmlparser.h"
#include "worker.h"
#include <string>

class FetchWorker : public Worker<std::string> {
public:
  // fetcher and parser are shared by all fetch workers of a crawl.
  FetchWorker(int id, CrawlState &state, Fetcher &fetcher, PageParser &parser);

protected:
  void process(std::string &url) override;

private:
  ParsedPage parse(const FetchResponse &response);

  Fetcher &fetcher;
  PageParser &parser;
};
