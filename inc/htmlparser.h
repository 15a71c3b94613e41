#pragma once
#include <string>
#include <vector>

struct ParsedPage {
  std::vector<std::string> links;
  std::vector<std::string> assets;
};

class PageParser {
public:
  virtual ~PageParser() = default;

  // Extracts absolute links and static asset URLs that live on the host of
  // document_url. Malformed markup yields whatever could be recovered.
  virtual ParsedPage parse(const std::string &html,
                           const std::string &document_url) = 0;
};

// <a href> are links; <img src>, <script src> and <link href> are assets.
class HTMLParser : public PageParser {
public:
  HTMLParser();
  ~HTMLParser() override;

  ParsedPage parse(const std::string &html,
                   const std::string &document_url) override;
};
