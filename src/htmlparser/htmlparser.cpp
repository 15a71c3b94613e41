#include "../../inc/htmlparser.h"
#include "../../inc/url_utils.h"
#include <cctype>
#include <cstring>
#include <gumbo.h>
#include <memory>
#include <unordered_set>

namespace {

struct GumboOutputDeleter {
  void operator()(GumboOutput *output) const {
    gumbo_destroy_output(&kGumboDefaultOptions, output);
  }
};

struct Collector {
  std::string document_url;
  ParsedPage page;
  std::unordered_set<std::string> seen_links;
  std::unordered_set<std::string> seen_assets;
};

std::string trim(const std::string &value) {
  const char *whitespace = " \t\r\n\f\v";
  size_t start = value.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = value.find_last_not_of(whitespace);
  return value.substr(start, end - start + 1);
}

bool is_ignored_reference(const std::string &ref) {
  if (ref.empty() || ref[0] == '#') {
    return true;
  }
  std::string lower = ref.substr(0, 11);
  for (auto &c : lower) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lower.find("javascript:") == 0 || lower.find("mailto:") == 0 ||
         lower.find("tel:") == 0 || lower.find("data:") == 0;
}

// Resolves an attribute value against the document. Returns an empty string
// when the value is missing, not http(s) or on another host.
std::string resolve_attribute(const Collector &collector, GumboElement *element,
                              const char *name) {
  GumboAttribute *attr = gumbo_get_attribute(&element->attributes, name);
  if (!attr || !attr->value || std::strlen(attr->value) == 0) {
    return "";
  }

  std::string ref = trim(attr->value);
  if (is_ignored_reference(ref)) {
    return "";
  }

  std::string absolute =
      UrlUtils::make_absolute_url(collector.document_url, ref);
  if (!UrlUtils::is_http_url(absolute) ||
      !UrlUtils::is_same_host(absolute, collector.document_url)) {
    return "";
  }
  return absolute;
}

void add_unique(std::vector<std::string> &items,
                std::unordered_set<std::string> &seen,
                const std::string &value) {
  if (!value.empty() && seen.insert(value).second) {
    items.push_back(value);
  }
}

void visit(GumboNode *node, Collector &collector) {
  if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
    return;
  }

  GumboElement *element = &node->v.element;

  switch (element->tag) {
  case GUMBO_TAG_A:
    add_unique(collector.page.links, collector.seen_links,
               resolve_attribute(collector, element, "href"));
    break;
  case GUMBO_TAG_IMG:
  case GUMBO_TAG_SCRIPT:
    add_unique(collector.page.assets, collector.seen_assets,
               resolve_attribute(collector, element, "src"));
    break;
  case GUMBO_TAG_LINK:
    add_unique(collector.page.assets, collector.seen_assets,
               resolve_attribute(collector, element, "href"));
    break;
  default:
    break;
  }

  for (unsigned int i = 0; i < element->children.length; ++i) {
    visit(static_cast<GumboNode *>(element->children.data[i]), collector);
  }
}

} // namespace

HTMLParser::HTMLParser() {}
HTMLParser::~HTMLParser() {}

ParsedPage HTMLParser::parse(const std::string &html,
                             const std::string &document_url) {
  if (html.empty() || !UrlUtils::is_absolute(document_url)) {
    return {};
  }

  std::unique_ptr<GumboOutput, GumboOutputDeleter> output(
      gumbo_parse_with_options(&kGumboDefaultOptions, html.data(),
                               html.size()));
  if (!output || !output->root) {
    return {};
  }

  Collector collector;
  collector.document_url = document_url;
  visit(output->root, collector);

  return collector.page;
}
