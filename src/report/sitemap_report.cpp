#include "../../inc/sitemap_report.h"

void SitemapReport::print(const Site &site, std::ostream &os) {
  os << site.domain << ":\n";

  for (const auto &entry : site.pages) {
    const Page &page = entry.second;
    os << "\t" << entry.first << "\n";

    os << "\tLINKS\n";
    if (!page.links.empty()) {
      for (const auto &link : page.links) {
        os << "\t\t" << link << "\n";
      }
    } else {
      os << "\t\tN/A (no links found)\n";
    }

    os << "\tASSETS\n";
    if (!page.assets.empty()) {
      for (const auto &asset : page.assets) {
        os << "\t\t" << asset << "\n";
      }
    } else {
      os << "\t\tN/A (assets may be inlined)\n";
    }
    os << "\n";
  }
}
