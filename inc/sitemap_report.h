#pragma once
#include "page.h"
#include <iostream>

class SitemapReport {
public:
  // Domain on the first line, then one block per page with its links and
  // assets, each list replaced by an N/A line when empty.
  static void print(const Site &site, std::ostream &os = std::cout);
};
