#pragma once
#include "worker.h"
#include <string>
#include <vector>

class IndexWorker : public Worker<Page> {
public:
  IndexWorker(int id, CrawlState &state);

protected:
  void process(Page &page) override;

private:
  // Claims the unseen paths among links. Returns the links this worker won.
  std::vector<std::string>
  claim_new_links(const std::vector<std::string> &links);
};
