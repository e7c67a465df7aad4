#pragma once

#include <string>

namespace vtob::core::cloud {

struct TopicSyncReport {
  int created = 0;
  int updated = 0;
  int deleted = 0;
  int failed = 0;
};

// Aligns the cloud-side topic catalogue of one account with the visible
// devices. Implementations never throw.
class TopicCatalogSync {
public:
  virtual ~TopicCatalogSync() = default;

  virtual TopicSyncReport ReconcileRemoteTopics(const std::string& account_key) = 0;
};

}  // namespace vtob::core::cloud
