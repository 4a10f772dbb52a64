#pragma once

#include <cstdint>
#include <string>

namespace datahub::db::model {

struct UserRecord {
  std::string uid;
  std::string tier;
  uint64_t    dataset_count = 0;
  uint64_t    created_at_ms = 0;
};

// Read-only from the ingest path; seeded from configuration.
struct TierRecord {
  std::string name;
  uint64_t    datasets_upload_per_day = 0;
};

} // namespace datahub::db::model
