#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace datahub::db::model {

/*
  Persistent dataset row.

  - name is unique across the hub
  - likes/downloads are aggregate counters, only touched through
    atomic increments
*/

struct DatasetRecord {
  std::string id;
  std::string uid; // owner
  std::string name;
  std::string description;

  std::vector<std::string> tags;

  uint64_t likes     = 0;
  uint64_t downloads = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

enum class DatasetCounter {
  Likes,
  Downloads,
};

struct DatasetFilter {
  std::string name_contains;
  uint32_t    limit = 0; // 0 = unbounded
};

} // namespace datahub::db::model
