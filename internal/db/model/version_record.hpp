#pragma once

#include <cstdint>
#include <string>

namespace datahub::db::model {

/*
  One entry of a dataset's append-only version sequence.
  (dataset_id, version_id) is unique; version_id starts at 1.
*/

struct VersionRecord {
  std::string dataset_id;
  uint32_t    version_id    = 0;
  uint64_t    size          = 0;
  uint64_t    created_at_ms = 0;
};

} // namespace datahub::db::model
