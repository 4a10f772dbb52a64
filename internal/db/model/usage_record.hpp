#pragma once

#include <cstdint>
#include <string>

namespace datahub::db::model {

inline constexpr const char* kUsageDatasetIngested = "dataset_ingested";

/*
  Append-only usage fact. Never updated.

  payload_json is opaque JSON text, e.g. {"dataset":"<id>","version":2}
*/

struct UsageRecord {
  std::string uid;
  std::string type;
  std::string payload_json;
  uint64_t    timestamp_ms = 0;
};

} // namespace datahub::db::model
