#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace datahub::db::model {

/*
  Content-addressed file inside one dataset.

  Identity is (dataset_id, checksum). A file present in several versions
  is stored once and lists every version that includes it.
*/

struct FileRecord {
  std::string dataset_id;
  std::string checksum;
  std::string name;
  uint64_t    size = 0;
  std::string object_key;

  std::set<uint32_t> versions;

  uint64_t created_at_ms = 0;
};

} // namespace datahub::db::model
