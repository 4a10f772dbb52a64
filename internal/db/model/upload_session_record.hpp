#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "datahub/core/v1/types.pb.h"

namespace datahub::db::model {

/*
  Durable upload session.

  - (uid, dataset_name, checksum) is unique among sessions that are not
    DATASET_PERSISTED; a persisted session stays only for replay
  - dataset_id is fixed at creation (existing dataset or a fresh id)
  - storage_upload_id is empty for deduplicated sessions
*/

struct UploadSessionRecord {
  std::string upload_id;
  std::string uid;
  std::string dataset_name;
  std::string checksum;

  std::string              dataset_id;
  std::string              filename;
  std::string              description;
  std::vector<std::string> tags;

  uint64_t total_size = 0;
  uint64_t chunk_size = 0;
  uint32_t part_count = 0;

  datahub::core::v1::UploadSessionState state = datahub::core::v1::UPLOAD_SESSION_STATE_UNSPECIFIED;

  std::string storage_upload_id;
  std::string object_key;
  bool        deduplicated = false;

  // set once DATASET_PERSISTED
  uint32_t version_id = 0;

  std::string error_message;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

// (upload_id, part_number) is the primary key; re-inserting is AlreadyExists.
struct UploadPartRecord {
  std::string upload_id;
  uint32_t    part_number = 0;
  uint64_t    size        = 0;
  std::string checksum;
  std::string etag;
  uint64_t    received_at_ms = 0;
};

} // namespace datahub::db::model
