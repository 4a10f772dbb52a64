#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace datahub::util {

/*
  UUID helpers

  Dataset ids and upload ids are random RFC4122 v4 UUIDs rendered as
  lowercase hex with dashes.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace datahub::util
