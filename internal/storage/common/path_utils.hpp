#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace datahub::storage::common {

/*
  Object keys are relative, '/'-separated paths. Empty segments and dot
  segments are rejected so a key can never escape the store root.
*/
inline void ValidateObjectKey(const std::string& key) {
  if (key.empty()) {
    throw util::ValidationError("object key must not be empty");
  }
  if (key.front() == '/' || key.back() == '/') {
    throw util::ValidationError("object key must not start or end with '/'");
  }

  size_t start = 0;
  while (start <= key.size()) {
    const auto end     = key.find('/', start);
    const auto segment = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw util::ValidationError("object key has an invalid path segment: " + key);
    }
    if (segment.find('\\') != std::string::npos || segment.find('\0') != std::string::npos) {
      throw util::ValidationError("object key contains invalid character: " + key);
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

inline std::string JoinPath(const std::string& root, const std::string& relative) {
  if (root.empty()) return relative;
  if (root.back() == '/') return root + relative;
  return root + "/" + relative;
}

} // namespace datahub::storage::common
