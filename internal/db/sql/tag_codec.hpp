#pragma once

#include <string>
#include <vector>

namespace datahub::db::sql {

/*
  Tags are stored as one TEXT column, newline separated.
  Tags themselves never contain newlines (validated upstream).
*/

inline std::string EncodeTags(const std::vector<std::string>& tags) {
  std::string out;
  for (size_t i = 0; i < tags.size(); ++i) {
    if (i > 0) out.push_back('\n');
    out += tags[i];
  }
  return out;
}

inline std::vector<std::string> DecodeTags(const std::string& encoded) {
  std::vector<std::string> tags;
  if (encoded.empty()) return tags;

  size_t start = 0;
  for (;;) {
    const auto pos = encoded.find('\n', start);
    tags.push_back(encoded.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1;
  }
  return tags;
}

} // namespace datahub::db::sql
