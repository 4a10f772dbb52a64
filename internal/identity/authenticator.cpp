#include "authenticator.hpp"

#include "internal/util/errors.hpp"

namespace datahub::identity {

StaticTokenAuthenticator::StaticTokenAuthenticator(std::unordered_map<std::string, std::string> tokens) : tokens_(std::move(tokens)) {
}

StaticTokenAuthenticator StaticTokenAuthenticator::FromConfig(const datahub::runtime::config::AuthConfig& config) {
  std::unordered_map<std::string, std::string> tokens;
  for (const auto& [token, uid] : config.tokens()) {
    if (token.empty() || uid.empty()) {
      throw std::runtime_error("auth.tokens entries need a token and a uid");
    }
    tokens.emplace(token, uid);
  }
  return StaticTokenAuthenticator(std::move(tokens));
}

std::string StaticTokenAuthenticator::Authenticate(const std::string& credential) const {
  const auto token = BearerToken(credential);
  if (token.empty()) {
    throw util::AuthError("missing bearer token");
  }
  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    throw util::AuthError("unknown bearer token");
  }
  return it->second;
}

std::string BearerToken(const std::string& header) {
  static const std::string kPrefix = "Bearer ";
  if (header.compare(0, kPrefix.size(), kPrefix) == 0) {
    return header.substr(kPrefix.size());
  }
  return header;
}

} // namespace datahub::identity
