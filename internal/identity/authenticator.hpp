#pragma once

#include <string>
#include <unordered_map>

#include "config/config.pb.h"

namespace datahub::identity {

/*
  Maps a caller credential to a uid.

  Implementations throw util::AuthError when the credential is missing
  or unknown.
*/
class Authenticator {
 public:
  virtual ~Authenticator() = default;

  virtual std::string Authenticate(const std::string& credential) const = 0;
};

// Bearer tokens from the auth section of the runtime config.
class StaticTokenAuthenticator final : public Authenticator {
 public:
  explicit StaticTokenAuthenticator(std::unordered_map<std::string, std::string> tokens);

  static StaticTokenAuthenticator FromConfig(const datahub::runtime::config::AuthConfig& config);

  std::string Authenticate(const std::string& credential) const override;

 private:
  std::unordered_map<std::string, std::string> tokens_;
};

// Strips an optional "Bearer " prefix from an authorization header value.
std::string BearerToken(const std::string& header);

} // namespace datahub::identity
