#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

#include "internal/identity/authenticator.hpp"
#include "internal/util/errors.hpp"

namespace datahub::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

/*
  Resolves the caller from the "authorization: Bearer <token>" metadata.
  Throws util::AuthError.
*/
std::string CallerUid(const ::grpc::ServerContext* context, const datahub::identity::Authenticator& auth);

} // namespace datahub::grpc
