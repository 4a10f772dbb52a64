#include "grpc_error.hpp"

namespace datahub::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace datahub::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const ChecksumMismatch*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (const auto* storage = dynamic_cast<const StorageBackendError*>(&e)) {
    return {storage->transient() ? ::grpc::StatusCode::UNAVAILABLE : ::grpc::StatusCode::INTERNAL, e.what()};
  }
  if (dynamic_cast<const FinalizeError*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const AuthError*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const TransactionConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

std::string CallerUid(const ::grpc::ServerContext* context, const datahub::identity::Authenticator& auth) {
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find("authorization");
  if (it == metadata.end()) {
    throw datahub::util::AuthError("missing authorization metadata");
  }
  return auth.Authenticate(std::string(it->second.data(), it->second.size()));
}

} // namespace datahub::grpc
