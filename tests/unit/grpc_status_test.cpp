#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "client/cpp/hub_client.h"
#include "hub_test_fixture.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/identity/authenticator.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using datahub::grpc::ToStatus;
using datahub::identity::StaticTokenAuthenticator;
using datahub::testing::Throws;

void TestErrorMapping() {
  using namespace datahub::util;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(DatasetAlreadyExistsError("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(NameCharsValidationError()).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(DescriptionLengthValidationError(5, 50)).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(TierLimitError(10)).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(ChecksumMismatch(1, "a", "b")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(StorageBackendError("x", true)).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(StorageBackendError("x", false)).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(FinalizeError("x", {2})).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(PermissionDenied("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(AuthError("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(TransactionConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);

  // the quota message is what users see
  assert(ToStatus(TierLimitError(10)).error_message() == "You cannot ingest more than 10 datasets per day");
}

void TestClientStatusMapping() {
  using datahub::client::GrpcToArrow;

  assert(GrpcToArrow(::grpc::Status::OK, "call").ok());
  assert(GrpcToArrow({::grpc::StatusCode::DATA_LOSS, "x"}, "call").IsIOError());
  assert(GrpcToArrow({::grpc::StatusCode::UNAVAILABLE, "x"}, "call").IsIOError());
  assert(GrpcToArrow({::grpc::StatusCode::ABORTED, "x"}, "call").IsIOError());
  assert(GrpcToArrow({::grpc::StatusCode::NOT_FOUND, "x"}, "call").IsKeyError());
  assert(GrpcToArrow({::grpc::StatusCode::INVALID_ARGUMENT, "x"}, "call").IsInvalid());
  assert(GrpcToArrow({::grpc::StatusCode::RESOURCE_EXHAUSTED, "x"}, "call").IsInvalid());
}

void TestStaticTokens() {
  datahub::runtime::config::AuthConfig config;
  (*config.mutable_tokens())["t-alice"] = "alice";
  auto auth                              = StaticTokenAuthenticator::FromConfig(config);

  assert(auth.Authenticate("Bearer t-alice") == "alice");
  assert(auth.Authenticate("t-alice") == "alice");
  assert(Throws<datahub::util::AuthError>([&] { auth.Authenticate("Bearer nope"); }));
  assert(Throws<datahub::util::AuthError>([&] { auth.Authenticate("Bearer "); }));
  assert(datahub::identity::BearerToken("Bearer abc") == "abc");

  datahub::runtime::config::AuthConfig broken;
  (*broken.mutable_tokens())["t-empty"] = "";
  assert(Throws<std::runtime_error>([&] { StaticTokenAuthenticator::FromConfig(broken); }));
}

void TestServersRejectAnonymousWrites() {
  datahub::testing::ManualClock clock;
  auto hub = datahub::testing::MakeHub(std::make_shared<datahub::db::memory::MemoryRepository>(), datahub::testing::TempDir("grpc_status"),
                                       clock);
  datahub::service::ServiceContext ctx{hub.sessions, hub.versions, hub.store, hub.repo};

  auto auth = std::make_shared<StaticTokenAuthenticator>(std::unordered_map<std::string, std::string>{{"t-alice", "alice"}});
  datahub::grpc::IngestServer  ingest(std::make_shared<datahub::service::IngestService>(ctx), auth);
  datahub::grpc::CatalogServer catalog(std::make_shared<datahub::service::CatalogService>(ctx), auth);

  {
    ::grpc::ServerContext                     grpc_ctx;
    datahub::v1::StartOrResumeUploadRequest  req;
    datahub::v1::StartOrResumeUploadResponse resp;
    req.set_dataset_name("anonymous");
    assert(ingest.StartOrResumeUpload(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  }
  {
    ::grpc::ServerContext             grpc_ctx;
    datahub::v1::EditDatasetRequest  req;
    datahub::v1::EditDatasetResponse resp;
    req.set_dataset_id("whatever");
    assert(catalog.EditDataset(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  }

  // reads are open
  {
    ::grpc::ServerContext            grpc_ctx;
    datahub::v1::GetDatasetRequest  req;
    datahub::v1::GetDatasetResponse resp;
    req.set_name("missing");
    assert(catalog.GetDataset(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }
  {
    ::grpc::ServerContext              grpc_ctx;
    datahub::v1::ListDatasetsRequest  req;
    datahub::v1::ListDatasetsResponse resp;
    assert(catalog.ListDatasets(&grpc_ctx, &req, &resp).ok());
    assert(resp.datasets_size() == 0);
  }
}

} // namespace

int main() {
  TestErrorMapping();
  TestClientStatusMapping();
  TestStaticTokens();
  TestServersRejectAnonymousWrites();

  std::cout << "dataset_hub_unit_grpc_status: pass\n";
  return 0;
}
