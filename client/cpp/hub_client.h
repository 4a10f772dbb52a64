#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "client/cpp/upload_transport.h"
#include "datahub/v1.hpp"

namespace datahub::client {

/*
  Maps a gRPC status onto arrow::Status.

    DATA_LOSS, UNAVAILABLE, DEADLINE_EXCEEDED, ABORTED, INTERNAL -> IOError (retryable)
    NOT_FOUND                                                    -> KeyError
    everything else                                              -> Invalid
*/
arrow::Status GrpcToArrow(const ::grpc::Status& status, std::string_view action);

class HubClient final : public UploadTransport {
 public:
  // token may be empty for the read-only catalog calls.
  HubClient(std::shared_ptr<::grpc::Channel> channel, std::string token);

  // ---------------------------------------------------------------------
  // Ingest
  // ---------------------------------------------------------------------

  arrow::Result<datahub::v1::StartOrResumeUploadResponse> StartOrResumeUpload(
      const datahub::v1::StartOrResumeUploadRequest& request, Deadline deadline) const override;

  arrow::Result<datahub::v1::UploadPartResponse> UploadPart(const datahub::v1::UploadPartRequest& request,
                                                            Deadline deadline) const override;

  arrow::Result<datahub::v1::CompleteUploadResponse> CompleteUpload(const std::string& upload_id,
                                                                    Deadline deadline) const override;

  arrow::Result<datahub::v1::IngestSmallFileResponse> IngestSmallFile(const datahub::v1::IngestSmallFileRequest& request,
                                                                      Deadline deadline) const override;

  arrow::Result<datahub::v1::UploadSession> DescribeUpload(const std::string& upload_id) const;

  arrow::Status AbortUpload(const std::string& upload_id) const;

  // ---------------------------------------------------------------------
  // Catalog
  // ---------------------------------------------------------------------

  arrow::Result<datahub::v1::Dataset> GetDataset(const datahub::v1::GetDatasetRequest& request) const;

  arrow::Result<datahub::v1::ListDatasetsResponse> ListDatasets(const datahub::v1::ListDatasetsRequest& request) const;

  arrow::Result<datahub::v1::ListFilesResponse> ListFiles(const datahub::v1::ListFilesRequest& request) const;

  arrow::Result<datahub::v1::Dataset> EditDataset(const datahub::v1::EditDatasetRequest& request) const;

  arrow::Result<datahub::v1::DownloadPlan> GetDownloadPlan(const std::string& dataset_id, uint32_t version_id) const;

  // Streams the object into `path` and verifies it against `checksum` when given.
  arrow::Status DownloadFile(const std::string& object_key, const std::string& path, const std::string& checksum = {}) const;

 private:
  void Authorize(::grpc::ClientContext* ctx) const;

  static void ApplyDeadline(::grpc::ClientContext* ctx, Deadline deadline);

  std::string token_;

  std::unique_ptr<datahub::v1::DatasetIngestService::Stub>  ingest_stub_;
  std::unique_ptr<datahub::v1::DatasetCatalogService::Stub> catalog_stub_;
};

} // namespace datahub::client
