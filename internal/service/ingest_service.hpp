#pragma once

#include <string>

#include "datahub/v1.hpp"
#include "service_context.hpp"

namespace datahub::service {

/*
  Ingestion entry points. Every call carries the authenticated uid.
*/
class IngestService {
public:
  explicit IngestService(ServiceContext ctx);

  datahub::v1::StartOrResumeUploadResponse
  StartOrResume(const std::string& uid, const datahub::v1::StartOrResumeUploadRequest& req);

  datahub::v1::UploadPartResponse
  UploadPart(const std::string& uid, const datahub::v1::UploadPartRequest& req);

  datahub::v1::CompleteUploadResponse
  Complete(const std::string& uid, const datahub::v1::CompleteUploadRequest& req);

  datahub::v1::DescribeUploadResponse
  Describe(const std::string& uid, const datahub::v1::DescribeUploadRequest& req);

  void Abort(const std::string& uid, const datahub::v1::AbortUploadRequest& req);

  datahub::v1::IngestSmallFileResponse
  IngestSmallFile(const std::string& uid, const datahub::v1::IngestSmallFileRequest& req);

private:
  ServiceContext ctx_;
};

}
