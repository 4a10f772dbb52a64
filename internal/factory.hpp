#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/ingest/upload_session_manager.hpp"
#include "internal/runtime/session_reaper.hpp"

namespace datahub::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<ingest::UploadSessionManager> sessions;

  std::vector<std::unique_ptr<::grpc::Service>>         grpc_services;
  std::vector<std::shared_ptr<runtime::SessionReaper>> background_workers;
};

/*
  Opens the configured database and brings its schema up to date.

  NOTE:
  Together with Build() this is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const datahub::runtime::config::RuntimeConfig& config);

/*
  Build full application dependency graph. Background workers are
  created but not started.
*/
Application Build(const datahub::runtime::config::RuntimeConfig& config);

} // namespace datahub::factory
