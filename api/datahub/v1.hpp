#pragma once

#include "datahub/core/v1/types.pb.h"

#include "datahub/services/v1/catalog_service.pb.h"
#include "datahub/services/v1/ingest_service.pb.h"

#include "datahub/services/v1/catalog_service.grpc.pb.h"
#include "datahub/services/v1/ingest_service.grpc.pb.h"

namespace datahub::v1 {
using namespace ::datahub::core::v1;
using namespace ::datahub::services::v1;
}
