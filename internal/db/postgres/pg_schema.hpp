#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace datahub::db::postgres {

// Creates or upgrades the hub schema on the database behind the pool.
void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace datahub::db::postgres
