#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace datahub::db::sqlite {

// Creates or upgrades the hub schema on the connection.
void BootstrapSchema(const std::shared_ptr<SqliteDB>& sqlite_db);

} // namespace datahub::db::sqlite
