#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace vigil::db::sqlite {

// Creates every table and index that is missing. Idempotent.
void BootstrapSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace vigil::db::sqlite
