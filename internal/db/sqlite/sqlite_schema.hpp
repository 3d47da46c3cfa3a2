#pragma once

#include "sqlite_db.hpp"

namespace courier::db::sqlite {

inline constexpr int kSchemaVersion = 1;

// Creates tables, indexes and triggers if missing and records the schema
// version. Safe to run on every start; refuses a file written by a newer
// schema.
void BootstrapSchema(SqliteDB& db);

} // namespace courier::db::sqlite
