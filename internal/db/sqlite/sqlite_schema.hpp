#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace threadnet::db::sqlite {

/*
  Numbered schema migrations.

  Applied versions are recorded in thread_schema_migrations; each pending
  migration runs in its own transaction. Later migrations only add nullable
  columns or new tables, so older rows stay readable.
*/
int  CurrentSchemaVersion(SqliteDB& db);
void ApplyMigrations(SqliteDB& db);

} // namespace threadnet::db::sqlite
