#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace threadnet::db::sqlite {

namespace {

struct Migration {
  int                      version;
  std::vector<std::string> statements;
};

const std::vector<Migration>& Migrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {"CREATE TABLE IF NOT EXISTS thread_dataset (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, source TEXT NOT NULL, tlv TEXT NOT NULL, created_at_us INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS thread_dataset_store (key TEXT PRIMARY KEY, value TEXT);"}},
  };
  return kMigrations;
}

} // namespace

int CurrentSchemaVersion(SqliteDB& db) {
  db.Exec("CREATE TABLE IF NOT EXISTS thread_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  Statement st(db, "SELECT COALESCE(MAX(version), 0) FROM thread_schema_migrations;");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("read schema version: ") + sqlite3_errmsg(db.Handle()));
  }
  return sqlite3_column_int(st.get(), 0);
}

void ApplyMigrations(SqliteDB& db) {
  const int current = CurrentSchemaVersion(db);

  for (const auto& migration : Migrations()) {
    if (migration.version <= current) {
      continue;
    }

    db.Exec("BEGIN IMMEDIATE;");
    try {
      for (const auto& sql : migration.statements) {
        db.Exec(sql);
      }
      db.Exec("INSERT INTO thread_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(migration.version) + ", " +
              std::to_string(util::ToUnixMillis(util::Now())) + ");");
      db.Exec("COMMIT;");
    } catch (const std::exception&) {
      db.Exec("ROLLBACK;");
      throw;
    }

    THREADNET_LOG_INFO("applied schema migration", {observability::IntField("version", migration.version),
                                                    observability::StringField("path", db.Path())});
  }
}

} // namespace threadnet::db::sqlite
