#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace threadnet::db::sqlite {

using threadnet::db::ErrorCode;
using threadnet::db::Result;

namespace {

constexpr const char* kPreferredDatasetKey = "preferred_dataset";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::DatasetRecord ReadDatasetRow(sqlite3_stmt* st) {
    model::DatasetRecord r;
    r.id = ColText(st, 0);
    r.source = ColText(st, 1);
    r.tlv = ColText(st, 2);
    r.created_at_us = ColI64(st, 3);
    return r;
}

[[noreturn]] void ThrowStep(sqlite3* db, const char* what) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Datasets
// ------------------------------------------------------------------

Result SqliteRepository::InsertDataset(Transaction& t, const model::DatasetRecord& r) {
    auto& tx = TX(t);
    auto* db = tx.Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO thread_dataset(id,source,tlv,created_at_us) VALUES(?,?,?,?);", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.source);
    BindText(st, 3, r.tlv);
    BindI64(st, 4, r.created_at_us);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, r.id);
    return Translate(db, rc);
}

std::optional<model::DatasetRecord>
SqliteRepository::GetDataset(Transaction& t, const std::string& id) {
    auto& tx = TX(t);

    Statement st(tx.DB(), "SELECT id,source,tlv,created_at_us FROM thread_dataset WHERE id=?;");
    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    if (rc != SQLITE_ROW)
        ThrowStep(tx.Handle(), "read dataset");

    return ReadDatasetRow(st.get());
}

std::vector<model::DatasetRecord> SqliteRepository::ListDatasets(Transaction& t) {
    auto& tx = TX(t);

    Statement st(tx.DB(), "SELECT id,source,tlv,created_at_us FROM thread_dataset ORDER BY seq;");

    std::vector<model::DatasetRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadDatasetRow(st.get()));
    }
    if (rc != SQLITE_DONE)
        ThrowStep(tx.Handle(), "list datasets");

    return out;
}

Result SqliteRepository::DeleteDataset(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM thread_dataset WHERE id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, id);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Store settings
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetPreferredDatasetId(Transaction& t) {
    auto& tx = TX(t);

    Statement st(tx.DB(), "SELECT value FROM thread_dataset_store WHERE key=?;");
    BindText(st.get(), 1, kPreferredDatasetKey);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE)
        return std::nullopt;
    if (rc != SQLITE_ROW)
        ThrowStep(tx.Handle(), "read preferred dataset");
    if (sqlite3_column_type(st.get(), 0) == SQLITE_NULL)
        return std::nullopt;

    return ColText(st.get(), 0);
}

Result SqliteRepository::SetPreferredDatasetId(Transaction& t, const std::optional<std::string>& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    const char* sql = id
        ? "INSERT INTO thread_dataset_store(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;"
        : "DELETE FROM thread_dataset_store WHERE key=?;";
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, kPreferredDatasetKey);
    if (id)
        BindText(st, 2, *id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace threadnet::db::sqlite
