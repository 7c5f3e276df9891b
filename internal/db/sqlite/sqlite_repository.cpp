#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace voicecode::db::sqlite {

using voicecode::db::ErrorCode;
using voicecode::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static double ColDouble(sqlite3_stmt* st, int col) {
    return sqlite3_column_double(st, col);
}

static model::QueueEntryRecord ReadQueueEntry(sqlite3_stmt* st) {
    model::QueueEntryRecord r;
    r.session_id   = ColText(st, 0);
    r.priority     = static_cast<voicecode::session::v1::Priority>(ColI32(st, 1));
    r.order_key    = ColDouble(st, 2);
    r.queued_at_ms = ColU64(st, 3);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    db.Exec(
        "CREATE TABLE IF NOT EXISTS queue_entry ("
        "session_id TEXT PRIMARY KEY, "
        "priority INTEGER NOT NULL, "
        "order_key REAL NOT NULL, "
        "queued_at_ms INTEGER NOT NULL);");
    db.Exec("CREATE INDEX IF NOT EXISTS queue_entry_order ON queue_entry(priority, order_key, session_id);");

    // fail fast on a pre-existing table with an incompatible shape
    db.Exec("SELECT session_id,priority,order_key,queued_at_ms FROM queue_entry LIMIT 1;");
}

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
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Priority queue
// ------------------------------------------------------------------

std::vector<model::QueueEntryRecord> SqliteRepository::ListQueueEntries(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT session_id,priority,order_key,queued_at_ms FROM queue_entry;";

    std::vector<model::QueueEntryRecord> out;
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadQueueEntry(st));
    }

    sqlite3_finalize(st);
    return out;
}

std::optional<model::QueueEntryRecord>
SqliteRepository::GetQueueEntry(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT session_id,priority,order_key,queued_at_ms FROM queue_entry WHERE session_id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, session_id);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadQueueEntry(st);
    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpsertQueueEntry(Transaction& t, const model::QueueEntryRecord& r) {
    auto* db = TX(t).Handle();

    if (r.session_id.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "queue entry session_id must not be empty");

    const char* sql =
        "INSERT INTO queue_entry(session_id,priority,order_key,queued_at_ms) VALUES(?,?,?,?) "
        "ON CONFLICT(session_id) DO UPDATE SET priority=excluded.priority, "
        "order_key=excluded.order_key, queued_at_ms=excluded.queued_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.session_id);
    BindI32(st, 2, static_cast<int>(r.priority));
    BindDouble(st, 3, r.order_key);
    BindU64(st, 4, r.queued_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteQueueEntry(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM queue_entry WHERE session_id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, session_id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "queue entry not found: " + session_id);

    return Translate(db, rc);
}

} // namespace voicecode::db::sqlite
