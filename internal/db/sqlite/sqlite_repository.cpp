#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace actions::db::sqlite {

using actions::db::ErrorCode;
using actions::db::Result;

namespace {

constexpr const char* kActionColumns =
    "id,kind,author_id,guild_id,channel_id,message_id,created_at_ms,trigger_at_ms,extra";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// snowflakes use the full unsigned range; sqlite INTEGER is signed 64-bit
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::ActionRecord ReadAction(sqlite3_stmt* st) {
    model::ActionRecord r;
    r.id = ColI64(st, 0);
    r.kind = ColText(st, 1);
    r.author_id = ColU64(st, 2);
    if (sqlite3_column_type(st, 3) != SQLITE_NULL) {
        r.guild_id = ColU64(st, 3);
    }
    r.channel_id = ColU64(st, 4);
    r.message_id = ColU64(st, 5);
    r.created_at_ms = ColI64(st, 6);
    r.trigger_at_ms = ColI64(st, 7);
    r.extra = ColText(st, 8);
    return r;
}

/*
  Owns a prepared statement for one call.
*/
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

private:
    sqlite3_stmt* st_ = nullptr;
};

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

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Actions
// ------------------------------------------------------------------

Result SqliteRepository::InsertAction(Transaction& t, model::ActionRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db,
                           "INSERT INTO actions(kind,author_id,guild_id,channel_id,message_id,created_at_ms,trigger_at_ms,extra) "
                           "VALUES(?,?,?,?,?,?,?,?);",
                           -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(raw, 1, r.kind);
    BindU64(raw, 2, r.author_id);
    if (r.guild_id) {
        BindU64(raw, 3, *r.guild_id);
    } else {
        sqlite3_bind_null(raw, 3);
    }
    BindU64(raw, 4, r.channel_id);
    BindU64(raw, 5, r.message_id);
    BindI64(raw, 6, r.created_at_ms);
    BindI64(raw, 7, r.trigger_at_ms);
    BindText(raw, 8, r.extra);

    int rc = sqlite3_step(raw);
    sqlite3_finalize(raw);
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
}

std::optional<model::ActionRecord>
SqliteRepository::GetAction(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kActionColumns + " FROM actions WHERE id=?;");
    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(Translate(db, rc).message);
    }
    return ReadAction(st.get());
}

std::optional<model::ActionRecord>
SqliteRepository::GetSoonestAction(Transaction& t, int64_t before_ms) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kActionColumns +
                         " FROM actions WHERE trigger_at_ms < ? ORDER BY trigger_at_ms ASC, id ASC LIMIT 1;");
    BindI64(st.get(), 1, before_ms);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(Translate(db, rc).message);
    }
    return ReadAction(st.get());
}

std::vector<model::ActionRecord>
SqliteRepository::ListActions(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, std::string("SELECT ") + kActionColumns + " FROM actions ORDER BY trigger_at_ms ASC, id ASC;");

    std::vector<model::ActionRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadAction(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(Translate(db, rc).message);
    }
    return out;
}

Result SqliteRepository::DeleteAction(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM actions WHERE id=?;", -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(raw, 1, id);
    int rc = sqlite3_step(raw);
    sqlite3_finalize(raw);

    return Translate(db, rc);
}

} // namespace actions::db::sqlite
