#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <vector>

namespace timekeeper::db::sqlite {

using timekeeper::db::ErrorCode;
using timekeeper::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

const std::vector<std::string> kBootstrapSql = {
    "CREATE TABLE IF NOT EXISTS matches (match_id TEXT PRIMARY KEY, description TEXT NOT NULL, admin_id TEXT NOT NULL, "
    "seconds_remaining INTEGER NOT NULL, is_running INTEGER NOT NULL, last_update TEXT NOT NULL, total_paused_time INTEGER NOT NULL, "
    "created_at TEXT NOT NULL, is_active INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS users (user_id TEXT PRIMARY KEY);",
    "CREATE TABLE IF NOT EXISTS user_follows (user_id TEXT NOT NULL REFERENCES users(user_id), position INTEGER NOT NULL, "
    "match_id TEXT NOT NULL, PRIMARY KEY (user_id, position));"};

constexpr const char* kMatchColumns =
    "match_id,description,admin_id,seconds_remaining,is_running,last_update,total_paused_time,created_at,is_active";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

StmtPtr Prepare(SqliteDB& db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db.Handle(), sql.c_str(), -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        if (st) sqlite3_finalize(st);
        throw DbError(db.Translate(rc));
    }
    return StmtPtr(st, &sqlite3_finalize);
}

model::MatchRecord ReadMatchRow(sqlite3_stmt* st) {
    model::MatchRecord r;
    r.match_id = ColText(st, 0);
    r.description = ColText(st, 1);
    r.admin_id = ColText(st, 2);
    r.seconds_remaining = ColI32(st, 3);
    r.is_running = ColI32(st, 4) != 0;
    r.last_update = ColText(st, 5);
    r.total_paused_time = ColI32(st, 6);
    r.created_at = ColText(st, 7);
    r.is_active = ColI32(st, 8) != 0;
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {
    BootstrapSchema();
}

void SqliteRepository::BootstrapSchema() {
    SqliteTransaction tx(db_, /*writable=*/true);
    for (const auto& sql : kBootstrapSql) {
        db_->Exec(sql);
    }
    tx.Commit();
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(db_, /*writable=*/false);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_, /*writable=*/true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Matches
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMatch(Transaction& t, const model::MatchRecord& r) {
    if (r.match_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "match id is empty");
    auto& db = TX(t).DB();

    const std::string sql = std::string("INSERT INTO matches(") + kMatchColumns +
        ") VALUES(?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(match_id) DO UPDATE SET description=excluded.description, admin_id=excluded.admin_id, "
        "seconds_remaining=excluded.seconds_remaining, is_running=excluded.is_running, last_update=excluded.last_update, "
        "total_paused_time=excluded.total_paused_time, created_at=excluded.created_at, is_active=excluded.is_active;";

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db.Handle(), sql.c_str(), -1, &raw, nullptr);
    StmtPtr st(raw, &sqlite3_finalize);
    if (rc != SQLITE_OK) return db.Translate(rc);

    BindText(st.get(), 1, r.match_id);
    BindText(st.get(), 2, r.description);
    BindText(st.get(), 3, r.admin_id);
    BindI32(st.get(), 4, r.seconds_remaining);
    BindI32(st.get(), 5, r.is_running ? 1 : 0);
    BindText(st.get(), 6, r.last_update);
    BindI32(st.get(), 7, r.total_paused_time);
    BindText(st.get(), 8, r.created_at);
    BindI32(st.get(), 9, r.is_active ? 1 : 0);

    return db.Translate(sqlite3_step(st.get()));
}

std::optional<model::MatchRecord>
SqliteRepository::GetMatch(Transaction& t, const std::string& id) {
    auto& db = TX(t).DB();

    auto st = Prepare(db, std::string("SELECT ") + kMatchColumns + " FROM matches WHERE match_id=?;");
    BindText(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw DbError(db.Translate(rc));
    }
    return ReadMatchRow(st.get());
}

std::vector<model::MatchRecord> SqliteRepository::ListMatches(Transaction& t) {
    auto& db = TX(t).DB();

    auto st = Prepare(db, std::string("SELECT ") + kMatchColumns + " FROM matches ORDER BY match_id;");

    std::vector<model::MatchRecord> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadMatchRow(st.get()));
    }
    if (rc != SQLITE_DONE) {
        throw DbError(db.Translate(rc));
    }
    return out;
}

// ------------------------------------------------------------------
// Follow lists
// ------------------------------------------------------------------

Result SqliteRepository::UpsertFollowList(Transaction& t, const model::FollowListRecord& r) {
    if (r.user_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "user id is empty");
    auto& db = TX(t).DB();

    auto run = [&](const char* sql, auto&& bind) -> Result {
        sqlite3_stmt* raw = nullptr;
        int rc = sqlite3_prepare_v2(db.Handle(), sql, -1, &raw, nullptr);
        StmtPtr st(raw, &sqlite3_finalize);
        if (rc != SQLITE_OK) return db.Translate(rc);
        bind(st.get());
        return db.Translate(sqlite3_step(st.get()));
    };

    if (auto res = run("INSERT OR IGNORE INTO users(user_id) VALUES(?);", [&](sqlite3_stmt* st) { BindText(st, 1, r.user_id); }); !res) {
        return res;
    }
    if (auto res = run("DELETE FROM user_follows WHERE user_id=?;", [&](sqlite3_stmt* st) { BindText(st, 1, r.user_id); }); !res) {
        return res;
    }

    for (std::size_t i = 0; i < r.match_list.size(); ++i) {
        auto res = run("INSERT INTO user_follows(user_id,position,match_id) VALUES(?,?,?);", [&](sqlite3_stmt* st) {
            BindText(st, 1, r.user_id);
            BindI32(st, 2, static_cast<int>(i));
            BindText(st, 3, r.match_list[i]);
        });
        if (!res) return res;
    }

    return Result::Ok();
}

std::optional<model::FollowListRecord>
SqliteRepository::GetFollowList(Transaction& t, const std::string& user_id) {
    auto& db = TX(t).DB();

    auto user = Prepare(db, "SELECT user_id FROM users WHERE user_id=?;");
    BindText(user.get(), 1, user_id);
    int rc = sqlite3_step(user.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw DbError(db.Translate(rc));
    }

    model::FollowListRecord r;
    r.user_id = user_id;

    auto st = Prepare(db, "SELECT match_id FROM user_follows WHERE user_id=? ORDER BY position;");
    BindText(st.get(), 1, user_id);
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        r.match_list.push_back(ColText(st.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        throw DbError(db.Translate(rc));
    }
    return r;
}

} // namespace timekeeper::db::sqlite
