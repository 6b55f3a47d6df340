#include "request_log.hpp"

#include <filesystem>
#include <fmt/core.h>

namespace fs = std::filesystem;

RequestLog::RequestLog() = default;

RequestLog::~RequestLog() {
    close();
}

bool RequestLog::open(const std::string& path, int max_entries) {
    std::lock_guard lock(mutex_);
    max_entries_ = max_entries;

    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        fmt::print(stderr, "db: failed to open {}: {}\n", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO requests (route, status, muted, volume, latency_ms) "
        "VALUES (?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, route, status, muted, volume, latency_ms "
        "FROM requests ORDER BY id DESC LIMIT ?";

    const char* count_sql = "SELECT COUNT(*) FROM requests";

    const char* served_sql = "SELECT COALESCE(MAX(id), 0) FROM requests";

    const char* prune_sql =
        "DELETE FROM requests WHERE id <= (SELECT MAX(id) FROM requests) - ?";

    struct {
        const char* sql;
        sqlite3_stmt** stmt;
        const char* name;
    } statements[] = {
        {insert_sql, &insert_stmt_, "insert"},
        {recent_sql, &recent_stmt_, "recent"},
        {count_sql, &count_stmt_, "count"},
        {served_sql, &served_stmt_, "served"},
        {prune_sql, &prune_stmt_, "prune"},
    };

    for (auto& s : statements) {
        if (sqlite3_prepare_v2(db_, s.sql, -1, s.stmt, nullptr) != SQLITE_OK) {
            fmt::print(stderr, "db: prepare {} failed: {}\n", s.name, sqlite3_errmsg(db_));
            return false;
        }
    }

    return true;
}

void RequestLog::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (count_stmt_) { sqlite3_finalize(count_stmt_); count_stmt_ = nullptr; }
    if (served_stmt_) { sqlite3_finalize(served_stmt_); served_stmt_ = nullptr; }
    if (prune_stmt_) { sqlite3_finalize(prune_stmt_); prune_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool RequestLog::is_open() const {
    std::lock_guard lock(mutex_);
    return insert_stmt_ != nullptr;
}

bool RequestLog::insert(const RequestRecord& record) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, record.route.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, record.status.c_str(), -1, SQLITE_TRANSIENT);

    if (record.muted) sqlite3_bind_int(insert_stmt_, 3, *record.muted ? 1 : 0);
    else sqlite3_bind_null(insert_stmt_, 3);

    if (record.volume) sqlite3_bind_double(insert_stmt_, 4, *record.volume);
    else sqlite3_bind_null(insert_stmt_, 4);

    sqlite3_bind_double(insert_stmt_, 5, record.latency_ms);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        fmt::print(stderr, "db: insert failed: {}\n", sqlite3_errmsg(db_));
        return false;
    }
    return prune();
}

std::vector<RequestRecord> RequestLog::recent(int limit) {
    std::lock_guard lock(mutex_);
    std::vector<RequestRecord> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        RequestRecord e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.route = get_text(recent_stmt_, 2);
        e.status = get_text(recent_stmt_, 3);
        if (sqlite3_column_type(recent_stmt_, 4) != SQLITE_NULL) {
            e.muted = sqlite3_column_int(recent_stmt_, 4) != 0;
        }
        if (sqlite3_column_type(recent_stmt_, 5) != SQLITE_NULL) {
            e.volume = sqlite3_column_double(recent_stmt_, 5);
        }
        e.latency_ms = sqlite3_column_double(recent_stmt_, 6);
        entries.push_back(std::move(e));
    }

    return entries;
}

int64_t RequestLog::count() {
    std::lock_guard lock(mutex_);
    if (!count_stmt_) return 0;

    sqlite3_reset(count_stmt_);
    if (sqlite3_step(count_stmt_) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(count_stmt_, 0);
}

int64_t RequestLog::total_served() {
    std::lock_guard lock(mutex_);
    if (!served_stmt_) return 0;

    sqlite3_reset(served_stmt_);
    if (sqlite3_step(served_stmt_) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(served_stmt_, 0);
}

bool RequestLog::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS requests (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            route TEXT NOT NULL,
            status TEXT NOT NULL,
            muted INTEGER,
            volume REAL,
            latency_ms REAL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        fmt::print(stderr, "db: create table failed: {}\n", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool RequestLog::prune() {
    if (max_entries_ <= 0) return true;

    sqlite3_reset(prune_stmt_);
    sqlite3_bind_int(prune_stmt_, 1, max_entries_);
    if (sqlite3_step(prune_stmt_) != SQLITE_DONE) {
        fmt::print(stderr, "db: prune failed: {}\n", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}
