#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RequestRecord {
    int64_t id = 0;
    std::string timestamp;
    std::string route;
    std::string status;
    std::optional<bool> muted;
    std::optional<double> volume;
    double latency_ms = 0.0;
};

// Persistent history of control requests served by the endpoint.
class RequestLog {
public:
    RequestLog();
    ~RequestLog();

    RequestLog(const RequestLog&) = delete;
    RequestLog& operator=(const RequestLog&) = delete;

    bool open(const std::string& path, int max_entries = 1000);
    void close();
    bool is_open() const;

    bool insert(const RequestRecord& record);

    std::vector<RequestRecord> recent(int limit = 10);
    int64_t count();
    // Requests ever recorded; ids keep growing across pruning.
    int64_t total_served();

private:
    bool create_tables();
    bool prune();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* count_stmt_ = nullptr;
    sqlite3_stmt* served_stmt_ = nullptr;
    sqlite3_stmt* prune_stmt_ = nullptr;
    int max_entries_ = 1000;
};
