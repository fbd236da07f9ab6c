#pragma once

#include "toolpipe/core/errors.hpp"
#include "toolpipe/core/result.hpp"
#include "toolpipe/core/types.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace toolpipe::monitoring {

using namespace toolpipe::core;
namespace fs = std::filesystem;

// SQLite database with one connection per calling thread.
// Connections are opened lazily, in WAL mode with a busy timeout, and
// closed when the pool is destroyed. A connection is not closed when its
// thread exits: short-lived threads that touch the index should call
// release_current_thread() before they finish, or the pool keeps one
// connection per thread it has ever served.
class SqliteConnectionPool {
public:
    explicit SqliteConnectionPool(fs::path db_path, int busy_timeout_ms = 5000);
    ~SqliteConnectionPool();

    SqliteConnectionPool(const SqliteConnectionPool&) = delete;
    SqliteConnectionPool& operator=(const SqliteConnectionPool&) = delete;

    // Connection owned by the calling thread
    Result<sqlite3*, Error> connection();

    // Run statements that return no rows
    Result<void, Error> exec(const std::string& sql);

    // Close the calling thread's connection; false if it had none
    bool release_current_thread();

    const fs::path& path() const { return db_path_; }
    size_t connection_count() const;

private:
    fs::path db_path_;
    int busy_timeout_ms_;

    mutable std::mutex mutex_;
    std::map<std::thread::id, sqlite3*> connections_;
};

// Row of the traces table
struct TraceRecord {
    TraceId trace_id;
    ConversationId conversation_id;
    SessionId session_id;
    double start_time = 0.0;
    std::optional<double> end_time;
    std::optional<double> duration_ms;
    std::string status = "unknown";
    std::string file_path;
    double created_at = 0.0;
    std::optional<std::string> model;
    int64_t total_tokens = 0;
    int tool_calls_count = 0;

    Json to_json() const;
};

// Row of the metrics table
struct MetricsRecord {
    int64_t id = 0;
    ConversationId conversation_id;
    SessionId session_id;
    double timestamp = 0.0;
    int64_t total_tokens = 0;
    double total_duration_ms = 0.0;
    int tool_calls_count = 0;
    double estimated_cost_usd = 0.0;
    std::optional<std::string> model;
    std::string file_path;
    double created_at = 0.0;

    Json to_json() const;
};

// Filter shared by both indexes; time bounds are inclusive
struct IndexQuery {
    std::optional<ConversationId> conversation_id;
    std::optional<SessionId> session_id;
    std::optional<double> start_time;
    std::optional<double> end_time;
    std::optional<size_t> limit;
};

// Index over saved trace files, newest first
class TraceIndex {
public:
    static Result<std::unique_ptr<TraceIndex>, Error> open(const fs::path& db_path,
                                                           ClockFn clock = unix_now);

    // Insert or replace by trace_id; created_at is stamped from the clock
    Result<void, Error> upsert(TraceRecord record);

    Result<std::optional<TraceRecord>, Error> find(const TraceId& trace_id);
    Result<std::vector<TraceRecord>, Error> query(const IndexQuery& filter);

    Result<std::vector<TraceRecord>, Error> by_conversation(const ConversationId& conversation_id);
    Result<std::vector<TraceRecord>, Error> by_session(const SessionId& session_id);
    Result<std::vector<TraceRecord>, Error> by_time_range(double start_time, double end_time);
    Result<std::vector<TraceRecord>, Error> recent(size_t limit = 100);

    // Rows whose created_at is before the cutoff
    Result<std::vector<TraceRecord>, Error> created_before(double cutoff);
    Result<size_t, Error> remove_created_before(double cutoff);

    Result<std::set<std::string>, Error> file_paths();
    Result<size_t, Error> count();

    bool release_current_thread() { return pool_.release_current_thread(); }
    size_t connection_count() const { return pool_.connection_count(); }

private:
    TraceIndex(const fs::path& db_path, ClockFn clock);
    Result<void, Error> init_schema();

    SqliteConnectionPool pool_;
    ClockFn clock_;
};

// Index over appended metrics lines, newest first
class MetricsIndex {
public:
    static Result<std::unique_ptr<MetricsIndex>, Error> open(const fs::path& db_path,
                                                             ClockFn clock = unix_now);

    // Returns the new row id
    Result<int64_t, Error> insert(MetricsRecord record);

    Result<std::vector<MetricsRecord>, Error> query(const IndexQuery& filter);
    Result<std::vector<MetricsRecord>, Error> by_conversation(const ConversationId& conversation_id);

    Result<size_t, Error> remove_created_before(double cutoff);

    Result<std::set<std::string>, Error> file_paths();
    Result<size_t, Error> count();

    bool release_current_thread() { return pool_.release_current_thread(); }
    size_t connection_count() const { return pool_.connection_count(); }

private:
    MetricsIndex(const fs::path& db_path, ClockFn clock);
    Result<void, Error> init_schema();

    SqliteConnectionPool pool_;
    ClockFn clock_;
};

}  // namespace toolpipe::monitoring
