#include "toolpipe/monitoring/trace_index.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <variant>

namespace toolpipe::monitoring {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const {
        if (stmt != nullptr) {
            sqlite3_finalize(stmt);
        }
    }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Error sqlite_error(ErrorCode code, sqlite3* db, const std::string& what) {
    std::string message = db != nullptr ? sqlite3_errmsg(db) : "sqlite error";
    return Error{code, what + ": " + message};
}

Result<Statement, Error> prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return sqlite_error(ErrorCode::IndexQueryFailed, db, "prepare failed");
    }
    return Statement(raw);
}

// Positional parameter values for a prepared statement
using Binding = std::variant<std::nullptr_t, int64_t, double, std::string>;

void bind_all(sqlite3_stmt* stmt, const std::vector<Binding>& params) {
    int index = 1;
    for (const auto& param : params) {
        if (std::holds_alternative<std::nullptr_t>(param)) {
            sqlite3_bind_null(stmt, index);
        } else if (auto* i = std::get_if<int64_t>(&param)) {
            sqlite3_bind_int64(stmt, index, *i);
        } else if (auto* d = std::get_if<double>(&param)) {
            sqlite3_bind_double(stmt, index, *d);
        } else if (auto* s = std::get_if<std::string>(&param)) {
            sqlite3_bind_text(stmt, index, s->c_str(), -1, SQLITE_TRANSIENT);
        }
        ++index;
    }
}

Binding optional_binding(const std::optional<double>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

Binding optional_binding(const std::optional<std::string>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text != nullptr ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(stmt, col);
}

std::optional<double> column_optional_double(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, col);
}

// Run a statement that returns no rows; yields sqlite3_changes()
Result<size_t, Error> execute(sqlite3* db, const std::string& sql, const std::vector<Binding>& params) {
    auto stmt = prepare(db, sql);
    if (stmt.is_err()) {
        return stmt.error();
    }

    bind_all(stmt.value().get(), params);
    if (sqlite3_step(stmt.value().get()) != SQLITE_DONE) {
        return sqlite_error(ErrorCode::IndexQueryFailed, db, "statement failed");
    }
    return static_cast<size_t>(sqlite3_changes(db));
}

template<typename Row>
Result<std::vector<Row>, Error> select_rows(sqlite3* db,
                                            const std::string& sql,
                                            const std::vector<Binding>& params,
                                            const std::function<Row(sqlite3_stmt*)>& read_row) {
    auto stmt = prepare(db, sql);
    if (stmt.is_err()) {
        return stmt.error();
    }

    bind_all(stmt.value().get(), params);

    std::vector<Row> rows;
    while (true) {
        int rc = sqlite3_step(stmt.value().get());
        if (rc == SQLITE_ROW) {
            rows.push_back(read_row(stmt.value().get()));
        } else if (rc == SQLITE_DONE) {
            break;
        } else {
            return sqlite_error(ErrorCode::IndexQueryFailed, db, "query failed");
        }
    }
    return rows;
}

// WHERE clause and bindings for an IndexQuery against `time_column`
std::string build_where(const IndexQuery& filter, const char* time_column,
                        std::vector<Binding>& params) {
    std::vector<std::string> clauses;
    if (filter.conversation_id) {
        clauses.push_back("conversation_id = ?");
        params.emplace_back(*filter.conversation_id);
    }
    if (filter.session_id) {
        clauses.push_back("session_id = ?");
        params.emplace_back(*filter.session_id);
    }
    if (filter.start_time) {
        clauses.push_back(std::string(time_column) + " >= ?");
        params.emplace_back(*filter.start_time);
    }
    if (filter.end_time) {
        clauses.push_back(std::string(time_column) + " <= ?");
        params.emplace_back(*filter.end_time);
    }

    std::string where;
    for (size_t i = 0; i < clauses.size(); ++i) {
        where += (i == 0 ? " WHERE " : " AND ") + clauses[i];
    }
    return where;
}

constexpr const char* kTraceColumns =
    "trace_id, conversation_id, session_id, start_time, end_time, duration_ms, status, "
    "file_path, created_at, model, total_tokens, tool_calls_count";

constexpr const char* kMetricsColumns =
    "id, conversation_id, session_id, timestamp, total_tokens, total_duration_ms, "
    "tool_calls_count, estimated_cost_usd, model, file_path, created_at";

TraceRecord read_trace_row(sqlite3_stmt* stmt) {
    TraceRecord r;
    r.trace_id = column_text(stmt, 0);
    r.conversation_id = column_text(stmt, 1);
    r.session_id = column_text(stmt, 2);
    r.start_time = sqlite3_column_double(stmt, 3);
    r.end_time = column_optional_double(stmt, 4);
    r.duration_ms = column_optional_double(stmt, 5);
    r.status = column_optional_text(stmt, 6).value_or("unknown");
    r.file_path = column_text(stmt, 7);
    r.created_at = sqlite3_column_double(stmt, 8);
    r.model = column_optional_text(stmt, 9);
    r.total_tokens = sqlite3_column_int64(stmt, 10);
    r.tool_calls_count = sqlite3_column_int(stmt, 11);
    return r;
}

MetricsRecord read_metrics_row(sqlite3_stmt* stmt) {
    MetricsRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.conversation_id = column_text(stmt, 1);
    r.session_id = column_text(stmt, 2);
    r.timestamp = sqlite3_column_double(stmt, 3);
    r.total_tokens = sqlite3_column_int64(stmt, 4);
    r.total_duration_ms = sqlite3_column_double(stmt, 5);
    r.tool_calls_count = sqlite3_column_int(stmt, 6);
    r.estimated_cost_usd = sqlite3_column_double(stmt, 7);
    r.model = column_optional_text(stmt, 8);
    r.file_path = column_text(stmt, 9);
    r.created_at = sqlite3_column_double(stmt, 10);
    return r;
}

Json optional_json(const std::optional<double>& value) {
    return value ? Json(*value) : Json(nullptr);
}

Json optional_json(const std::optional<std::string>& value) {
    return value ? Json(*value) : Json(nullptr);
}

}  // namespace

// SqliteConnectionPool

SqliteConnectionPool::SqliteConnectionPool(fs::path db_path, int busy_timeout_ms)
    : db_path_(std::move(db_path))
    , busy_timeout_ms_(busy_timeout_ms)
{
}

SqliteConnectionPool::~SqliteConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, db] : connections_) {
        sqlite3_close(db);
    }
    connections_.clear();
}

Result<sqlite3*, Error> SqliteConnectionPool::connection() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto id = std::this_thread::get_id();
    auto it = connections_.find(id);
    if (it != connections_.end()) {
        return it->second;
    }

    std::error_code ec;
    if (db_path_.has_parent_path()) {
        fs::create_directories(db_path_.parent_path(), ec);
    }

    sqlite3* db = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
    if (sqlite3_open_v2(db_path_.string().c_str(), &db, flags, nullptr) != SQLITE_OK) {
        Error error = sqlite_error(ErrorCode::IndexOpenFailed, db, "cannot open " + db_path_.string());
        sqlite3_close(db);
        return error;
    }

    sqlite3_busy_timeout(db, busy_timeout_ms_);

    char* err = nullptr;
    if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("WAL mode unavailable for {}: {}", db_path_.string(), err ? err : "unknown");
        sqlite3_free(err);
    }

    connections_.emplace(id, db);
    spdlog::debug("Opened index connection {} for {}", connections_.size(), db_path_.string());
    return db;
}

Result<void, Error> SqliteConnectionPool::exec(const std::string& sql) {
    auto db = connection();
    if (db.is_err()) {
        return db.error();
    }

    char* err = nullptr;
    if (sqlite3_exec(db.value(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err != nullptr ? err : "sqlite error";
        sqlite3_free(err);
        return Error{ErrorCode::IndexQueryFailed, message};
    }
    return Result<void, Error>::ok();
}

bool SqliteConnectionPool::release_current_thread() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = connections_.find(std::this_thread::get_id());
    if (it == connections_.end()) {
        return false;
    }

    sqlite3_close_v2(it->second);
    connections_.erase(it);
    return true;
}

size_t SqliteConnectionPool::connection_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

// Records

Json TraceRecord::to_json() const {
    return Json{
        {"trace_id", trace_id},
        {"conversation_id", conversation_id},
        {"session_id", session_id},
        {"start_time", start_time},
        {"end_time", optional_json(end_time)},
        {"duration_ms", optional_json(duration_ms)},
        {"status", status},
        {"file_path", file_path},
        {"created_at", created_at},
        {"model", optional_json(model)},
        {"total_tokens", total_tokens},
        {"tool_calls_count", tool_calls_count}
    };
}

Json MetricsRecord::to_json() const {
    return Json{
        {"id", id},
        {"conversation_id", conversation_id},
        {"session_id", session_id},
        {"timestamp", timestamp},
        {"total_tokens", total_tokens},
        {"total_duration_ms", total_duration_ms},
        {"tool_calls_count", tool_calls_count},
        {"estimated_cost_usd", estimated_cost_usd},
        {"model", optional_json(model)},
        {"file_path", file_path},
        {"created_at", created_at}
    };
}

// TraceIndex

TraceIndex::TraceIndex(const fs::path& db_path, ClockFn clock)
    : pool_(db_path)
    , clock_(std::move(clock))
{
}

Result<std::unique_ptr<TraceIndex>, Error> TraceIndex::open(const fs::path& db_path, ClockFn clock) {
    std::unique_ptr<TraceIndex> index(new TraceIndex(db_path, std::move(clock)));
    auto schema = index->init_schema();
    if (schema.is_err()) {
        return Error{ErrorCode::IndexOpenFailed, schema.error().message, db_path.string()};
    }
    return std::move(index);
}

Result<void, Error> TraceIndex::init_schema() {
    return pool_.exec(R"(
CREATE TABLE IF NOT EXISTS traces (
    trace_id TEXT PRIMARY KEY,
    conversation_id TEXT NOT NULL,
    session_id TEXT NOT NULL,
    start_time REAL NOT NULL,
    end_time REAL,
    duration_ms REAL,
    status TEXT,
    file_path TEXT,
    created_at REAL NOT NULL,
    model TEXT,
    total_tokens INTEGER,
    tool_calls_count INTEGER
);
CREATE INDEX IF NOT EXISTS idx_conversation ON traces(conversation_id);
CREATE INDEX IF NOT EXISTS idx_session ON traces(session_id);
CREATE INDEX IF NOT EXISTS idx_start_time ON traces(start_time);
CREATE INDEX IF NOT EXISTS idx_created_at ON traces(created_at);
)");
}

Result<void, Error> TraceIndex::upsert(TraceRecord record) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    record.created_at = clock_();

    auto changed = execute(db.value(),
        std::string("INSERT OR REPLACE INTO traces (") + kTraceColumns +
        ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {
            record.trace_id,
            record.conversation_id,
            record.session_id,
            record.start_time,
            optional_binding(record.end_time),
            optional_binding(record.duration_ms),
            record.status,
            record.file_path,
            record.created_at,
            optional_binding(record.model),
            record.total_tokens,
            static_cast<int64_t>(record.tool_calls_count)
        });
    if (changed.is_err()) {
        return changed.error();
    }
    return Result<void, Error>::ok();
}

Result<std::optional<TraceRecord>, Error> TraceIndex::find(const TraceId& trace_id) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    auto rows = select_rows<TraceRecord>(db.value(),
        std::string("SELECT ") + kTraceColumns + " FROM traces WHERE trace_id = ?",
        {trace_id}, read_trace_row);
    if (rows.is_err()) {
        return rows.error();
    }
    if (rows.value().empty()) {
        return std::optional<TraceRecord>{};
    }
    return std::optional<TraceRecord>{std::move(rows.value().front())};
}

Result<std::vector<TraceRecord>, Error> TraceIndex::query(const IndexQuery& filter) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    std::vector<Binding> params;
    std::string sql = std::string("SELECT ") + kTraceColumns + " FROM traces" +
                      build_where(filter, "start_time", params) +
                      " ORDER BY start_time DESC";
    if (filter.limit) {
        sql += " LIMIT ?";
        params.emplace_back(static_cast<int64_t>(*filter.limit));
    }

    return select_rows<TraceRecord>(db.value(), sql, params, read_trace_row);
}

Result<std::vector<TraceRecord>, Error> TraceIndex::by_conversation(const ConversationId& conversation_id) {
    return query(IndexQuery{.conversation_id = conversation_id});
}

Result<std::vector<TraceRecord>, Error> TraceIndex::by_session(const SessionId& session_id) {
    return query(IndexQuery{.session_id = session_id});
}

Result<std::vector<TraceRecord>, Error> TraceIndex::by_time_range(double start_time, double end_time) {
    return query(IndexQuery{.start_time = start_time, .end_time = end_time});
}

Result<std::vector<TraceRecord>, Error> TraceIndex::recent(size_t limit) {
    return query(IndexQuery{.limit = limit});
}

Result<std::vector<TraceRecord>, Error> TraceIndex::created_before(double cutoff) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    return select_rows<TraceRecord>(db.value(),
        std::string("SELECT ") + kTraceColumns + " FROM traces WHERE created_at < ?",
        {cutoff}, read_trace_row);
}

Result<size_t, Error> TraceIndex::remove_created_before(double cutoff) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }
    return execute(db.value(), "DELETE FROM traces WHERE created_at < ?", {cutoff});
}

Result<std::set<std::string>, Error> TraceIndex::file_paths() {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    auto rows = select_rows<std::string>(db.value(),
        "SELECT file_path FROM traces WHERE file_path IS NOT NULL", {},
        [](sqlite3_stmt* stmt) { return column_text(stmt, 0); });
    if (rows.is_err()) {
        return rows.error();
    }
    return std::set<std::string>(rows.value().begin(), rows.value().end());
}

Result<size_t, Error> TraceIndex::count() {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    auto rows = select_rows<int64_t>(db.value(), "SELECT COUNT(*) FROM traces", {},
        [](sqlite3_stmt* stmt) { return sqlite3_column_int64(stmt, 0); });
    if (rows.is_err()) {
        return rows.error();
    }
    return static_cast<size_t>(rows.value().empty() ? 0 : rows.value().front());
}

// MetricsIndex

MetricsIndex::MetricsIndex(const fs::path& db_path, ClockFn clock)
    : pool_(db_path)
    , clock_(std::move(clock))
{
}

Result<std::unique_ptr<MetricsIndex>, Error> MetricsIndex::open(const fs::path& db_path, ClockFn clock) {
    std::unique_ptr<MetricsIndex> index(new MetricsIndex(db_path, std::move(clock)));
    auto schema = index->init_schema();
    if (schema.is_err()) {
        return Error{ErrorCode::IndexOpenFailed, schema.error().message, db_path.string()};
    }
    return std::move(index);
}

Result<void, Error> MetricsIndex::init_schema() {
    return pool_.exec(R"(
CREATE TABLE IF NOT EXISTS metrics (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    conversation_id TEXT NOT NULL,
    session_id TEXT NOT NULL,
    timestamp REAL NOT NULL,
    total_tokens INTEGER,
    total_duration_ms REAL,
    tool_calls_count INTEGER,
    estimated_cost_usd REAL,
    model TEXT,
    file_path TEXT,
    created_at REAL NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_metrics_conversation ON metrics(conversation_id);
CREATE INDEX IF NOT EXISTS idx_metrics_session ON metrics(session_id);
CREATE INDEX IF NOT EXISTS idx_metrics_timestamp ON metrics(timestamp);
CREATE INDEX IF NOT EXISTS idx_metrics_created_at ON metrics(created_at);
)");
}

Result<int64_t, Error> MetricsIndex::insert(MetricsRecord record) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    record.created_at = clock_();

    auto changed = execute(db.value(),
        "INSERT INTO metrics (conversation_id, session_id, timestamp, total_tokens, "
        "total_duration_ms, tool_calls_count, estimated_cost_usd, model, file_path, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {
            record.conversation_id,
            record.session_id,
            record.timestamp,
            record.total_tokens,
            record.total_duration_ms,
            static_cast<int64_t>(record.tool_calls_count),
            record.estimated_cost_usd,
            optional_binding(record.model),
            record.file_path,
            record.created_at
        });
    if (changed.is_err()) {
        return changed.error();
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db.value()));
}

Result<std::vector<MetricsRecord>, Error> MetricsIndex::query(const IndexQuery& filter) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    std::vector<Binding> params;
    std::string sql = std::string("SELECT ") + kMetricsColumns + " FROM metrics" +
                      build_where(filter, "timestamp", params) +
                      " ORDER BY timestamp DESC, id DESC";
    if (filter.limit) {
        sql += " LIMIT ?";
        params.emplace_back(static_cast<int64_t>(*filter.limit));
    }

    return select_rows<MetricsRecord>(db.value(), sql, params, read_metrics_row);
}

Result<std::vector<MetricsRecord>, Error> MetricsIndex::by_conversation(const ConversationId& conversation_id) {
    return query(IndexQuery{.conversation_id = conversation_id});
}

Result<size_t, Error> MetricsIndex::remove_created_before(double cutoff) {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }
    return execute(db.value(), "DELETE FROM metrics WHERE created_at < ?", {cutoff});
}

Result<std::set<std::string>, Error> MetricsIndex::file_paths() {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    auto rows = select_rows<std::string>(db.value(),
        "SELECT DISTINCT file_path FROM metrics WHERE file_path IS NOT NULL", {},
        [](sqlite3_stmt* stmt) { return column_text(stmt, 0); });
    if (rows.is_err()) {
        return rows.error();
    }
    return std::set<std::string>(rows.value().begin(), rows.value().end());
}

Result<size_t, Error> MetricsIndex::count() {
    auto db = pool_.connection();
    if (db.is_err()) {
        return db.error();
    }

    auto rows = select_rows<int64_t>(db.value(), "SELECT COUNT(*) FROM metrics", {},
        [](sqlite3_stmt* stmt) { return sqlite3_column_int64(stmt, 0); });
    if (rows.is_err()) {
        return rows.error();
    }
    return static_cast<size_t>(rows.value().empty() ? 0 : rows.value().front());
}

}  // namespace toolpipe::monitoring
