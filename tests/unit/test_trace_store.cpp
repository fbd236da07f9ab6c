#include <catch2/catch_test_macros.hpp>
#include "toolpipe/core/uuid.hpp"
#include "toolpipe/monitoring/execution_tracer.hpp"
#include "toolpipe/monitoring/trace_store.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

using namespace toolpipe::monitoring;

namespace {

struct TempDir {
    fs::path path = fs::temp_directory_path() / ("toolpipe_traces_" + UUID::generate().to_hex().substr(0, 8));
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// Offsets from the real time so file mtimes and index timestamps agree
struct ShiftedClock {
    std::shared_ptr<double> offset = std::make_shared<double>(0.0);

    ClockFn fn() const {
        auto o = offset;
        return [o] { return unix_now() + *o; };
    }
};

Trace make_trace(const std::string& conversation, double start, const std::string& session = "default") {
    Trace trace;
    trace.trace_id = generate_trace_id() + "_" + UUID::generate().to_hex().substr(0, 4);
    trace.conversation_id = conversation;
    trace.session_id = session;
    trace.start_time = start;
    trace.end_time = start + 2.0;
    trace.total_duration_ms = 2000.0;
    trace.root_span.trace_id = trace.trace_id;
    trace.root_span.span_id = root_span_id(trace.trace_id);
    trace.root_span.name = "turn";
    trace.root_span.span_type = SpanType::AgentInvoke;
    trace.root_span.start_time = start;
    trace.root_span.end(SpanStatus::Success, start + 2.0);
    return trace;
}

AgentMetrics make_metrics(const std::string& conversation, double timestamp,
                          const std::string& session = "default") {
    AgentMetrics metrics;
    metrics.conversation_id = conversation;
    metrics.session_id = session;
    metrics.timestamp = timestamp;
    metrics.total_tokens = 1000;
    metrics.total_duration_ms = 500.0;
    metrics.tool_calls_count = 2;
    metrics.estimated_cost_usd = 0.25;
    metrics.primary_model = "gpt-4o";
    return metrics;
}

}  // namespace

TEST_CASE("File names are sanitized", "[trace_store]") {
    REQUIRE(sanitize_file_component("conv-1_ok") == "conv-1_ok");
    REQUIRE(sanitize_file_component("../../etc/passwd") == "______etc_passwd");
    REQUIRE(sanitize_file_component("") == "unknown");
}

TEST_CASE("Saved trace can be loaded back", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path);
    REQUIRE(store.is_ok());

    auto trace = make_trace("conv/1", unix_now());
    auto metrics = make_metrics("conv/1", trace.start_time);
    auto saved = store.value()->save_trace(trace, &metrics);
    REQUIRE(saved.is_ok());

    fs::path path = saved.value();
    REQUIRE(path.parent_path() == dir.path);
    REQUIRE(path.filename().string().rfind("trace_conv_1_", 0) == 0);
    REQUIRE(path.extension() == ".json");
    REQUIRE(fs::exists(dir.path / "trace_index.db"));

    auto loaded = store.value()->load_trace("conv/1");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().has_value());

    const Json& doc = *loaded.value();
    REQUIRE(doc["trace_id"] == trace.trace_id);
    REQUIRE(doc["metrics"]["total_tokens"] == 1000);
    REQUIRE(doc["root_span"]["status"] == "success");

    auto record = store.value()->index().find(trace.trace_id);
    REQUIRE(record.value().has_value());
    REQUIRE(record.value()->model == "gpt-4o");
    REQUIRE(record.value()->tool_calls_count == 2);
    REQUIRE(record.value()->status == "success");
}

TEST_CASE("Unknown conversation loads nothing", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();

    auto loaded = store->load_trace("missing");
    REQUIRE(loaded.is_ok());
    REQUIRE_FALSE(loaded.value().has_value());
}

TEST_CASE("Deleted trace file loads nothing", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();

    auto path = store->save_trace(make_trace("conv-1", unix_now())).value();
    fs::remove(path);

    auto loaded = store->load_trace("conv-1");
    REQUIRE(loaded.is_ok());
    REQUIRE_FALSE(loaded.value().has_value());
}

TEST_CASE("Corrupt trace file is an error", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();

    auto path = store->save_trace(make_trace("conv-1", unix_now())).value();
    std::ofstream(path, std::ios::trunc) << "{not json";

    auto loaded = store->load_trace("conv-1");
    REQUIRE(loaded.is_err());
    REQUIRE(loaded.error().code == ErrorCode::FileReadFailed);
}

TEST_CASE("Latest trace wins and names never collide", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();
    double now = unix_now();

    auto older = make_trace("conv-1", now - 10.0);
    auto newer = make_trace("conv-1", now);
    auto same_second = make_trace("conv-1", now);

    auto p1 = store->save_trace(older).value();
    auto p2 = store->save_trace(newer).value();
    auto p3 = store->save_trace(same_second).value();
    REQUIRE(p2 != p3);

    auto loaded = store->load_trace("conv-1").value();
    REQUIRE((*loaded)["start_time"] == now);

    // Saving the same trace again rewrites its file
    REQUIRE(store->save_trace(older).value() == p1);
    REQUIRE(store->index().count().value() == 3);
}

TEST_CASE("Conversations are grouped", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();
    double now = unix_now();

    auto m1 = make_metrics("a", now);
    store->save_trace(make_trace("a", now - 30, "s1"), &m1);
    store->save_trace(make_trace("a", now - 20, "s1"), &m1);
    store->save_trace(make_trace("b", now - 10, "s2"));

    auto all = store->list_conversations();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 2);
    REQUIRE(all.value()[0].conversation_id == "b");
    REQUIRE(all.value()[1].trace_count == 2);
    REQUIRE(all.value()[1].total_tokens == 2000);
    REQUIRE(all.value()[1].tool_calls == 4);

    auto s1 = store->list_conversations(std::string("s1"));
    REQUIRE(s1.value().size() == 1);
    REQUIRE(s1.value()[0].conversation_id == "a");

    REQUIRE(store->list_conversations(std::nullopt, 1).value().size() == 1);
}

TEST_CASE("Time range queries", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();
    double now = unix_now();

    store->save_trace(make_trace("old", now - 7200));
    store->save_trace(make_trace("new", now - 60));

    auto recent = store->query_time_range(now - 3600, now);
    REQUIRE(recent.value().size() == 1);
    REQUIRE(recent.value()[0].conversation_id == "new");
    REQUIRE(store->recent(10).value().size() == 2);
}

TEST_CASE("Trace cleanup removes expired rows and files", "[trace_store]") {
    TempDir dir;
    ShiftedClock clock;
    auto store = TraceStore::open(dir.path, 7, clock.fn()).value();

    auto old_path = store->save_trace(make_trace("old", unix_now())).value();

    *clock.offset = 8 * 86400.0;
    auto fresh_path = store->save_trace(make_trace("fresh", unix_now())).value();

    auto removed = store->cleanup_old_traces();
    REQUIRE(removed.is_ok());
    REQUIRE(removed.value() == 1);
    REQUIRE_FALSE(fs::exists(old_path));
    REQUIRE(fs::exists(fresh_path));
    REQUIRE(store->index().count().value() == 1);
}

TEST_CASE("Trace cleanup sweeps stray files", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();

    fs::path stray = dir.path / "trace_lost_20200101_000000.json";
    std::ofstream(stray) << "{}";
    auto old_time = std::chrono::file_clock::now() - std::chrono::hours(24 * 30);
    fs::last_write_time(stray, old_time);

    fs::path unrelated = dir.path / "notes.json";
    std::ofstream(unrelated) << "{}";
    fs::last_write_time(unrelated, old_time);

    auto kept = store->save_trace(make_trace("kept", unix_now())).value();

    auto removed = store->cleanup_old_traces();
    REQUIRE(removed.value() == 1);
    REQUIRE_FALSE(fs::exists(stray));
    REQUIRE(fs::exists(unrelated));
    REQUIRE(fs::exists(kept));
}

TEST_CASE("Metrics are appended per session and day", "[trace_store]") {
    TempDir dir;
    auto store = MetricsStore::open(dir.path).value();
    double now = unix_now();

    auto p1 = store->save_metrics(make_metrics("c1", now - 5, "sess"));
    auto p2 = store->save_metrics(make_metrics("c1", now, "sess"));
    REQUIRE(p1.is_ok());
    REQUIRE(p1.value() == p2.value());
    REQUIRE(p1.value().filename().string().rfind("metrics_sess_", 0) == 0);
    REQUIRE(p1.value().extension() == ".jsonl");

    store->save_metrics(make_metrics("c2", now, "sess"));

    auto c1 = store->get_metrics("c1");
    REQUIRE(c1.is_ok());
    REQUIRE(c1.value().size() == 2);
    REQUIRE(c1.value()[0]["timestamp"] == now);

    auto windowed = store->get_metrics("c1", now - 1, now + 1);
    REQUIRE(windowed.value().size() == 1);
}

TEST_CASE("Metrics aggregation", "[trace_store]") {
    TempDir dir;
    auto store = MetricsStore::open(dir.path).value();
    double now = unix_now();

    store->save_metrics(make_metrics("c1", now, "s1"));
    store->save_metrics(make_metrics("c1", now, "s1"));
    store->save_metrics(make_metrics("c2", now, "s2"));

    auto summary = store->get_aggregated_metrics();
    REQUIRE(summary.is_ok());
    REQUIRE(summary.value().total_conversations == 2);
    REQUIRE(summary.value().total_tokens == 3000);
    REQUIRE(summary.value().total_tool_calls == 6);
    REQUIRE(summary.value().avg_tokens_per_conv == 1500.0);

    auto s2 = store->get_aggregated_metrics(std::string("s2"));
    REQUIRE(s2.value().total_conversations == 1);
    REQUIRE(s2.value().total_tokens == 1000);

    auto empty = store->get_aggregated_metrics(std::string("none"));
    REQUIRE(empty.value().total_conversations == 0);
    REQUIRE(empty.value().avg_tokens_per_conv == 0.0);
}

TEST_CASE("Metrics cleanup", "[trace_store]") {
    TempDir dir;
    ShiftedClock clock;
    auto store = MetricsStore::open(dir.path, 30, clock.fn()).value();

    store->save_metrics(make_metrics("c1", unix_now()));
    *clock.offset = 31 * 86400.0;

    auto removed = store->cleanup_old_metrics();
    REQUIRE(removed.value() == 1);
    REQUIRE(store->index().count().value() == 0);
    REQUIRE(store->get_metrics("c1").value().empty());
}

TEST_CASE("Index connections are per thread", "[trace_store]") {
    TempDir dir;
    fs::create_directories(dir.path);
    SqliteConnectionPool pool(dir.path / "pool.db");

    REQUIRE(pool.exec("CREATE TABLE t (x INTEGER)").is_ok());
    bool inserted = false;
    std::thread worker([&pool, &inserted] {
        inserted = pool.exec("INSERT INTO t VALUES (1)").is_ok();
    });
    worker.join();

    REQUIRE(inserted);

    REQUIRE(pool.connection_count() == 2);
    REQUIRE(pool.exec("NOT VALID SQL").is_err());
}

TEST_CASE("Worker threads can hand back their connection", "[trace_store]") {
    TempDir dir;
    fs::create_directories(dir.path);
    SqliteConnectionPool pool(dir.path / "pool.db");
    REQUIRE(pool.exec("CREATE TABLE t (x INTEGER)").is_ok());

    std::vector<std::thread> workers;
    std::atomic<int> inserted{0};
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&pool, &inserted, i] {
            if (pool.exec("INSERT INTO t VALUES (" + std::to_string(i) + ")").is_ok()) {
                ++inserted;
            }
            pool.release_current_thread();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(inserted == 4);
    REQUIRE(pool.connection_count() == 1);

    REQUIRE(pool.release_current_thread());
    REQUIRE_FALSE(pool.release_current_thread());
    REQUIRE(pool.connection_count() == 0);

    // A released thread reconnects on its next use
    REQUIRE(pool.exec("INSERT INTO t VALUES (9)").is_ok());
    REQUIRE(pool.connection_count() == 1);
}

TEST_CASE("Store index connections are released per thread", "[trace_store]") {
    TempDir dir;
    auto store = TraceStore::open(dir.path).value();

    bool counted = false;
    bool released = false;
    std::thread reader([&store, &counted, &released] {
        counted = store->index().count().is_ok();
        released = store->index().release_current_thread();
    });
    reader.join();

    REQUIRE(counted);
    REQUIRE(released);
    REQUIRE(store->index().connection_count() == 1);
}
