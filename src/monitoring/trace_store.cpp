#include "toolpipe/monitoring/trace_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <map>
#include <set>

namespace toolpipe::monitoring {

namespace {

constexpr double kSecondsPerDay = 86400.0;

std::optional<double> file_mtime(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    auto sys = std::chrono::file_clock::to_sys(ftime);
    return to_unix_seconds(std::chrono::time_point_cast<Clock::duration>(sys));
}

std::set<std::string> file_names(const std::set<std::string>& paths) {
    std::set<std::string> names;
    for (const auto& p : paths) {
        names.insert(fs::path(p).filename().string());
    }
    return names;
}

// Files in `dir` named <prefix>*<extension> that no index row references and
// that were last written before the cutoff
std::vector<fs::path> stray_files(const fs::path& dir,
                                  const std::string& prefix,
                                  const std::string& extension,
                                  const std::set<std::string>& referenced_names,
                                  double cutoff) {
    std::vector<fs::path> stray;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }

        std::string name = entry.path().filename().string();
        if (name.rfind(prefix, 0) != 0 || entry.path().extension() != extension) {
            continue;
        }
        if (referenced_names.count(name) > 0) {
            continue;
        }

        auto mtime = file_mtime(entry.path());
        if (mtime && *mtime < cutoff) {
            stray.push_back(entry.path());
        }
    }
    if (ec) {
        spdlog::warn("Cannot scan {}: {}", dir.string(), ec.message());
    }
    return stray;
}

Result<void, Error> write_file(const fs::path& path, const std::string& content, bool append) {
    std::ofstream file(path, append ? std::ios::app : std::ios::trunc);
    if (!file) {
        return Error{ErrorCode::FileWriteFailed, "Cannot open " + path.string()};
    }
    file << content;
    file.close();
    if (!file) {
        return Error{ErrorCode::FileWriteFailed, "Write failed for " + path.string()};
    }
    return Result<void, Error>::ok();
}

}  // namespace

std::string sanitize_file_component(const std::string& id) {
    std::string out = id;
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            c = '_';
        }
    }
    return out.empty() ? "unknown" : out;
}

Json ConversationSummary::to_json() const {
    return Json{
        {"conversation_id", conversation_id},
        {"session_id", session_id},
        {"start_time", start_time},
        {"total_duration_ms", total_duration_ms},
        {"trace_count", trace_count},
        {"total_tokens", total_tokens},
        {"tool_calls", tool_calls}
    };
}

Json MetricsSummary::to_json() const {
    return Json{
        {"total_conversations", total_conversations},
        {"total_tokens", total_tokens},
        {"total_duration_ms", total_duration_ms},
        {"total_tool_calls", total_tool_calls},
        {"total_cost_usd", total_cost_usd},
        {"avg_tokens_per_conv", avg_tokens_per_conv},
        {"avg_duration_ms_per_conv", avg_duration_ms_per_conv}
    };
}

// TraceStore

TraceStore::TraceStore(fs::path storage_dir, int ttl_days, ClockFn clock,
                       std::unique_ptr<TraceIndex> index)
    : storage_dir_(std::move(storage_dir))
    , ttl_days_(ttl_days)
    , clock_(std::move(clock))
    , index_(std::move(index))
{
}

Result<std::unique_ptr<TraceStore>, Error> TraceStore::open(const fs::path& storage_dir,
                                                            int ttl_days,
                                                            ClockFn clock) {
    std::error_code ec;
    fs::create_directories(storage_dir, ec);
    if (ec) {
        return Error{ErrorCode::DirectoryNotFound,
                     "Cannot create trace directory: " + ec.message(),
                     storage_dir.string()};
    }

    auto index = TraceIndex::open(storage_dir / "trace_index.db", clock);
    if (index.is_err()) {
        return index.error();
    }

    std::unique_ptr<TraceStore> store(
        new TraceStore(storage_dir, ttl_days, std::move(clock), std::move(index).value()));
    spdlog::debug("Trace store opened at {}", storage_dir.string());
    return std::move(store);
}

fs::path TraceStore::trace_file_path(const Trace& trace) {
    // Re-saving a trace overwrites its existing file
    auto existing = index_->find(trace.trace_id);
    if (existing.is_ok() && existing.value() && !existing.value()->file_path.empty()) {
        return existing.value()->file_path;
    }

    std::string stem = "trace_" + sanitize_file_component(trace.conversation_id) + "_" +
                       format_time(trace.start_time, "%Y%m%d_%H%M%S");
    fs::path path = storage_dir_ / (stem + ".json");

    std::error_code ec;
    if (fs::exists(path, ec)) {
        path = storage_dir_ / (stem + "_" + sanitize_file_component(trace.trace_id) + ".json");
    }
    return path;
}

Result<fs::path, Error> TraceStore::save_trace(const Trace& trace, const AgentMetrics* metrics) {
    Json doc = trace.to_json();
    if (metrics) {
        doc["metrics"] = metrics->to_json();
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    fs::path path = trace_file_path(trace);
    auto written = write_file(path, doc.dump(2, ' ', false, Json::error_handler_t::replace), false);
    if (written.is_err()) {
        return Error{ErrorCode::TraceSaveFailed, written.error().message, trace.trace_id};
    }

    TraceRecord record;
    record.trace_id = trace.trace_id;
    record.conversation_id = trace.conversation_id;
    record.session_id = trace.session_id;
    record.start_time = trace.start_time;
    record.end_time = trace.end_time;
    record.duration_ms = trace.total_duration_ms;
    record.status = std::string(span_status_to_string(trace.root_span.status));
    record.file_path = path.string();
    if (metrics) {
        record.model = metrics->primary_model;
        record.total_tokens = metrics->total_tokens;
        record.tool_calls_count = metrics->tool_calls_count;
    }

    auto indexed = index_->upsert(std::move(record));
    if (indexed.is_err()) {
        return Error{ErrorCode::TraceSaveFailed, indexed.error().message, trace.trace_id};
    }

    spdlog::info("Saved trace {} for conversation {} to {}",
                 trace.trace_id, trace.conversation_id, path.string());
    return path;
}

Result<std::optional<Json>, Error> TraceStore::load_trace(const ConversationId& conversation_id) {
    auto records = index_->by_conversation(conversation_id);
    if (records.is_err()) {
        return records.error();
    }
    if (records.value().empty()) {
        return std::optional<Json>{};
    }

    fs::path path = records.value().front().file_path;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::warn("Trace file missing for {}: {}", conversation_id, path.string());
        return std::optional<Json>{};
    }

    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileReadFailed, "Cannot open " + path.string(), conversation_id};
    }

    Json doc = Json::parse(file, nullptr, false);
    if (doc.is_discarded()) {
        return Error{ErrorCode::FileReadFailed, "Invalid trace JSON in " + path.string(),
                     conversation_id};
    }
    return std::optional<Json>{std::move(doc)};
}

Result<std::vector<ConversationSummary>, Error> TraceStore::list_conversations(
    const std::optional<SessionId>& session_id,
    size_t limit) {
    auto records = session_id ? index_->by_session(*session_id) : index_->recent(limit);
    if (records.is_err()) {
        return records.error();
    }

    std::vector<ConversationSummary> conversations;
    std::map<ConversationId, size_t> positions;

    for (const auto& record : records.value()) {
        auto [it, inserted] = positions.try_emplace(record.conversation_id, conversations.size());
        if (inserted) {
            ConversationSummary summary;
            summary.conversation_id = record.conversation_id;
            summary.session_id = record.session_id;
            summary.start_time = record.start_time;
            conversations.push_back(std::move(summary));
        }

        ConversationSummary& conv = conversations[it->second];
        conv.total_duration_ms = std::max(conv.total_duration_ms, record.duration_ms.value_or(0.0));
        conv.trace_count += 1;
        conv.total_tokens += record.total_tokens;
        conv.tool_calls += record.tool_calls_count;
    }

    if (conversations.size() > limit) {
        conversations.resize(limit);
    }
    return conversations;
}

Result<std::vector<TraceRecord>, Error> TraceStore::query_time_range(double start_time,
                                                                     double end_time) {
    return index_->by_time_range(start_time, end_time);
}

Result<std::vector<TraceRecord>, Error> TraceStore::recent(size_t limit) {
    return index_->recent(limit);
}

Result<size_t, Error> TraceStore::cleanup_old_traces(std::optional<int> days) {
    int ttl = days.value_or(ttl_days_);
    double cutoff = clock_() - ttl * kSecondsPerDay;

    std::lock_guard<std::mutex> lock(write_mutex_);

    auto expired = index_->created_before(cutoff);
    if (expired.is_err()) {
        return expired.error();
    }

    for (const auto& record : expired.value()) {
        if (record.file_path.empty()) {
            continue;
        }
        std::error_code ec;
        fs::remove(record.file_path, ec);
        if (ec) {
            spdlog::warn("Cannot remove trace file {}: {}", record.file_path, ec.message());
        }
    }

    auto removed = index_->remove_created_before(cutoff);
    if (removed.is_err()) {
        return removed.error();
    }
    size_t count = removed.value();

    // Files left behind by earlier partial cleanups
    auto referenced = index_->file_paths();
    if (referenced.is_err()) {
        spdlog::warn("Skipping stray trace sweep: {}", referenced.error().message);
        return count;
    }

    for (const auto& path : stray_files(storage_dir_, "trace_", ".json",
                                        file_names(referenced.value()), cutoff)) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            ++count;
        }
    }

    if (count > 0) {
        spdlog::info("Removed {} traces older than {} days", count, ttl);
    }
    return count;
}

// MetricsStore

MetricsStore::MetricsStore(fs::path storage_dir, int ttl_days, ClockFn clock,
                           std::unique_ptr<MetricsIndex> index)
    : storage_dir_(std::move(storage_dir))
    , ttl_days_(ttl_days)
    , clock_(std::move(clock))
    , index_(std::move(index))
{
}

Result<std::unique_ptr<MetricsStore>, Error> MetricsStore::open(const fs::path& storage_dir,
                                                                int ttl_days,
                                                                ClockFn clock) {
    std::error_code ec;
    fs::create_directories(storage_dir, ec);
    if (ec) {
        return Error{ErrorCode::DirectoryNotFound,
                     "Cannot create metrics directory: " + ec.message(),
                     storage_dir.string()};
    }

    auto index = MetricsIndex::open(storage_dir / "metrics_index.db", clock);
    if (index.is_err()) {
        return index.error();
    }

    std::unique_ptr<MetricsStore> store(
        new MetricsStore(storage_dir, ttl_days, std::move(clock), std::move(index).value()));
    spdlog::debug("Metrics store opened at {}", storage_dir.string());
    return std::move(store);
}

Result<fs::path, Error> MetricsStore::save_metrics(const AgentMetrics& metrics) {
    std::string filename = "metrics_" + sanitize_file_component(metrics.session_id) + "_" +
                           format_time(metrics.timestamp, "%Y%m%d") + ".jsonl";
    fs::path path = storage_dir_ / filename;

    std::string line = metrics.to_json().dump(-1, ' ', false, Json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(write_mutex_);

    auto written = write_file(path, line + "\n", true);
    if (written.is_err()) {
        return Error{ErrorCode::MetricsSaveFailed, written.error().message, metrics.conversation_id};
    }

    MetricsRecord record;
    record.conversation_id = metrics.conversation_id;
    record.session_id = metrics.session_id;
    record.timestamp = metrics.timestamp;
    record.total_tokens = metrics.total_tokens;
    record.total_duration_ms = metrics.total_duration_ms;
    record.tool_calls_count = metrics.tool_calls_count;
    record.estimated_cost_usd = metrics.estimated_cost_usd;
    record.model = metrics.primary_model;
    record.file_path = path.string();

    auto indexed = index_->insert(std::move(record));
    if (indexed.is_err()) {
        return Error{ErrorCode::MetricsSaveFailed, indexed.error().message, metrics.conversation_id};
    }

    spdlog::debug("Appended metrics for {} to {}", metrics.conversation_id, path.string());
    return path;
}

Result<std::vector<Json>, Error> MetricsStore::get_metrics(const ConversationId& conversation_id,
                                                           std::optional<double> start_time,
                                                           std::optional<double> end_time) {
    auto records = index_->query(IndexQuery{
        .conversation_id = conversation_id,
        .start_time = start_time,
        .end_time = end_time
    });
    if (records.is_err()) {
        return records.error();
    }

    // Several rows can share a file; read each file once
    std::vector<std::string> files;
    std::set<std::string> seen;
    for (const auto& record : records.value()) {
        if (seen.insert(record.file_path).second) {
            files.push_back(record.file_path);
        }
    }

    std::vector<Json> results;
    for (const auto& path : files) {
        std::ifstream file(path);
        if (!file) {
            spdlog::warn("Metrics file missing: {}", path);
            continue;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty()) {
                continue;
            }

            Json data = Json::parse(line, nullptr, false);
            if (data.is_discarded() || !data.is_object()) {
                spdlog::debug("Skipping malformed metrics line in {}", path);
                continue;
            }
            if (data.value("conversation_id", "") != conversation_id) {
                continue;
            }

            double timestamp = data.value("timestamp", 0.0);
            if ((start_time && timestamp < *start_time) || (end_time && timestamp > *end_time)) {
                continue;
            }
            results.push_back(std::move(data));
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const Json& a, const Json& b) {
        return a.value("timestamp", 0.0) > b.value("timestamp", 0.0);
    });
    return results;
}

Result<MetricsSummary, Error> MetricsStore::get_aggregated_metrics(
    const std::optional<SessionId>& session_id,
    std::optional<double> start_time,
    std::optional<double> end_time) {
    auto records = index_->query(IndexQuery{
        .session_id = session_id,
        .start_time = start_time,
        .end_time = end_time
    });
    if (records.is_err()) {
        return records.error();
    }

    MetricsSummary summary;
    std::set<ConversationId> conversations;
    for (const auto& record : records.value()) {
        conversations.insert(record.conversation_id);
        summary.total_tokens += record.total_tokens;
        summary.total_duration_ms += record.total_duration_ms;
        summary.total_tool_calls += record.tool_calls_count;
        summary.total_cost_usd += record.estimated_cost_usd;
    }

    summary.total_conversations = conversations.size();
    if (summary.total_conversations > 0) {
        double n = static_cast<double>(summary.total_conversations);
        summary.avg_tokens_per_conv = static_cast<double>(summary.total_tokens) / n;
        summary.avg_duration_ms_per_conv = summary.total_duration_ms / n;
    }
    return summary;
}

Result<size_t, Error> MetricsStore::cleanup_old_metrics(std::optional<int> days) {
    int ttl = days.value_or(ttl_days_);
    double cutoff = clock_() - ttl * kSecondsPerDay;

    std::lock_guard<std::mutex> lock(write_mutex_);

    auto removed = index_->remove_created_before(cutoff);
    if (removed.is_err()) {
        return removed.error();
    }

    auto referenced = index_->file_paths();
    if (referenced.is_err()) {
        spdlog::warn("Skipping metrics file sweep: {}", referenced.error().message);
        return removed.value();
    }

    for (const auto& path : stray_files(storage_dir_, "metrics_", ".jsonl",
                                        file_names(referenced.value()), cutoff)) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            spdlog::warn("Cannot remove metrics file {}: {}", path.string(), ec.message());
        }
    }

    if (removed.value() > 0) {
        spdlog::info("Removed {} metrics records older than {} days", removed.value(), ttl);
    }
    return removed.value();
}

}  // namespace toolpipe::monitoring
