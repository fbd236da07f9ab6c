#include "toolpipe/core/config.hpp"
#include "toolpipe/core/logging.hpp"
#include "toolpipe/monitoring/monitoring_service.hpp"
#include "toolpipe/monitoring/trace_store.hpp"
#include "toolpipe/pipeline/artifact_store.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace toolpipe::core;
using namespace toolpipe::monitoring;
using toolpipe::pipeline::ArtifactStore;

namespace {

struct Options {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;
    fs::path config_path = Config::default_path();
};

void print_usage() {
    std::cerr <<
        "Usage: toolpipe-monitor [--config PATH] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  conversations [--session ID] [--limit N]   List recorded conversations\n"
        "  trace <conversation>                       Print the latest trace\n"
        "  visualize <conversation> [--format F]      Render as mermaid or json\n"
        "  performance <conversation>                 Time breakdown of a turn\n"
        "  metrics [conversation] [--session ID]      Metrics of one conversation or a summary\n"
        "          [--start T] [--end T]\n"
        "  spans <conversation>                       Flattened span list\n"
        "  recent [--hours N]                         Traces from the last N hours\n"
        "  artifacts [--tool NAME] [--limit N]        Stored artifacts, newest first\n"
        "  cleanup [--trace-days N] [--metrics-days N] [--artifact-hours N]\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        }
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                options.config_path = value;
            } else {
                options.flags[arg.substr(2)] = value;
            }
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    if (options.command.empty()) {
        return std::nullopt;
    }
    return options;
}

std::optional<std::string> flag(const Options& options, const std::string& name) {
    auto it = options.flags.find(name);
    if (it == options.flags.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::optional<double>, Error> number_flag(const Options& options, const std::string& name) {
    auto value = flag(options, name);
    if (!value) {
        return std::optional<double>{};
    }
    char* end = nullptr;
    double parsed = std::strtod(value->c_str(), &end);
    if (end == value->c_str() || *end != '\0') {
        return Error{ErrorCode::InvalidArgument, "--" + name + " expects a number", *value};
    }
    return std::optional<double>{parsed};
}

Result<std::string, Error> conversation_arg(const Options& options) {
    if (options.positional.empty()) {
        return Error{ErrorCode::InvalidArgument, options.command + " needs a conversation id"};
    }
    return options.positional.front();
}

int print_json(const Json& value) {
    std::cout << value.dump(2) << std::endl;
    return 0;
}

int print_error(const Error& error) {
    std::cerr << "Error: " << error.full_message() << std::endl;
    return 1;
}

int not_found(const std::string& conversation_id) {
    std::cerr << "No trace found for conversation " << conversation_id << std::endl;
    return 2;
}

// Shared shape of the per-conversation lookups
int print_lookup(const Result<std::optional<Json>, Error>& result, const std::string& conversation_id) {
    if (result.is_err()) {
        return print_error(result.error());
    }
    if (!result.value()) {
        return not_found(conversation_id);
    }
    return print_json(*result.value());
}

int run(const Options& options, MonitoringService& service, TraceStore& traces, MetricsStore& metrics,
        ArtifactStore& artifacts) {
    const std::string& command = options.command;

    if (command == "conversations") {
        auto limit = number_flag(options, "limit");
        if (limit.is_err()) return print_error(limit.error());
        auto conversations = service.list_conversations(
            flag(options, "session"),
            static_cast<size_t>(limit.value().value_or(100)));
        if (conversations.is_err()) return print_error(conversations.error());

        Json out = Json::array();
        for (const auto& summary : conversations.value()) {
            out.push_back(summary.to_json());
        }
        return print_json(out);
    }

    if (command == "trace" || command == "visualize" || command == "spans") {
        auto conversation = conversation_arg(options);
        if (conversation.is_err()) return print_error(conversation.error());
        const std::string& id = conversation.value();

        if (command == "trace") {
            return print_lookup(service.load_trace(id), id);
        }
        if (command == "spans") {
            return print_lookup(service.get_spans(id), id);
        }

        std::string format = flag(options, "format").value_or("mermaid");
        auto rendered = service.visualize_trace(id, format);
        if (rendered.is_ok() && rendered.value() && format == "mermaid") {
            std::cout << (*rendered.value())["mermaid"].get<std::string>() << std::endl;
            return 0;
        }
        return print_lookup(rendered, id);
    }

    if (command == "performance") {
        auto conversation = conversation_arg(options);
        if (conversation.is_err()) return print_error(conversation.error());

        auto summary = service.get_performance_summary(conversation.value());
        if (summary.is_err()) return print_error(summary.error());
        if (!summary.value()) return not_found(conversation.value());
        return print_json(summary.value()->to_json());
    }

    if (command == "metrics") {
        auto start = number_flag(options, "start");
        if (start.is_err()) return print_error(start.error());
        auto end = number_flag(options, "end");
        if (end.is_err()) return print_error(end.error());

        std::optional<ConversationId> conversation;
        if (!options.positional.empty()) {
            conversation = options.positional.front();
        }
        auto result = service.get_metrics(conversation, flag(options, "session"),
                                          start.value(), end.value());
        if (result.is_err()) return print_error(result.error());
        return print_json(result.value());
    }

    if (command == "recent") {
        auto hours = number_flag(options, "hours");
        if (hours.is_err()) return print_error(hours.error());
        auto result = service.recent_activity(static_cast<int>(hours.value().value_or(24)));
        if (result.is_err()) return print_error(result.error());
        return print_json(result.value());
    }

    if (command == "artifacts") {
        auto limit = number_flag(options, "limit");
        if (limit.is_err()) return print_error(limit.error());

        Json listed = Json::array();
        for (const auto& metadata : artifacts.list(flag(options, "tool"),
                                                   static_cast<size_t>(limit.value().value_or(100)))) {
            listed.push_back(metadata.to_json());
        }
        return print_json(Json{
            {"stats", artifacts.stats().to_json()},
            {"artifacts", std::move(listed)}
        });
    }

    if (command == "cleanup") {
        auto trace_days = number_flag(options, "trace-days");
        if (trace_days.is_err()) return print_error(trace_days.error());
        auto metrics_days = number_flag(options, "metrics-days");
        if (metrics_days.is_err()) return print_error(metrics_days.error());
        auto artifact_hours = number_flag(options, "artifact-hours");
        if (artifact_hours.is_err()) return print_error(artifact_hours.error());

        std::optional<int> trace_ttl;
        if (trace_days.value()) trace_ttl = static_cast<int>(*trace_days.value());
        std::optional<int> metrics_ttl;
        if (metrics_days.value()) metrics_ttl = static_cast<int>(*metrics_days.value());
        std::optional<int> artifact_ttl;
        if (artifact_hours.value()) artifact_ttl = static_cast<int>(*artifact_hours.value());

        auto removed_traces = traces.cleanup_old_traces(trace_ttl);
        if (removed_traces.is_err()) return print_error(removed_traces.error());
        auto removed_metrics = metrics.cleanup_old_metrics(metrics_ttl);
        if (removed_metrics.is_err()) return print_error(removed_metrics.error());

        return print_json(Json{
            {"traces_removed", removed_traces.value()},
            {"metrics_removed", removed_metrics.value()},
            {"artifacts_removed", artifacts.cleanup(artifact_ttl)}
        });
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 64;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return 64;
    }

    Config config = Config::load_or_default(options->config_path);
    setup_logging(config.observability);

    if (auto valid = config.validate(); valid.is_err()) {
        return print_error(valid.error());
    }

    auto traces = TraceStore::open(config.monitoring.trace_dir, config.monitoring.trace_ttl_days);
    if (traces.is_err()) {
        spdlog::error("Cannot open trace store at {}", config.monitoring.trace_dir.string());
        return print_error(traces.error());
    }

    auto metrics = MetricsStore::open(config.monitoring.metrics_dir, config.monitoring.metrics_ttl_days);
    if (metrics.is_err()) {
        spdlog::error("Cannot open metrics store at {}", config.monitoring.metrics_dir.string());
        return print_error(metrics.error());
    }

    ArtifactStore artifacts(config.storage.artifacts_dir, config.storage.max_age_hours,
                            config.storage.max_size_mb);

    MonitoringService service(*traces.value(), *metrics.value());
    return run(*options, service, *traces.value(), *metrics.value(), artifacts);
}
