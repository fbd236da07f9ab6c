#include "toolpipe/monitoring/trace_render.hpp"

#include <deque>
#include <iomanip>
#include <sstream>

namespace toolpipe::monitoring {

namespace {

std::string node_id(std::string id) {
    for (auto& c : id) {
        if (c == '-' || c == ':') {
            c = '_';
        }
    }
    return id;
}

std::string node_label(const Json& span) {
    std::string type = span.value("span_type", "custom");
    std::string name = span.value("name", "");
    std::string status = span.value("status", "unknown");

    std::ostringstream label;
    if (type != "agent_invoke") {
        label << type << ": ";
    }
    label << name << "\\n";

    if (span.contains("duration_ms") && span["duration_ms"].is_number()) {
        label << std::fixed << std::setprecision(0) << span["duration_ms"].get<double>() << "ms";
    } else {
        label << "running";
    }
    label << " " << status_icon(status);
    return label.str();
}

std::string escape_label(const std::string& label) {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        if (c == '"') {
            out += "#quot;";
        } else {
            out += c;
        }
    }
    return out;
}

void flatten_into(const Json& span, int depth, Json& out) {
    Json entry = span;
    entry.erase("children");
    entry["depth"] = depth;
    entry["event_count"] = span.contains("events") ? span["events"].size() : 0;
    out.push_back(std::move(entry));

    if (span.contains("children")) {
        for (const auto& child : span["children"]) {
            flatten_into(child, depth + 1, out);
        }
    }
}

}  // namespace

const char* status_icon(const std::string& status) {
    if (status == "success") return "✓";
    if (status == "error") return "✗";
    return "○";
}

std::string render_mermaid(const Json& root_span) {
    std::ostringstream out;
    out << "graph TD\n";

    if (!root_span.is_object()) {
        return out.str();
    }

    std::deque<const Json*> queue{&root_span};
    while (!queue.empty()) {
        const Json& span = *queue.front();
        queue.pop_front();

        std::string id = node_id(span.value("span_id", ""));
        out << "    " << id << "[\"" << escape_label(node_label(span)) << "\"]\n";

        if (!span.contains("children")) {
            continue;
        }
        for (const auto& child : span["children"]) {
            out << "    " << id << " --> " << node_id(child.value("span_id", "")) << "\n";
            queue.push_back(&child);
        }
    }

    return out.str();
}

std::string render_mermaid(const Span& root) {
    return render_mermaid(root.to_json(true));
}

Json flatten_spans(const Json& root_span) {
    Json out = Json::array();
    if (root_span.is_object()) {
        flatten_into(root_span, 0, out);
    }
    return out;
}

}  // namespace toolpipe::monitoring
