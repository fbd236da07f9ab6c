#include "toolpipe/monitoring/span.hpp"

namespace toolpipe::monitoring {

namespace {

Json optional_number(const std::optional<double>& value) {
    return value ? Json(*value) : Json(nullptr);
}

std::optional<double> read_optional_number(const Json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

}  // namespace

Span::Span(const Span& other)
    : trace_id(other.trace_id)
    , span_id(other.span_id)
    , parent_span_id(other.parent_span_id)
    , name(other.name)
    , span_type(other.span_type)
    , start_time(other.start_time)
    , end_time(other.end_time)
    , duration_ms(other.duration_ms)
    , status(other.status)
    , events(other.events)
    , attributes(other.attributes)
{
    children.reserve(other.children.size());
    for (const auto& child : other.children) {
        children.push_back(std::make_unique<Span>(*child));
    }
}

Span& Span::operator=(const Span& other) {
    if (this != &other) {
        Span copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void Span::end(SpanStatus final_status, double now) {
    end_time = now;
    status = final_status;
    duration_ms = (now - start_time) * 1000.0;
}

void Span::add_event(std::string event_name, Json event_attributes, double now) {
    events.push_back(SpanEvent{
        .timestamp = now,
        .name = std::move(event_name),
        .attributes = event_attributes.is_null() ? Json::object() : std::move(event_attributes)
    });
}

Span* Span::add_child(std::unique_ptr<Span> child) {
    children.push_back(std::move(child));
    return children.back().get();
}

Span* Span::find_span_by_id(const SpanId& id) {
    if (span_id == id) {
        return this;
    }
    for (auto& child : children) {
        if (Span* found = child->find_span_by_id(id)) {
            return found;
        }
    }
    return nullptr;
}

const Span* Span::find_span_by_id(const SpanId& id) const {
    return const_cast<Span*>(this)->find_span_by_id(id);
}

std::vector<const Span*> Span::all_spans() const {
    std::vector<const Span*> result{this};
    for (const auto& child : children) {
        auto sub = child->all_spans();
        result.insert(result.end(), sub.begin(), sub.end());
    }
    return result;
}

Json Span::to_json(bool recursive) const {
    Json j{
        {"trace_id", trace_id},
        {"span_id", span_id},
        {"parent_span_id", parent_span_id ? Json(*parent_span_id) : Json(nullptr)},
        {"name", name},
        {"span_type", std::string(span_type_to_string(span_type))},
        {"start_time", start_time},
        {"end_time", optional_number(end_time)},
        {"duration_ms", optional_number(duration_ms)},
        {"status", std::string(span_status_to_string(status))},
        {"attributes", attributes}
    };

    j["events"] = Json::array();
    for (const auto& event : events) {
        j["events"].push_back(event.to_json());
    }

    if (recursive) {
        j["children"] = Json::array();
        for (const auto& child : children) {
            j["children"].push_back(child->to_json(true));
        }
    }

    return j;
}

Span Span::from_json(const Json& j) {
    Span span;
    span.trace_id = j.value("trace_id", "");
    span.span_id = j.value("span_id", "");
    if (j.contains("parent_span_id") && j["parent_span_id"].is_string()) {
        span.parent_span_id = j["parent_span_id"].get<std::string>();
    }
    span.name = j.value("name", "");
    span.span_type = span_type_from_string(j.value("span_type", "custom"));
    span.start_time = j.value("start_time", 0.0);
    span.end_time = read_optional_number(j, "end_time");
    span.duration_ms = read_optional_number(j, "duration_ms");
    span.status = span_status_from_string(j.value("status", "unknown"));
    span.attributes = j.value("attributes", Json::object());

    if (j.contains("events")) {
        for (const auto& event : j["events"]) {
            span.events.push_back(SpanEvent::from_json(event));
        }
    }

    if (j.contains("children")) {
        for (const auto& child : j["children"]) {
            span.children.push_back(std::make_unique<Span>(Span::from_json(child)));
        }
    }

    return span;
}

Json Trace::to_json() const {
    return Json{
        {"trace_id", trace_id},
        {"conversation_id", conversation_id},
        {"session_id", session_id},
        {"start_time", start_time},
        {"end_time", optional_number(end_time)},
        {"total_duration_ms", optional_number(total_duration_ms)},
        {"root_span", root_span.to_json(true)},
        {"metrics", metrics},
        {"attributes", attributes}
    };
}

Trace Trace::from_json(const Json& j) {
    Trace trace;
    trace.trace_id = j.value("trace_id", "");
    trace.conversation_id = j.value("conversation_id", "");
    trace.session_id = j.value("session_id", "default");
    trace.start_time = j.value("start_time", 0.0);
    trace.end_time = read_optional_number(j, "end_time");
    trace.total_duration_ms = read_optional_number(j, "total_duration_ms");
    if (j.contains("root_span") && j["root_span"].is_object()) {
        trace.root_span = Span::from_json(j["root_span"]);
    }
    trace.metrics = j.value("metrics", Json::object());
    trace.attributes = j.value("attributes", Json::object());
    return trace;
}

}  // namespace toolpipe::monitoring
