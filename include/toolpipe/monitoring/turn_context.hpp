#pragma once

#include "toolpipe/core/types.hpp"
#include "execution_tracer.hpp"
#include "metrics_collector.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace toolpipe::monitoring {

using namespace toolpipe::core;

// Observability state for one conversation turn, passed down to the tool pipeline
struct TurnContext {
    ConversationId conversation_id;
    SessionId session_id;
    ExecutionTracer tracer;
    MetricsCollector collector;

    TurnContext(ConversationId conversation,
                SessionId session,
                bool enabled = true,
                PricingTable pricing = PricingTable(),
                ClockFn clock = unix_now);

    TurnContext(const TurnContext&) = delete;
    TurnContext& operator=(const TurnContext&) = delete;
};

// Live turns keyed by (conversation, session). Thread-safe.
class TurnRegistry {
public:
    explicit TurnRegistry(PricingTable pricing = PricingTable(), ClockFn clock = unix_now);

    // Replaces an unfinished turn with the same key
    std::shared_ptr<TurnContext> begin(const ConversationId& conversation_id,
                                       const SessionId& session_id = "default",
                                       bool enabled = true);

    std::shared_ptr<TurnContext> find(const ConversationId& conversation_id,
                                      const SessionId& session_id = "default") const;

    // Removes and returns the turn; nullptr if it was never begun
    std::shared_ptr<TurnContext> end(const ConversationId& conversation_id,
                                     const SessionId& session_id = "default");

    size_t size() const;

private:
    using Key = std::pair<ConversationId, SessionId>;

    PricingTable pricing_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<TurnContext>> turns_;
};

}  // namespace toolpipe::monitoring
