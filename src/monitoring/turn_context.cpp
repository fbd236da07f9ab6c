#include "toolpipe/monitoring/turn_context.hpp"

#include <spdlog/spdlog.h>

namespace toolpipe::monitoring {

TurnContext::TurnContext(ConversationId conversation,
                         SessionId session,
                         bool enabled,
                         PricingTable pricing,
                         ClockFn clock)
    : conversation_id(std::move(conversation))
    , session_id(session.empty() ? "default" : std::move(session))
    , tracer(conversation_id, session_id, enabled, clock)
    , collector(conversation_id, session_id, enabled, std::move(pricing), clock)
{
}

TurnRegistry::TurnRegistry(PricingTable pricing, ClockFn clock)
    : pricing_(std::move(pricing))
    , clock_(std::move(clock))
{
}

std::shared_ptr<TurnContext> TurnRegistry::begin(const ConversationId& conversation_id,
                                                 const SessionId& session_id,
                                                 bool enabled) {
    auto turn = std::make_shared<TurnContext>(conversation_id, session_id, enabled,
                                              pricing_, clock_);

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = turns_.insert_or_assign(Key{conversation_id, turn->session_id}, turn);
    if (!inserted) {
        spdlog::warn("Turn for conversation {} restarted before it ended", conversation_id);
    }
    return turn;
}

std::shared_ptr<TurnContext> TurnRegistry::find(const ConversationId& conversation_id,
                                                const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(Key{conversation_id, session_id.empty() ? "default" : session_id});
    return it != turns_.end() ? it->second : nullptr;
}

std::shared_ptr<TurnContext> TurnRegistry::end(const ConversationId& conversation_id,
                                               const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(Key{conversation_id, session_id.empty() ? "default" : session_id});
    if (it == turns_.end()) {
        return nullptr;
    }
    auto turn = std::move(it->second);
    turns_.erase(it);
    return turn;
}

size_t TurnRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

}  // namespace toolpipe::monitoring
