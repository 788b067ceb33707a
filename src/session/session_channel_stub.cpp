#include "session/session_channel_stub.h"

#include "core/logger.h"

#include <utility>

namespace skirmish::session {

SessionChannelStub::SessionChannelStub(std::string account) : account_(std::move(account)) {}

std::string SessionChannelStub::Account() const {
    return account_;
}

void SessionChannelStub::Subscribe(
    std::string_view room_id,
    std::string_view event_name,
    EventHandler handler) {
    event_subscriptions_.push_back(EventSubscription{
        .room_id = std::string(room_id),
        .event_name = std::string(event_name),
        .handler = std::move(handler),
    });
}

void SessionChannelStub::SubscribeState(std::string_view room_id, StateHandler handler) {
    state_subscriptions_.push_back(StateSubscription{
        .room_id = std::string(room_id),
        .handler = std::move(handler),
    });
}

void SessionChannelStub::Call(
    std::string_view name,
    wire::ByteSpan args,
    const CallOptions& options) {
    const auto last_call = last_call_ms_by_name_.find(name);
    if (options.throttle_ms > 0 &&
        last_call != last_call_ms_by_name_.end() &&
        now_ms_ - last_call->second < options.throttle_ms) {
        ++throttled_call_count_;
        return;
    }

    if (last_call == last_call_ms_by_name_.end()) {
        last_call_ms_by_name_.emplace(std::string(name), now_ms_);
    } else {
        last_call->second = now_ms_;
    }

    calls_.push_back(RecordedCall{
        .name = std::string(name),
        .args = wire::ByteBuffer(args.begin(), args.end()),
        .sent_at_ms = now_ms_,
    });
}

void SessionChannelStub::SetNowMs(std::uint64_t now_ms) {
    now_ms_ = now_ms;
}

std::size_t SessionChannelStub::PublishEvent(
    std::string_view room_id,
    std::string_view event_name,
    wire::ByteSpan payload) {
    // Handlers may subscribe again while running; iterate over a copy.
    const std::vector<EventSubscription> subscriptions = event_subscriptions_;
    std::size_t delivered = 0;
    for (const EventSubscription& subscription : subscriptions) {
        if (subscription.room_id != room_id || subscription.event_name != event_name) {
            continue;
        }
        subscription.handler(payload);
        ++delivered;
    }
    return delivered;
}

std::size_t SessionChannelStub::PublishState(
    std::string_view room_id,
    wire::ByteSpan encoded_state) {
    const std::vector<StateSubscription> subscriptions = state_subscriptions_;
    std::size_t delivered = 0;
    for (const StateSubscription& subscription : subscriptions) {
        if (subscription.room_id != room_id) {
            continue;
        }
        subscription.handler(encoded_state);
        ++delivered;
    }
    return delivered;
}

void SessionChannelStub::Reset() {
    if (!event_subscriptions_.empty() || !state_subscriptions_.empty()) {
        core::Logger::Info(
            "session",
            "Stub session dropped " + std::to_string(event_subscriptions_.size()) +
                " event and " + std::to_string(state_subscriptions_.size()) +
                " state subscriptions.");
    }
    event_subscriptions_.clear();
    state_subscriptions_.clear();
    last_call_ms_by_name_.clear();
}

std::size_t SessionChannelStub::SubscriptionCount() const {
    return event_subscriptions_.size();
}

std::size_t SessionChannelStub::StateSubscriptionCount() const {
    return state_subscriptions_.size();
}

const std::vector<RecordedCall>& SessionChannelStub::Calls() const {
    return calls_;
}

std::vector<RecordedCall> SessionChannelStub::CallsNamed(std::string_view name) const {
    std::vector<RecordedCall> matched;
    for (const RecordedCall& call : calls_) {
        if (call.name == name) {
            matched.push_back(call);
        }
    }
    return matched;
}

std::size_t SessionChannelStub::ThrottledCallCount() const {
    return throttled_call_count_;
}

void SessionChannelStub::ClearCalls() {
    calls_.clear();
}

}  // namespace skirmish::session
