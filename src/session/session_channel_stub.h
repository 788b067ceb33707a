#pragma once

#include "session/session_channel.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::session {

struct RecordedCall final {
    std::string name;
    wire::ByteBuffer args;
    std::uint64_t sent_at_ms = 0;
};

// In-process session used by tests and the soak tool. Calls are recorded
// instead of transmitted; events and room states are published by the owner.
class SessionChannelStub final : public ISessionChannel {
public:
    explicit SessionChannelStub(std::string account);

    std::string Account() const override;
    void Subscribe(
        std::string_view room_id,
        std::string_view event_name,
        EventHandler handler) override;
    void SubscribeState(std::string_view room_id, StateHandler handler) override;
    void Call(
        std::string_view name,
        wire::ByteSpan args,
        const CallOptions& options) override;

    void SetNowMs(std::uint64_t now_ms);
    std::size_t PublishEvent(
        std::string_view room_id,
        std::string_view event_name,
        wire::ByteSpan payload);
    std::size_t PublishState(std::string_view room_id, wire::ByteSpan encoded_state);
    void Reset();

    std::size_t SubscriptionCount() const;
    std::size_t StateSubscriptionCount() const;
    const std::vector<RecordedCall>& Calls() const;
    std::vector<RecordedCall> CallsNamed(std::string_view name) const;
    std::size_t ThrottledCallCount() const;
    void ClearCalls();

private:
    struct EventSubscription final {
        std::string room_id;
        std::string event_name;
        EventHandler handler;
    };

    struct StateSubscription final {
        std::string room_id;
        StateHandler handler;
    };

    std::string account_;
    std::uint64_t now_ms_ = 0;
    std::vector<EventSubscription> event_subscriptions_;
    std::vector<StateSubscription> state_subscriptions_;
    std::vector<RecordedCall> calls_;
    std::map<std::string, std::uint64_t, std::less<>> last_call_ms_by_name_;
    std::size_t throttled_call_count_ = 0;
};

}  // namespace skirmish::session
