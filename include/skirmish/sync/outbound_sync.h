#pragma once

#include "core/config.h"
#include "session/session_channel.h"
#include "sync/participant.h"

#include <cstdint>

namespace skirmish::sync {

// Pushes the local participant's state at most once per push interval of
// simulated time, whatever the frame rate.
class OutboundSyncScheduler final {
public:
    explicit OutboundSyncScheduler(const core::EngineConfig& config);

    bool MaybePush(
        std::uint64_t now_ms,
        const Participant& local_participant,
        session::ISessionChannel& session);
    void PushNow(
        std::uint64_t now_ms,
        const Participant& local_participant,
        session::ISessionChannel& session);
    void Reset();

    bool HasPushed() const;
    std::uint64_t LastPushMs() const;
    std::uint64_t PushCount() const;

private:
    const core::EngineConfig& config_;
    bool has_pushed_ = false;
    std::uint64_t last_push_ms_ = 0;
    std::uint64_t push_count_ = 0;
};

}  // namespace skirmish::sync
