#include "sync/outbound_sync.h"

#include "session/message_schema.h"

namespace skirmish::sync {
namespace {

// Facing travels in the angle field: 0 degrees faces right, 180 faces left.
double FacingToAngle(int facing) {
    return facing < 0 ? 180.0 : 0.0;
}

}  // namespace

OutboundSyncScheduler::OutboundSyncScheduler(const core::EngineConfig& config)
    : config_(config) {}

bool OutboundSyncScheduler::MaybePush(
    std::uint64_t now_ms,
    const Participant& local_participant,
    session::ISessionChannel& session) {
    const std::uint64_t interval_ms =
        static_cast<std::uint64_t>(config_.position_push_interval_ms);
    if (has_pushed_ && (now_ms < last_push_ms_ || now_ms - last_push_ms_ < interval_ms)) {
        return false;
    }

    PushNow(now_ms, local_participant, session);
    return true;
}

void OutboundSyncScheduler::PushNow(
    std::uint64_t now_ms,
    const Participant& local_participant,
    session::ISessionChannel& session) {
    const wire::ByteBuffer args = session::EncodePlayerPosition(session::PlayerPositionMessage{
        .x = local_participant.x,
        .y = local_participant.y,
        .angle = FacingToAngle(local_participant.facing),
        .health = local_participant.health,
        .name = local_participant.name,
    });
    session.Call(
        session::kCallUpdatePlayerPosition,
        wire::AsSpan(args),
        session::CallOptions{
            .throttle_ms = static_cast<std::uint32_t>(config_.position_push_interval_ms),
        });

    has_pushed_ = true;
    last_push_ms_ = now_ms;
    ++push_count_;
}

void OutboundSyncScheduler::Reset() {
    has_pushed_ = false;
    last_push_ms_ = 0;
    push_count_ = 0;
}

bool OutboundSyncScheduler::HasPushed() const {
    return has_pushed_;
}

std::uint64_t OutboundSyncScheduler::LastPushMs() const {
    return last_push_ms_;
}

std::uint64_t OutboundSyncScheduler::PushCount() const {
    return push_count_;
}

}  // namespace skirmish::sync
