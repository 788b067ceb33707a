#pragma once

#include "core/config.h"
#include "session/message_schema.h"
#include "sim/collision.h"
#include "sync/color_allocator.h"
#include "sync/health_overlay.h"
#include "sync/participant.h"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::sync {

struct RosterApplyResult final {
    std::size_t created_count = 0;
    std::size_t updated_count = 0;
    std::size_t removed_count = 0;
    std::size_t skipped_malformed_count = 0;
};

// Remote participants keyed by account id. Membership follows the latest
// roster snapshot; the local id is never stored here.
class ParticipantRegistry final {
public:
    ParticipantRegistry(
        const core::EngineConfig& config,
        ColorAllocator& color_allocator,
        HealthOverlay& health_overlay,
        sim::IPhysicsBridge& physics);

    void SetLocalId(std::string local_id);
    const std::string& LocalId() const;

    RosterApplyResult ApplyRosterSnapshot(
        const session::RosterSnapshot& snapshot,
        bool geometry_bootstrapped);

    // Applies damage to a remote participant and records the result in the
    // overlay. Returns false when the id is not registered.
    bool ApplyLocalDamage(std::string_view participant_id, int damage, int& out_new_health);

    const Participant* Find(std::string_view participant_id) const;
    bool Contains(std::string_view participant_id) const;
    std::vector<std::string> Ids() const;
    std::size_t Size() const;
    void ForEach(const std::function<void(const Participant&)>& visitor) const;
    sim::Aabb BoundsOf(const Participant& participant) const;

    void Clear();

private:
    void RemoveParticipant(const std::string& participant_id);

    const core::EngineConfig& config_;
    ColorAllocator& color_allocator_;
    HealthOverlay& health_overlay_;
    sim::IPhysicsBridge& physics_;
    std::string local_id_;
    std::map<std::string, Participant, std::less<>> participants_;
};

}  // namespace skirmish::sync
