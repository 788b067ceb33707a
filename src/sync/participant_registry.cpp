#include "sync/participant_registry.h"

#include "core/logger.h"

#include <unordered_set>
#include <utility>

namespace skirmish::sync {

ParticipantRegistry::ParticipantRegistry(
    const core::EngineConfig& config,
    ColorAllocator& color_allocator,
    HealthOverlay& health_overlay,
    sim::IPhysicsBridge& physics)
    : config_(config),
      color_allocator_(color_allocator),
      health_overlay_(health_overlay),
      physics_(physics) {}

void ParticipantRegistry::SetLocalId(std::string local_id) {
    local_id_ = std::move(local_id);
    if (participants_.contains(local_id_)) {
        RemoveParticipant(local_id_);
    }
}

const std::string& ParticipantRegistry::LocalId() const {
    return local_id_;
}

RosterApplyResult ParticipantRegistry::ApplyRosterSnapshot(
    const session::RosterSnapshot& snapshot,
    bool geometry_bootstrapped) {
    RosterApplyResult result{};
    std::unordered_set<std::string> snapshot_ids;
    snapshot_ids.reserve(snapshot.size());

    for (const session::RosterEntry& entry : snapshot) {
        if (!entry.account.has_value() || entry.account->empty()) {
            ++result.skipped_malformed_count;
            continue;
        }

        const std::string& participant_id = *entry.account;
        snapshot_ids.insert(participant_id);
        if (participant_id == local_id_) {
            continue;
        }

        if (!entry.x.has_value() || !entry.y.has_value()) {
            ++result.skipped_malformed_count;
            continue;
        }

        const float x = static_cast<float>(*entry.x);
        const float y = static_cast<float>(*entry.y);
        const int health = ClampHealth(health_overlay_.Resolve(
            participant_id,
            entry.health.value_or(config_.default_health)));

        const auto iter = participants_.find(participant_id);
        if (iter != participants_.end()) {
            Participant& participant = iter->second;
            participant.x = x;
            participant.y = y;
            participant.health = health;
            physics_.MoveTo(participant_id, x, y);
            ++result.updated_count;
            continue;
        }

        Participant participant{};
        participant.id = participant_id;
        participant.name = entry.name.value_or("Unknown");
        participant.x = x;
        participant.y = y;
        participant.health = health;
        participant.color_index = color_allocator_.Allocate(participant_id);
        participants_.emplace(participant_id, participant);

        physics_.MoveTo(participant_id, x, y);
        if (geometry_bootstrapped) {
            physics_.RegisterGeometryCollider(participant_id);
        }
        ++result.created_count;
        core::Logger::Info(
            "roster",
            "Participant joined: " + participant_id + " color=" +
                std::to_string(participant.color_index) + ".");
    }

    std::vector<std::string> departed_ids;
    for (const auto& [participant_id, participant] : participants_) {
        (void)participant;
        if (!snapshot_ids.contains(participant_id)) {
            departed_ids.push_back(participant_id);
        }
    }

    for (const std::string& participant_id : departed_ids) {
        RemoveParticipant(participant_id);
        ++result.removed_count;
    }

    if (result.skipped_malformed_count > 0) {
        core::Logger::Warn(
            "roster",
            "Skipped " + std::to_string(result.skipped_malformed_count) +
                " malformed roster entries.");
    }

    return result;
}

bool ParticipantRegistry::ApplyLocalDamage(
    std::string_view participant_id,
    int damage,
    int& out_new_health) {
    const auto iter = participants_.find(participant_id);
    if (iter == participants_.end()) {
        return false;
    }

    Participant& participant = iter->second;
    participant.health = ClampHealth(participant.health - damage);
    health_overlay_.RecordLocalDamage(participant_id, participant.health);
    out_new_health = participant.health;
    return true;
}

const Participant* ParticipantRegistry::Find(std::string_view participant_id) const {
    const auto iter = participants_.find(participant_id);
    if (iter == participants_.end()) {
        return nullptr;
    }
    return &iter->second;
}

bool ParticipantRegistry::Contains(std::string_view participant_id) const {
    return participants_.find(participant_id) != participants_.end();
}

std::vector<std::string> ParticipantRegistry::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(participants_.size());
    for (const auto& [participant_id, participant] : participants_) {
        (void)participant;
        ids.push_back(participant_id);
    }
    return ids;
}

std::size_t ParticipantRegistry::Size() const {
    return participants_.size();
}

void ParticipantRegistry::ForEach(const std::function<void(const Participant&)>& visitor) const {
    for (const auto& [participant_id, participant] : participants_) {
        (void)participant_id;
        visitor(participant);
    }
}

sim::Aabb ParticipantRegistry::BoundsOf(const Participant& participant) const {
    return sim::MakeCenteredAabb(
        participant.x,
        participant.y,
        static_cast<float>(config_.participant_width),
        static_cast<float>(config_.participant_height));
}

void ParticipantRegistry::Clear() {
    for (const std::string& participant_id : Ids()) {
        RemoveParticipant(participant_id);
    }
}

void ParticipantRegistry::RemoveParticipant(const std::string& participant_id) {
    const auto iter = participants_.find(participant_id);
    if (iter == participants_.end()) {
        return;
    }

    color_allocator_.Release(ColorAllocator::DepartureIndex(participant_id));
    health_overlay_.Clear(participant_id);
    participants_.erase(iter);
    physics_.ReleaseParticipant(participant_id);
    core::Logger::Info("roster", "Participant left: " + participant_id + ".");
}

}  // namespace skirmish::sync
