#include "sync/powerup_registry.h"

namespace skirmish::sync {

PowerupRegistry::PowerupRegistry(
    const core::EngineConfig& config,
    const sim::IPhysicsBridge& physics)
    : config_(config), physics_(physics) {}

std::size_t PowerupRegistry::SyncFromRoomState(
    const std::vector<session::PowerupEntry>& entries) {
    powerups_.clear();

    std::size_t skipped_count = 0;
    for (const session::PowerupEntry& entry : entries) {
        if (!entry.id.has_value() || entry.id->empty() ||
            !entry.type.has_value() || entry.type->empty()) {
            ++skipped_count;
            continue;
        }

        powerups_[*entry.id] = Powerup{
            .id = *entry.id,
            .type = *entry.type,
            .x = static_cast<float>(entry.x.value_or(0.0)),
            .y = static_cast<float>(entry.y.value_or(0.0)),
        };
    }
    return skipped_count;
}

bool PowerupRegistry::Spawn(const session::PowerupSpawnedMessage& message) {
    if (message.id.empty() || message.type.empty()) {
        return false;
    }

    powerups_[message.id] = Powerup{
        .id = message.id,
        .type = message.type,
        .x = static_cast<float>(message.x),
        .y = static_cast<float>(message.y),
    };
    return true;
}

std::vector<Powerup> PowerupRegistry::CollectOverlapping(const sim::Aabb& collector_bounds) {
    std::vector<Powerup> collected;
    for (auto iter = powerups_.begin(); iter != powerups_.end();) {
        if (!physics_.Overlaps(collector_bounds, BoundsOf(iter->second))) {
            ++iter;
            continue;
        }
        collected.push_back(iter->second);
        iter = powerups_.erase(iter);
    }
    return collected;
}

const Powerup* PowerupRegistry::Find(std::string_view powerup_id) const {
    const auto iter = powerups_.find(powerup_id);
    if (iter == powerups_.end()) {
        return nullptr;
    }
    return &iter->second;
}

std::vector<Powerup> PowerupRegistry::Powerups() const {
    std::vector<Powerup> powerups;
    powerups.reserve(powerups_.size());
    for (const auto& [powerup_id, powerup] : powerups_) {
        (void)powerup_id;
        powerups.push_back(powerup);
    }
    return powerups;
}

std::size_t PowerupRegistry::Size() const {
    return powerups_.size();
}

void PowerupRegistry::Clear() {
    powerups_.clear();
}

sim::Aabb PowerupRegistry::BoundsOf(const Powerup& powerup) const {
    const float size = static_cast<float>(config_.powerup_size);
    return sim::MakeCenteredAabb(powerup.x, powerup.y, size, size);
}

}  // namespace skirmish::sync
