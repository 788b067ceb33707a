#pragma once

#include "core/config.h"
#include "session/message_schema.h"
#include "sim/collision.h"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::sync {

struct Powerup final {
    std::string id;
    std::string type;
    float x = 0.0F;
    float y = 0.0F;
};

class PowerupRegistry final {
public:
    PowerupRegistry(const core::EngineConfig& config, const sim::IPhysicsBridge& physics);

    // Replaces the live set; returns the number of entries skipped for missing fields.
    std::size_t SyncFromRoomState(const std::vector<session::PowerupEntry>& entries);
    bool Spawn(const session::PowerupSpawnedMessage& message);
    std::vector<Powerup> CollectOverlapping(const sim::Aabb& collector_bounds);

    const Powerup* Find(std::string_view powerup_id) const;
    std::vector<Powerup> Powerups() const;
    std::size_t Size() const;
    void Clear();

private:
    sim::Aabb BoundsOf(const Powerup& powerup) const;

    const core::EngineConfig& config_;
    const sim::IPhysicsBridge& physics_;
    std::map<std::string, Powerup, std::less<>> powerups_;
};

}  // namespace skirmish::sync
