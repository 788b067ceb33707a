#pragma once

#include "core/config.h"
#include "sim/collision.h"
#include "sim/tick_context.h"
#include "sync/hit_registry.h"
#include "sync/scheduled_tasks.h"

#include <entt/entt.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::sync {

class WorldBootstrapGuard;

struct AttackEvent final {
    std::string id;
    std::string owner_id;
    float origin_x = 0.0F;
    float origin_y = 0.0F;
    int direction = 1;
    sim::Aabb hitbox{};
};

struct ProjectileSpec final {
    std::string id;
    std::string owner_id;
    float origin_x = 0.0F;
    float origin_y = 0.0F;
    float target_x = 0.0F;
    float target_y = 0.0F;
};

struct ProjectileView final {
    std::string id;
    std::string owner_id;
    float x = 0.0F;
    float y = 0.0F;
    float velocity_x = 0.0F;
    float velocity_y = 0.0F;
    std::uint64_t created_ms = 0;
};

struct ProjectileHit final {
    std::string projectile_id;
    std::string owner_id;
};

struct EphemeralTickResult final {
    std::vector<ProjectileHit> local_hits;
    std::size_t geometry_collision_count = 0;
    std::size_t expired_count = 0;
};

struct EphemeralDiagnostics final {
    std::uint64_t total_attacks_spawned = 0;
    std::uint64_t total_hitboxes_expired = 0;
    std::uint64_t total_projectiles_spawned = 0;
    std::uint64_t total_projectiles_duplicate = 0;
    std::uint64_t total_projectiles_recycled = 0;
};

// Owns projectiles and attack hitboxes. Hitboxes expire through the scheduled
// task list; projectiles are checked against geometry, the local participant
// and their time-to-live on every tick.
class EphemeralEntityManager final {
public:
    EphemeralEntityManager(
        const core::EngineConfig& config,
        ScheduledTaskList& scheduled_tasks,
        HitRegistry& hit_registry,
        const sim::IPhysicsBridge& physics);

    AttackEvent SpawnAttack(
        std::string_view attack_id,
        std::string_view owner_id,
        float owner_x,
        float owner_y,
        int direction,
        std::uint64_t now_ms);
    bool SpawnProjectile(const ProjectileSpec& spec, std::uint64_t now_ms);

    EphemeralTickResult Tick(
        const sim::TickContext& tick_context,
        const WorldBootstrapGuard& world,
        std::string_view local_id,
        const std::optional<sim::Aabb>& local_bounds);

    std::optional<AttackEvent> ActiveAttack(std::string_view owner_id) const;
    bool DestroyAttack(std::string_view attack_id);
    bool HasProjectile(std::string_view projectile_id) const;
    std::vector<ProjectileView> Projectiles() const;
    std::size_t ProjectileCount() const;
    std::size_t HitboxCount() const;
    EphemeralDiagnostics Diagnostics() const;

    void Clear();

private:
    struct Transform final {
        float x = 0.0F;
        float y = 0.0F;
    };

    struct Velocity final {
        float per_second_x = 0.0F;
        float per_second_y = 0.0F;
    };

    struct BoxCollider final {
        float width = 0.0F;
        float height = 0.0F;
    };

    struct ProjectileData final {
        std::string id;
        std::string owner_id;
        std::uint64_t created_ms = 0;
    };

    struct AttackHitbox final {
        AttackEvent event;
    };

    entt::entity FindHitboxByOwner(std::string_view owner_id) const;
    void DestroyHitboxEntity(entt::entity entity);
    void RunMovementSystem(double fixed_delta_seconds);
    void DestroyEntities(std::vector<entt::entity>& entities_to_destroy);

    const core::EngineConfig& config_;
    ScheduledTaskList& scheduled_tasks_;
    HitRegistry& hit_registry_;
    const sim::IPhysicsBridge& physics_;
    entt::registry registry_{};
    EphemeralDiagnostics diagnostics_{};
};

}  // namespace skirmish::sync
