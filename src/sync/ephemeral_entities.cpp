#include "sync/ephemeral_entities.h"

#include "sync/world_bootstrap.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace skirmish::sync {
namespace {

int NormalizeDirection(int direction) {
    return direction < 0 ? -1 : 1;
}

}  // namespace

EphemeralEntityManager::EphemeralEntityManager(
    const core::EngineConfig& config,
    ScheduledTaskList& scheduled_tasks,
    HitRegistry& hit_registry,
    const sim::IPhysicsBridge& physics)
    : config_(config),
      scheduled_tasks_(scheduled_tasks),
      hit_registry_(hit_registry),
      physics_(physics) {}

AttackEvent EphemeralEntityManager::SpawnAttack(
    std::string_view attack_id,
    std::string_view owner_id,
    float owner_x,
    float owner_y,
    int direction,
    std::uint64_t now_ms) {
    const entt::entity previous = FindHitboxByOwner(owner_id);
    if (previous != entt::null) {
        DestroyHitboxEntity(previous);
    }

    const int facing = NormalizeDirection(direction);
    const float hitbox_width = static_cast<float>(config_.hitbox_width);
    const float hitbox_height = static_cast<float>(config_.hitbox_height);
    const float reach =
        static_cast<float>(config_.participant_width) * 0.5F + hitbox_width * 0.5F;
    const float hitbox_x = owner_x + static_cast<float>(facing) * reach;
    const float hitbox_y = owner_y;

    AttackEvent event{};
    event.id = std::string(attack_id);
    event.owner_id = std::string(owner_id);
    event.origin_x = owner_x;
    event.origin_y = owner_y;
    event.direction = facing;
    event.hitbox = sim::MakeCenteredAabb(hitbox_x, hitbox_y, hitbox_width, hitbox_height);

    const entt::entity hitbox = registry_.create();
    registry_.emplace<Transform>(hitbox, Transform{.x = hitbox_x, .y = hitbox_y});
    registry_.emplace<BoxCollider>(hitbox, BoxCollider{
        .width = hitbox_width,
        .height = hitbox_height,
    });
    registry_.emplace<AttackHitbox>(hitbox, AttackHitbox{.event = event});
    hit_registry_.Open(event.id);
    ++diagnostics_.total_attacks_spawned;

    const std::uint64_t expires_at_ms =
        now_ms + static_cast<std::uint64_t>(config_.hitbox_lifetime_ms);
    scheduled_tasks_.Schedule(expires_at_ms, [this, expiring_id = event.id]() {
        if (DestroyAttack(expiring_id)) {
            ++diagnostics_.total_hitboxes_expired;
        }
    });

    return event;
}

bool EphemeralEntityManager::SpawnProjectile(const ProjectileSpec& spec, std::uint64_t now_ms) {
    if (spec.id.empty() || HasProjectile(spec.id)) {
        ++diagnostics_.total_projectiles_duplicate;
        return false;
    }

    const float angle = std::atan2(spec.target_y - spec.origin_y, spec.target_x - spec.origin_x);
    const float speed = static_cast<float>(config_.projectile_speed);
    const float size = static_cast<float>(config_.projectile_size);

    const entt::entity projectile = registry_.create();
    registry_.emplace<Transform>(projectile, Transform{.x = spec.origin_x, .y = spec.origin_y});
    registry_.emplace<Velocity>(projectile, Velocity{
        .per_second_x = std::cos(angle) * speed,
        .per_second_y = std::sin(angle) * speed,
    });
    registry_.emplace<BoxCollider>(projectile, BoxCollider{.width = size, .height = size});
    registry_.emplace<ProjectileData>(projectile, ProjectileData{
        .id = spec.id,
        .owner_id = spec.owner_id,
        .created_ms = now_ms,
    });
    ++diagnostics_.total_projectiles_spawned;
    return true;
}

EphemeralTickResult EphemeralEntityManager::Tick(
    const sim::TickContext& tick_context,
    const WorldBootstrapGuard& world,
    std::string_view local_id,
    const std::optional<sim::Aabb>& local_bounds) {
    EphemeralTickResult result{};
    RunMovementSystem(tick_context.fixed_delta_seconds);

    const std::uint64_t ttl_ms = static_cast<std::uint64_t>(config_.projectile_ttl_ms);
    std::vector<entt::entity> consumed_projectiles;
    auto projectile_view = registry_.view<const Transform, const BoxCollider, const ProjectileData>();
    for (const entt::entity entity : projectile_view) {
        const auto& transform = projectile_view.get<const Transform>(entity);
        const auto& collider = projectile_view.get<const BoxCollider>(entity);
        const auto& data = projectile_view.get<const ProjectileData>(entity);
        const sim::Aabb bounds =
            sim::MakeCenteredAabb(transform.x, transform.y, collider.width, collider.height);

        bool consumed = false;
        if (world.OverlapsAny(bounds)) {
            ++result.geometry_collision_count;
            consumed = true;
        }

        if (data.owner_id != local_id &&
            local_bounds.has_value() &&
            physics_.Overlaps(bounds, *local_bounds)) {
            result.local_hits.push_back(ProjectileHit{
                .projectile_id = data.id,
                .owner_id = data.owner_id,
            });
            consumed = true;
        }

        const std::uint64_t age_ms =
            tick_context.now_ms > data.created_ms ? tick_context.now_ms - data.created_ms : 0;
        if (age_ms >= ttl_ms) {
            ++result.expired_count;
            consumed = true;
        }

        if (consumed) {
            consumed_projectiles.push_back(entity);
        }
    }

    const std::size_t recycled_count = consumed_projectiles.size();
    DestroyEntities(consumed_projectiles);
    diagnostics_.total_projectiles_recycled += recycled_count;
    return result;
}

std::optional<AttackEvent> EphemeralEntityManager::ActiveAttack(std::string_view owner_id) const {
    const entt::entity hitbox = FindHitboxByOwner(owner_id);
    if (hitbox == entt::null) {
        return std::nullopt;
    }
    return registry_.get<AttackHitbox>(hitbox).event;
}

bool EphemeralEntityManager::DestroyAttack(std::string_view attack_id) {
    auto hitbox_view = registry_.view<const AttackHitbox>();
    for (const entt::entity entity : hitbox_view) {
        if (hitbox_view.get<const AttackHitbox>(entity).event.id == attack_id) {
            DestroyHitboxEntity(entity);
            return true;
        }
    }
    return false;
}

bool EphemeralEntityManager::HasProjectile(std::string_view projectile_id) const {
    auto projectile_view = registry_.view<const ProjectileData>();
    for (const entt::entity entity : projectile_view) {
        if (projectile_view.get<const ProjectileData>(entity).id == projectile_id) {
            return true;
        }
    }
    return false;
}

std::vector<ProjectileView> EphemeralEntityManager::Projectiles() const {
    std::vector<ProjectileView> projectiles;
    auto projectile_view = registry_.view<const Transform, const Velocity, const ProjectileData>();
    for (const entt::entity entity : projectile_view) {
        const auto& transform = projectile_view.get<const Transform>(entity);
        const auto& velocity = projectile_view.get<const Velocity>(entity);
        const auto& data = projectile_view.get<const ProjectileData>(entity);
        projectiles.push_back(ProjectileView{
            .id = data.id,
            .owner_id = data.owner_id,
            .x = transform.x,
            .y = transform.y,
            .velocity_x = velocity.per_second_x,
            .velocity_y = velocity.per_second_y,
            .created_ms = data.created_ms,
        });
    }

    std::sort(projectiles.begin(), projectiles.end(), [](const ProjectileView& lhs, const ProjectileView& rhs) {
        return lhs.id < rhs.id;
    });
    return projectiles;
}

std::size_t EphemeralEntityManager::ProjectileCount() const {
    return registry_.view<const ProjectileData>().size();
}

std::size_t EphemeralEntityManager::HitboxCount() const {
    return registry_.view<const AttackHitbox>().size();
}

EphemeralDiagnostics EphemeralEntityManager::Diagnostics() const {
    return diagnostics_;
}

void EphemeralEntityManager::Clear() {
    auto hitbox_view = registry_.view<const AttackHitbox>();
    for (const entt::entity entity : hitbox_view) {
        hit_registry_.Close(hitbox_view.get<const AttackHitbox>(entity).event.id);
    }
    registry_.clear();
}

entt::entity EphemeralEntityManager::FindHitboxByOwner(std::string_view owner_id) const {
    auto hitbox_view = registry_.view<const AttackHitbox>();
    for (const entt::entity entity : hitbox_view) {
        if (hitbox_view.get<const AttackHitbox>(entity).event.owner_id == owner_id) {
            return entity;
        }
    }
    return entt::null;
}

void EphemeralEntityManager::DestroyHitboxEntity(entt::entity entity) {
    if (!registry_.valid(entity)) {
        return;
    }
    hit_registry_.Close(registry_.get<AttackHitbox>(entity).event.id);
    registry_.destroy(entity);
}

void EphemeralEntityManager::RunMovementSystem(double fixed_delta_seconds) {
    auto movement_view = registry_.view<Transform, const Velocity>();
    for (const entt::entity entity : movement_view) {
        auto& transform = movement_view.get<Transform>(entity);
        const auto& velocity = movement_view.get<const Velocity>(entity);
        transform.x += velocity.per_second_x * static_cast<float>(fixed_delta_seconds);
        transform.y += velocity.per_second_y * static_cast<float>(fixed_delta_seconds);
    }
}

void EphemeralEntityManager::DestroyEntities(std::vector<entt::entity>& entities_to_destroy) {
    if (entities_to_destroy.empty()) {
        return;
    }

    std::sort(entities_to_destroy.begin(), entities_to_destroy.end());
    entities_to_destroy.erase(
        std::unique(entities_to_destroy.begin(), entities_to_destroy.end()),
        entities_to_destroy.end());

    for (const entt::entity entity : entities_to_destroy) {
        if (!registry_.valid(entity)) {
            continue;
        }
        registry_.destroy(entity);
    }
}

}  // namespace skirmish::sync
