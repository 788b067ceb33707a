#include "sync/ephemeral_entities.h"
#include "sync/world_bootstrap.h"

#include <cmath>
#include <iostream>
#include <optional>
#include <vector>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

skirmish::sim::TickContext TickAt(std::uint64_t tick_index, std::uint64_t now_ms) {
    return skirmish::sim::TickContext{
        .tick_index = tick_index,
        .now_ms = now_ms,
        .fixed_delta_seconds = 0.05,
    };
}

}  // namespace

int main() {
    bool passed = true;
    using namespace skirmish;

    const core::EngineConfig config{};
    sim::AabbPhysicsBridge physics;
    sync::ScheduledTaskList tasks;
    sync::HitRegistry hits;
    sync::WorldBootstrapGuard world(config, physics);
    sync::EphemeralEntityManager ephemera(config, tasks, hits, physics);

    const sync::AttackEvent right_attack = ephemera.SpawnAttack("attack_a", "local", 500.0F, 500.0F, 1, 0);
    passed &= Expect(right_attack.direction == 1, "Attack should keep its facing.");
    passed &= Expect(
        right_attack.hitbox.center_x == 564.0F && right_attack.hitbox.center_y == 500.0F,
        "Hitbox should sit in front of the attacker.");
    passed &= Expect(
        right_attack.hitbox.half_width == 40.0F && right_attack.hitbox.half_height == 30.0F,
        "Hitbox should be 80x60.");
    passed &= Expect(hits.IsOpen("attack_a"), "Spawning should open a hit set.");
    passed &= Expect(ephemera.HitboxCount() == 1, "One hitbox should be live.");

    const sync::AttackEvent left_attack = ephemera.SpawnAttack("attack_b", "local", 500.0F, 500.0F, -1, 100);
    passed &= Expect(left_attack.hitbox.center_x == 436.0F, "Left attack should mirror the offset.");
    passed &= Expect(ephemera.HitboxCount() == 1, "New attack should replace the owner's hitbox.");
    passed &= Expect(!hits.IsOpen("attack_a"), "Replaced attack should close its hit set.");
    const std::optional<sync::AttackEvent> active = ephemera.ActiveAttack("local");
    passed &= Expect(active.has_value() && active->id == "attack_b", "Active attack should be the latest.");

    tasks.RunDue(300);
    passed &= Expect(ephemera.HitboxCount() == 1, "First expiry should not remove the replacement.");
    tasks.RunDue(400);
    passed &= Expect(ephemera.HitboxCount() == 0, "Hitbox should expire 300ms after spawning.");
    passed &= Expect(!hits.IsOpen("attack_b"), "Expired attack should close its hit set.");
    passed &= Expect(ephemera.Diagnostics().total_hitboxes_expired == 1, "One hitbox should have expired.");

    const sync::ProjectileSpec ttl_spec{
        .id = "ttl",
        .owner_id = "p2",
        .origin_x = 1000.0F,
        .origin_y = 1000.0F,
        .target_x = 1000.0F,
        .target_y = 1001.0F,
    };
    passed &= Expect(ephemera.SpawnProjectile(ttl_spec, 1000), "Projectile should spawn.");
    passed &= Expect(!ephemera.SpawnProjectile(ttl_spec, 1000), "Duplicate projectile id should be refused.");
    const std::vector<sync::ProjectileView> projectiles = ephemera.Projectiles();
    passed &= Expect(projectiles.size() == 1, "One projectile should be live.");
    if (projectiles.size() == 1) {
        passed &= Expect(
            std::fabs(projectiles[0].velocity_x) < 0.001F && std::fabs(projectiles[0].velocity_y - 500.0F) < 0.001F,
            "Velocity should point at the target with projectile speed.");
    }

    // Keep the projectile still so only its age matters.
    const sim::TickContext frozen{.tick_index = 1, .now_ms = 2999, .fixed_delta_seconds = 0.0};
    sync::EphemeralTickResult result = ephemera.Tick(frozen, world, "local", std::nullopt);
    passed &= Expect(result.expired_count == 0 && ephemera.ProjectileCount() == 1, "Projectile should live until ttl.");
    result = ephemera.Tick(
        sim::TickContext{.tick_index = 2, .now_ms = 3000, .fixed_delta_seconds = 0.0},
        world,
        "local",
        std::nullopt);
    passed &= Expect(result.expired_count == 1, "Projectile should expire at exactly ttl.");
    passed &= Expect(ephemera.ProjectileCount() == 0, "Expired projectile should be gone.");

    const sim::Aabb local_bounds = sim::MakeCenteredAabb(600.0F, 500.0F, 48.0F, 48.0F);
    passed &= Expect(
        ephemera.SpawnProjectile(
            {.id = "own", .owner_id = "local", .origin_x = 600.0F, .origin_y = 500.0F, .target_x = 700.0F, .target_y = 500.0F},
            5000),
        "Own projectile should spawn.");
    passed &= Expect(
        ephemera.SpawnProjectile(
            {.id = "enemy", .owner_id = "p2", .origin_x = 590.0F, .origin_y = 500.0F, .target_x = 700.0F, .target_y = 500.0F},
            5000),
        "Enemy projectile should spawn.");
    result = ephemera.Tick(
        sim::TickContext{.tick_index = 3, .now_ms = 5010, .fixed_delta_seconds = 0.0},
        world,
        "local",
        local_bounds);
    passed &= Expect(result.local_hits.size() == 1, "Only the enemy projectile should hit the local participant.");
    if (result.local_hits.size() == 1) {
        passed &= Expect(
            result.local_hits[0].projectile_id == "enemy" && result.local_hits[0].owner_id == "p2",
            "Hit should report projectile and owner.");
    }
    passed &= Expect(ephemera.HasProjectile("own") && !ephemera.HasProjectile("enemy"), "Hit projectile should be consumed.");

    world.MarkResourcesReady();
    world.TryBootstrap({{.x = 800.0, .y = 500.0}}, {});
    for (std::uint64_t tick = 0; tick < 10 && ephemera.HasProjectile("own"); ++tick) {
        result = ephemera.Tick(TickAt(4 + tick, 5050 + tick * 50), world, "local", local_bounds);
    }
    passed &= Expect(!ephemera.HasProjectile("own"), "Projectile should be destroyed by world geometry.");
    passed &= Expect(result.geometry_collision_count == 1, "Geometry collision should be reported once.");

    ephemera.SpawnAttack("attack_c", "local", 500.0F, 500.0F, 1, 6000);
    ephemera.SpawnProjectile({.id = "leftover", .owner_id = "p2", .origin_x = 1000.0F, .origin_y = 1000.0F}, 6000);
    ephemera.Clear();
    passed &= Expect(ephemera.HitboxCount() == 0 && ephemera.ProjectileCount() == 0, "Clear should drop every entity.");
    passed &= Expect(hits.OpenAttackCount() == 0, "Clear should close live hit sets.");
    passed &= Expect(tasks.RunDue(7000) == 1, "Stale expiry task should run harmlessly.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] skirmish_ephemeral_entities_tests\n";
    return 0;
}
