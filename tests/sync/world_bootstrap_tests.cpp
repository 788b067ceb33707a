#include "sync/world_bootstrap.h"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace skirmish;

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

// Feeds a second obstacle source into the guard from inside the first
// bootstrap's collider registration.
class ReentrantBridge final : public sim::IPhysicsBridge {
public:
    void Attach(sync::WorldBootstrapGuard& world) {
        world_ = &world;
    }

    bool Overlaps(const sim::Aabb& lhs, const sim::Aabb& rhs) const override {
        return inner_.Overlaps(lhs, rhs);
    }

    void MoveTo(std::string_view participant_id, float x, float y) override {
        inner_.MoveTo(participant_id, x, y);
    }

    void RegisterGeometryCollider(std::string_view participant_id) override {
        inner_.RegisterGeometryCollider(participant_id);
        if (world_ == nullptr || nested_outcome_.has_value()) {
            return;
        }
        blocks_before_nested_ = world_->BlockCount();
        const std::vector<session::ObstacleEntry> late{{.x = 1500.0, .y = 1500.0}, {.x = 1600.0, .y = 1600.0}};
        nested_outcome_ = world_->TryBootstrap(late, {"late"});
        blocks_after_nested_ = world_->BlockCount();
    }

    void ReleaseParticipant(std::string_view participant_id) override {
        inner_.ReleaseParticipant(participant_id);
    }

    const sim::AabbPhysicsBridge& Inner() const {
        return inner_;
    }

    std::optional<sync::BootstrapOutcome> nested_outcome_;
    std::size_t blocks_before_nested_ = 0;
    std::size_t blocks_after_nested_ = 0;

private:
    sim::AabbPhysicsBridge inner_;
    sync::WorldBootstrapGuard* world_ = nullptr;
};

bool TestReentrantSourceIsIgnored() {
    bool passed = true;
    const core::EngineConfig config{};
    ReentrantBridge bridge;
    sync::WorldBootstrapGuard world(config, bridge);
    bridge.Attach(world);
    world.MarkResourcesReady();

    const std::vector<session::ObstacleEntry> obstacles{{.x = 300.0, .y = 300.0}};
    passed &= Expect(
        world.TryBootstrap(obstacles, {"local", "p1"}) == sync::BootstrapOutcome::Materialized,
        "Outer bootstrap should materialize.");
    passed &= Expect(
        bridge.nested_outcome_ == sync::BootstrapOutcome::AlreadyBootstrapped,
        "Nested bootstrap should see the world as already bootstrapped.");
    passed &= Expect(
        bridge.blocks_after_nested_ == bridge.blocks_before_nested_,
        "Nested bootstrap should not add geometry.");
    passed &= Expect(world.BlockCount() == 161, "Only the outer source should be materialized.");
    passed &= Expect(world.BlockCount(sync::GeometryKind::Obstacle) == 1, "Nested obstacles should be dropped.");
    passed &= Expect(
        bridge.Inner().HasGeometryCollider("local") && bridge.Inner().HasGeometryCollider("p1") &&
            !bridge.Inner().HasGeometryCollider("late"),
        "Only the outer participants should be registered.");
    return passed;
}

}  // namespace

int main() {
    bool passed = true;

    const core::EngineConfig config{};
    sim::AabbPhysicsBridge physics;
    sync::WorldBootstrapGuard world(config, physics);

    const std::vector<session::ObstacleEntry> first_obstacles{
        {.x = 300.0, .y = 300.0},
        {.x = 700.0, .y = 900.0},
        {.x = 50.0},
    };
    const std::vector<std::string> participants{"local", "p1"};

    passed &= Expect(
        world.TryBootstrap(first_obstacles, participants) == sync::BootstrapOutcome::ResourcesNotReady,
        "Bootstrap should wait for world resources.");
    passed &= Expect(!world.IsBootstrapped(), "Premature bootstrap should not set the flag.");
    passed &= Expect(world.BlockCount() == 0, "Premature bootstrap should create nothing.");

    world.MarkResourcesReady();

    passed &= Expect(
        world.TryBootstrap(first_obstacles, participants) == sync::BootstrapOutcome::Materialized,
        "First source should materialize the world.");
    passed &= Expect(world.IsBootstrapped(), "Bootstrap flag should be set.");
    passed &= Expect(
        world.BlockCount(sync::GeometryKind::Border) == 160,
        "Border should be four rows of forty blocks.");
    passed &= Expect(world.BlockCount(sync::GeometryKind::Obstacle) == 2, "Valid obstacles should be created.");
    passed &= Expect(world.SkippedObstacleCount() == 1, "Obstacle without y should be skipped.");
    passed &= Expect(
        physics.HasGeometryCollider("local") && physics.HasGeometryCollider("p1"),
        "Known participants should collide with geometry.");

    const std::vector<sync::GeometryBlock> blocks_after_first = world.Blocks();
    const std::vector<session::ObstacleEntry> second_obstacles{{.x = 1500.0, .y = 1500.0}};
    passed &= Expect(
        world.TryBootstrap(second_obstacles, participants) == sync::BootstrapOutcome::AlreadyBootstrapped,
        "Second source should be ignored.");
    const std::vector<sync::GeometryBlock> blocks_after_second = world.Blocks();
    bool identical = blocks_after_first.size() == blocks_after_second.size();
    for (std::size_t index = 0; identical && index < blocks_after_first.size(); ++index) {
        identical = blocks_after_first[index].x == blocks_after_second[index].x &&
            blocks_after_first[index].y == blocks_after_second[index].y &&
            blocks_after_first[index].kind == blocks_after_second[index].kind;
    }
    passed &= Expect(identical, "Second bootstrap should leave geometry untouched.");

    passed &= Expect(
        world.OverlapsAny(sim::MakeCenteredAabb(300.0F, 300.0F, 8.0F, 8.0F)),
        "Obstacle should be hit by an overlapping box.");
    passed &= Expect(
        world.OverlapsAny(sim::MakeCenteredAabb(1000.0F, 2000.0F, 8.0F, 8.0F)),
        "Far border row should be hit.");
    passed &= Expect(
        !world.OverlapsAny(sim::MakeCenteredAabb(1000.0F, 1000.0F, 8.0F, 8.0F)),
        "Open floor should not collide.");

    world.Reset();
    passed &= Expect(!world.IsBootstrapped() && world.BlockCount() == 0, "Reset should end the session's world.");
    passed &= Expect(world.ResourcesReady(), "Reset should keep resource readiness.");
    passed &= Expect(
        world.TryBootstrap(second_obstacles, {}) == sync::BootstrapOutcome::Materialized,
        "A new session should bootstrap again.");
    passed &= Expect(world.BlockCount(sync::GeometryKind::Obstacle) == 1, "New session should use its own source.");

    passed &= Expect(
        std::string(sync::BootstrapOutcomeName(sync::BootstrapOutcome::AlreadyBootstrapped)) ==
            "already_bootstrapped",
        "Outcome names should be stable.");

    passed &= TestReentrantSourceIsIgnored();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] skirmish_world_bootstrap_tests\n";
    return 0;
}
