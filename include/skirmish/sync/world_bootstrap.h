#pragma once

#include "core/config.h"
#include "session/message_schema.h"
#include "sim/collision.h"

#include <entt/entt.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace skirmish::sync {

enum class GeometryKind : std::uint8_t {
    Border = 0,
    Obstacle = 1,
};

struct GeometryBlock final {
    float x = 0.0F;
    float y = 0.0F;
    GeometryKind kind = GeometryKind::Border;
};

enum class BootstrapOutcome : std::uint8_t {
    Materialized = 0,
    AlreadyBootstrapped = 1,
    ResourcesNotReady = 2,
};

const char* BootstrapOutcomeName(BootstrapOutcome outcome);

// Static world geometry: a locally computed border plus the server's interior
// obstacles, materialized once per session from whichever source arrives
// first. The bootstrapped flag never resets before Reset() at session end;
// resource readiness belongs to the render side and survives Reset().
class WorldBootstrapGuard final {
public:
    WorldBootstrapGuard(const core::EngineConfig& config, sim::IPhysicsBridge& physics);

    void MarkResourcesReady();
    bool ResourcesReady() const;
    bool IsBootstrapped() const;

    BootstrapOutcome TryBootstrap(
        const std::vector<session::ObstacleEntry>& obstacles,
        const std::vector<std::string>& participant_ids);

    bool OverlapsAny(const sim::Aabb& bounds) const;
    std::vector<GeometryBlock> Blocks() const;
    std::size_t BlockCount() const;
    std::size_t BlockCount(GeometryKind kind) const;
    std::size_t SkippedObstacleCount() const;

    void Reset();

private:
    struct BlockTag final {
        GeometryKind kind = GeometryKind::Border;
    };

    struct BlockBounds final {
        sim::Aabb bounds{};
    };

    void CreateBlock(float x, float y, GeometryKind kind);
    void CreateBorderBlocks();

    const core::EngineConfig& config_;
    sim::IPhysicsBridge& physics_;
    entt::registry registry_{};
    bool resources_ready_ = false;
    bool bootstrapped_ = false;
    std::size_t skipped_obstacle_count_ = 0;
};

}  // namespace skirmish::sync
