#include "sync/world_bootstrap.h"

#include "core/logger.h"

#include <algorithm>

namespace skirmish::sync {

const char* BootstrapOutcomeName(BootstrapOutcome outcome) {
    switch (outcome) {
        case BootstrapOutcome::Materialized:
            return "materialized";
        case BootstrapOutcome::AlreadyBootstrapped:
            return "already_bootstrapped";
        case BootstrapOutcome::ResourcesNotReady:
            return "resources_not_ready";
    }

    return "unknown";
}

WorldBootstrapGuard::WorldBootstrapGuard(
    const core::EngineConfig& config,
    sim::IPhysicsBridge& physics)
    : config_(config), physics_(physics) {}

void WorldBootstrapGuard::MarkResourcesReady() {
    resources_ready_ = true;
}

bool WorldBootstrapGuard::ResourcesReady() const {
    return resources_ready_;
}

bool WorldBootstrapGuard::IsBootstrapped() const {
    return bootstrapped_;
}

BootstrapOutcome WorldBootstrapGuard::TryBootstrap(
    const std::vector<session::ObstacleEntry>& obstacles,
    const std::vector<std::string>& participant_ids) {
    if (bootstrapped_) {
        return BootstrapOutcome::AlreadyBootstrapped;
    }

    if (!resources_ready_) {
        return BootstrapOutcome::ResourcesNotReady;
    }

    // Claimed before any collaborator runs, so a reentrant source sees a
    // completed bootstrap instead of materializing a second copy.
    bootstrapped_ = true;

    registry_.clear();
    CreateBorderBlocks();

    std::size_t created_obstacles = 0;
    for (const session::ObstacleEntry& obstacle : obstacles) {
        if (!obstacle.x.has_value() || !obstacle.y.has_value()) {
            ++skipped_obstacle_count_;
            continue;
        }
        CreateBlock(
            static_cast<float>(*obstacle.x),
            static_cast<float>(*obstacle.y),
            GeometryKind::Obstacle);
        ++created_obstacles;
    }

    for (const std::string& participant_id : participant_ids) {
        physics_.RegisterGeometryCollider(participant_id);
    }

    core::Logger::Info(
        "world",
        "World geometry materialized: border=" +
            std::to_string(BlockCount(GeometryKind::Border)) +
            " obstacles=" + std::to_string(created_obstacles) +
            " skipped=" + std::to_string(skipped_obstacle_count_) + ".");
    return BootstrapOutcome::Materialized;
}

bool WorldBootstrapGuard::OverlapsAny(const sim::Aabb& bounds) const {
    auto view = registry_.view<const BlockBounds>();
    for (const entt::entity entity : view) {
        if (physics_.Overlaps(bounds, view.get<const BlockBounds>(entity).bounds)) {
            return true;
        }
    }
    return false;
}

std::vector<GeometryBlock> WorldBootstrapGuard::Blocks() const {
    std::vector<GeometryBlock> blocks;
    auto view = registry_.view<const BlockTag, const BlockBounds>();
    for (const entt::entity entity : view) {
        const auto& bounds = view.get<const BlockBounds>(entity).bounds;
        blocks.push_back(GeometryBlock{
            .x = bounds.center_x,
            .y = bounds.center_y,
            .kind = view.get<const BlockTag>(entity).kind,
        });
    }

    std::sort(blocks.begin(), blocks.end(), [](const GeometryBlock& lhs, const GeometryBlock& rhs) {
        if (lhs.kind != rhs.kind) {
            return lhs.kind < rhs.kind;
        }
        if (lhs.x != rhs.x) {
            return lhs.x < rhs.x;
        }
        return lhs.y < rhs.y;
    });
    return blocks;
}

std::size_t WorldBootstrapGuard::BlockCount() const {
    return registry_.view<const BlockTag>().size();
}

std::size_t WorldBootstrapGuard::BlockCount(GeometryKind kind) const {
    std::size_t count = 0;
    auto view = registry_.view<const BlockTag>();
    for (const entt::entity entity : view) {
        if (view.get<const BlockTag>(entity).kind == kind) {
            ++count;
        }
    }
    return count;
}

std::size_t WorldBootstrapGuard::SkippedObstacleCount() const {
    return skipped_obstacle_count_;
}

void WorldBootstrapGuard::Reset() {
    registry_.clear();
    bootstrapped_ = false;
    skipped_obstacle_count_ = 0;
}

void WorldBootstrapGuard::CreateBlock(float x, float y, GeometryKind kind) {
    const entt::entity block = registry_.create();
    registry_.emplace<BlockTag>(block, BlockTag{.kind = kind});
    const float size = static_cast<float>(config_.obstacle_size);
    registry_.emplace<BlockBounds>(block, BlockBounds{
        .bounds = sim::MakeCenteredAabb(x, y, size, size),
    });
}

void WorldBootstrapGuard::CreateBorderBlocks() {
    const int world_size = config_.world_size;
    const float far_edge = static_cast<float>(world_size);
    for (int offset = 0; offset < world_size; offset += config_.border_step) {
        const float position = static_cast<float>(offset);
        CreateBlock(position, 0.0F, GeometryKind::Border);
        CreateBlock(position, far_edge, GeometryKind::Border);
        CreateBlock(0.0F, position, GeometryKind::Border);
        CreateBlock(far_edge, position, GeometryKind::Border);
    }
}

}  // namespace skirmish::sync
