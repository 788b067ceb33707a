#include "sim/collision.h"

#include <cmath>

namespace skirmish::sim {

Aabb MakeCenteredAabb(float center_x, float center_y, float width, float height) {
    return Aabb{
        .center_x = center_x,
        .center_y = center_y,
        .half_width = width * 0.5F,
        .half_height = height * 0.5F,
    };
}

bool Overlaps(const Aabb& lhs, const Aabb& rhs) {
    return std::fabs(lhs.center_x - rhs.center_x) < lhs.half_width + rhs.half_width &&
        std::fabs(lhs.center_y - rhs.center_y) < lhs.half_height + rhs.half_height;
}

bool AabbPhysicsBridge::Overlaps(const Aabb& lhs, const Aabb& rhs) const {
    ++overlap_query_count_;
    return sim::Overlaps(lhs, rhs);
}

void AabbPhysicsBridge::MoveTo(std::string_view participant_id, float x, float y) {
    positions_[std::string(participant_id)] = BridgePosition{.x = x, .y = y};
}

void AabbPhysicsBridge::RegisterGeometryCollider(std::string_view participant_id) {
    geometry_colliders_.insert(std::string(participant_id));
}

void AabbPhysicsBridge::ReleaseParticipant(std::string_view participant_id) {
    const std::string key(participant_id);
    positions_.erase(key);
    geometry_colliders_.erase(key);
}

bool AabbPhysicsBridge::TryGetPosition(
    std::string_view participant_id,
    BridgePosition& out_position) const {
    const auto iter = positions_.find(std::string(participant_id));
    if (iter == positions_.end()) {
        return false;
    }
    out_position = iter->second;
    return true;
}

bool AabbPhysicsBridge::HasGeometryCollider(std::string_view participant_id) const {
    return geometry_colliders_.contains(std::string(participant_id));
}

std::size_t AabbPhysicsBridge::TrackedParticipantCount() const {
    return positions_.size();
}

std::size_t AabbPhysicsBridge::GeometryColliderCount() const {
    return geometry_colliders_.size();
}

std::size_t AabbPhysicsBridge::OverlapQueryCount() const {
    return overlap_query_count_;
}

}  // namespace skirmish::sim
