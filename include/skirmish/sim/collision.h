#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace skirmish::sim {

struct Aabb final {
    float center_x = 0.0F;
    float center_y = 0.0F;
    float half_width = 0.0F;
    float half_height = 0.0F;
};

Aabb MakeCenteredAabb(float center_x, float center_y, float width, float height);

// Touching edges do not count as an overlap.
bool Overlaps(const Aabb& lhs, const Aabb& rhs);

struct BridgePosition final {
    float x = 0.0F;
    float y = 0.0F;
};

// Engine-side collision and movement services. The reconciliation core asks
// overlap questions and reports positions; it never integrates participants.
class IPhysicsBridge {
public:
    virtual ~IPhysicsBridge() = default;

    virtual bool Overlaps(const Aabb& lhs, const Aabb& rhs) const = 0;
    virtual void MoveTo(std::string_view participant_id, float x, float y) = 0;
    virtual void RegisterGeometryCollider(std::string_view participant_id) = 0;
    virtual void ReleaseParticipant(std::string_view participant_id) = 0;
};

class AabbPhysicsBridge final : public IPhysicsBridge {
public:
    bool Overlaps(const Aabb& lhs, const Aabb& rhs) const override;
    void MoveTo(std::string_view participant_id, float x, float y) override;
    void RegisterGeometryCollider(std::string_view participant_id) override;
    void ReleaseParticipant(std::string_view participant_id) override;

    bool TryGetPosition(std::string_view participant_id, BridgePosition& out_position) const;
    bool HasGeometryCollider(std::string_view participant_id) const;
    std::size_t TrackedParticipantCount() const;
    std::size_t GeometryColliderCount() const;
    std::size_t OverlapQueryCount() const;

private:
    std::unordered_map<std::string, BridgePosition> positions_;
    std::unordered_set<std::string> geometry_colliders_;
    mutable std::size_t overlap_query_count_ = 0;
};

}  // namespace skirmish::sim
