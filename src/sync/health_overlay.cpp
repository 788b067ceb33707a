#include "sync/health_overlay.h"

namespace skirmish::sync {

void HealthOverlay::RecordLocalDamage(std::string_view participant_id, int new_health) {
    health_by_id_[std::string(participant_id)] = new_health;
}

int HealthOverlay::Resolve(std::string_view participant_id, int snapshot_health) const {
    const auto iter = health_by_id_.find(std::string(participant_id));
    if (iter == health_by_id_.end()) {
        return snapshot_health;
    }
    return iter->second;
}

void HealthOverlay::Clear(std::string_view participant_id) {
    health_by_id_.erase(std::string(participant_id));
}

void HealthOverlay::Reset() {
    health_by_id_.clear();
}

bool HealthOverlay::Contains(std::string_view participant_id) const {
    return health_by_id_.contains(std::string(participant_id));
}

std::size_t HealthOverlay::Size() const {
    return health_by_id_.size();
}

}  // namespace skirmish::sync
