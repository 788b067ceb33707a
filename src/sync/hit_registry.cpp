#include "sync/hit_registry.h"

namespace skirmish::sync {

void HitRegistry::Open(std::string_view attack_id) {
    hits_by_attack_[std::string(attack_id)] = {};
}

void HitRegistry::Close(std::string_view attack_id) {
    hits_by_attack_.erase(std::string(attack_id));
}

void HitRegistry::Clear() {
    hits_by_attack_.clear();
}

bool HitRegistry::CanHit(std::string_view attack_id, std::string_view target_id) {
    const auto iter = hits_by_attack_.find(std::string(attack_id));
    if (iter == hits_by_attack_.end()) {
        return false;
    }
    return iter->second.insert(std::string(target_id)).second;
}

bool HitRegistry::IsOpen(std::string_view attack_id) const {
    return hits_by_attack_.contains(std::string(attack_id));
}

std::size_t HitRegistry::HitCount(std::string_view attack_id) const {
    const auto iter = hits_by_attack_.find(std::string(attack_id));
    if (iter == hits_by_attack_.end()) {
        return 0;
    }
    return iter->second.size();
}

std::size_t HitRegistry::OpenAttackCount() const {
    return hits_by_attack_.size();
}

}  // namespace skirmish::sync
