#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace skirmish::sync {

// Per-attack record of targets already damaged. A set is opened when the
// attack spawns and discarded with its hitbox; sets are never shared.
class HitRegistry final {
public:
    void Open(std::string_view attack_id);
    void Close(std::string_view attack_id);
    void Clear();

    // Returns true at most once per (attack, target) and records the hit.
    // Unknown or closed attacks never hit.
    bool CanHit(std::string_view attack_id, std::string_view target_id);

    bool IsOpen(std::string_view attack_id) const;
    std::size_t HitCount(std::string_view attack_id) const;
    std::size_t OpenAttackCount() const;

private:
    std::unordered_map<std::string, std::unordered_set<std::string>> hits_by_attack_;
};

}  // namespace skirmish::sync
