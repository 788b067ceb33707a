#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace skirmish::sync {

// Locally observed health that shadows server-reported health. Once an entry
// exists it wins over every later snapshot for that participant, including
// snapshots that report healing or third-party damage, until the participant
// leaves the roster.
class HealthOverlay final {
public:
    void RecordLocalDamage(std::string_view participant_id, int new_health);
    int Resolve(std::string_view participant_id, int snapshot_health) const;
    void Clear(std::string_view participant_id);
    void Reset();

    bool Contains(std::string_view participant_id) const;
    std::size_t Size() const;

private:
    std::unordered_map<std::string, int> health_by_id_;
};

}  // namespace skirmish::sync
