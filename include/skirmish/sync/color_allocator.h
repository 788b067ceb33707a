#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace skirmish::sync {

// Cosmetic color slots for remote participants. Slots 1..8 are handed out by
// linear scan; once all are taken, indices come from a hash of the id and may
// collide with slots already in use.
class ColorAllocator final {
public:
    static constexpr int kFirstIndex = 1;
    static constexpr int kSlotCount = 8;

    int Allocate(std::string_view participant_id);
    void Release(int color_index);
    void Clear();

    bool IsInUse(int color_index) const;
    std::size_t InUseCount() const;

    // Polynomial rolling hash (h * 31 + c) with 32-bit wraparound.
    static std::int32_t HashId(std::string_view participant_id);

    // Slot recomputed from the id when a participant departs. This is not the
    // slot Allocate returned when the scan path was taken, so a departure can
    // free a slot that belongs to someone else; the result may also fall
    // outside [1,8] for negative hashes, in which case nothing is freed.
    static int DepartureIndex(std::string_view participant_id);

private:
    std::array<bool, kSlotCount> in_use_{};
};

}  // namespace skirmish::sync
