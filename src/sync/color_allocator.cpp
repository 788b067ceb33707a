#include "sync/color_allocator.h"

#include <algorithm>
#include <cstdlib>

namespace skirmish::sync {

int ColorAllocator::Allocate(std::string_view participant_id) {
    for (int slot = 0; slot < kSlotCount; ++slot) {
        if (!in_use_[static_cast<std::size_t>(slot)]) {
            in_use_[static_cast<std::size_t>(slot)] = true;
            return slot + kFirstIndex;
        }
    }

    // Fallback indices are not marked as used.
    return std::abs(HashId(participant_id) % kSlotCount) + kFirstIndex;
}

void ColorAllocator::Release(int color_index) {
    const int slot = color_index - kFirstIndex;
    if (slot < 0 || slot >= kSlotCount) {
        return;
    }
    in_use_[static_cast<std::size_t>(slot)] = false;
}

void ColorAllocator::Clear() {
    in_use_.fill(false);
}

bool ColorAllocator::IsInUse(int color_index) const {
    const int slot = color_index - kFirstIndex;
    if (slot < 0 || slot >= kSlotCount) {
        return false;
    }
    return in_use_[static_cast<std::size_t>(slot)];
}

std::size_t ColorAllocator::InUseCount() const {
    return static_cast<std::size_t>(std::count(in_use_.begin(), in_use_.end(), true));
}

std::int32_t ColorAllocator::HashId(std::string_view participant_id) {
    std::uint32_t hash = 0;
    for (const char ch : participant_id) {
        hash = (hash << 5U) - hash + static_cast<unsigned char>(ch);
    }
    return static_cast<std::int32_t>(hash);
}

int ColorAllocator::DepartureIndex(std::string_view participant_id) {
    return HashId(participant_id) % kSlotCount + kFirstIndex;
}

}  // namespace skirmish::sync
