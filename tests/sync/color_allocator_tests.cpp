#include "sync/color_allocator.h"

#include <iostream>
#include <set>
#include <string>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

}  // namespace

int main() {
    bool passed = true;
    using skirmish::sync::ColorAllocator;

    passed &= Expect(ColorAllocator::HashId("") == 0, "Empty id should hash to zero.");
    passed &= Expect(ColorAllocator::HashId("a") == 97, "Single character hash should be its code.");
    passed &= Expect(ColorAllocator::HashId("ab") == 97 * 31 + 98, "Hash should multiply by 31 per step.");
    passed &= Expect(
        ColorAllocator::HashId("player_with_a_long_account_name") < 0,
        "Long ids should wrap into negative 32-bit values.");

    ColorAllocator allocator;
    std::set<int> assigned;
    for (int index = 0; index < ColorAllocator::kSlotCount; ++index) {
        const int color = allocator.Allocate("remote_" + std::to_string(index));
        passed &= Expect(color >= 1 && color <= 8, "Scan-path color should be in [1,8].");
        assigned.insert(color);
    }
    passed &= Expect(assigned.size() == 8, "Eight scan-path colors should be pairwise distinct.");
    passed &= Expect(allocator.InUseCount() == 8, "All slots should be in use.");

    const int fallback = allocator.Allocate("ninth");
    passed &= Expect(fallback == 104824775 % 8 + 1, "Fallback color should come from the id hash.");
    passed &= Expect(allocator.InUseCount() == 8, "Fallback color should not be marked in use.");

    const int negative_fallback = allocator.Allocate("player_with_a_long_account_name");
    passed &= Expect(negative_fallback == 2, "Negative hashes should map through abs on allocation.");

    allocator.Release(0);
    allocator.Release(9);
    passed &= Expect(allocator.InUseCount() == 8, "Out-of-range release should be ignored.");

    allocator.Release(3);
    passed &= Expect(!allocator.IsInUse(3), "Released slot should be free.");
    passed &= Expect(allocator.Allocate("late") == 3, "Scan should reuse the lowest free slot.");

    // Departure recomputes the slot from the id instead of recalling the
    // assigned one.
    ColorAllocator departures;
    const int first = departures.Allocate("a");
    passed &= Expect(first == 1, "First allocation should take slot 1.");
    passed &= Expect(ColorAllocator::DepartureIndex("a") == 97 % 8 + 1, "Departure index should be hash % 8 + 1.");
    departures.Release(ColorAllocator::DepartureIndex("a"));
    passed &= Expect(departures.IsInUse(1), "Departure should leave the scan-assigned slot in use.");

    const int negative_departure = ColorAllocator::DepartureIndex("player_with_a_long_account_name");
    passed &= Expect(negative_departure == 0, "Negative hash departure index should fall outside [1,8].");

    departures.Clear();
    passed &= Expect(departures.InUseCount() == 0, "Clear should free every slot.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] skirmish_color_allocator_tests\n";
    return 0;
}
