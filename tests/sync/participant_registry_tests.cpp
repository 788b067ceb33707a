#include "sync/participant_registry.h"

#include <iostream>
#include <string>

namespace {

bool Expect(bool condition, const char* message) {
    if (!condition) {
        std::cerr << "[FAIL] " << message << '\n';
        return false;
    }
    return true;
}

skirmish::session::RosterEntry Entry(const std::string& account, double x, double y) {
    return skirmish::session::RosterEntry{.account = account, .x = x, .y = y};
}

}  // namespace

int main() {
    bool passed = true;
    using namespace skirmish;

    const core::EngineConfig config{};
    sync::ColorAllocator colors;
    sync::HealthOverlay overlay;
    sim::AabbPhysicsBridge physics;
    sync::ParticipantRegistry registry(config, colors, overlay, physics);
    registry.SetLocalId("local");

    session::RosterSnapshot snapshot{
        Entry("local", 5.0, 5.0),
        Entry("p1", 100.0, 100.0),
        {.account = "p2", .x = 200.0, .y = 200.0, .name = "Archer", .health = 70},
    };
    sync::RosterApplyResult result = registry.ApplyRosterSnapshot(snapshot, false);
    passed &= Expect(result.created_count == 2, "Two remote participants should be created.");
    passed &= Expect(!registry.Contains("local"), "Local id should never be stored.");
    passed &= Expect(registry.Size() == 2, "Registry should hold the non-local ids.");

    const sync::Participant* p1 = registry.Find("p1");
    const sync::Participant* p2 = registry.Find("p2");
    passed &= Expect(p1 != nullptr && p2 != nullptr, "Created participants should be found.");
    if (p1 != nullptr && p2 != nullptr) {
        passed &= Expect(p1->health == 100, "Missing health should default to 100.");
        passed &= Expect(p1->name == "Unknown", "Missing name should use a placeholder.");
        passed &= Expect(p2->health == 70, "Snapshot health should be used.");
        passed &= Expect(p1->color_index == 1 && p2->color_index == 2, "Colors should follow the scan order.");
    }
    passed &= Expect(physics.HasGeometryCollider("p1") == false, "Colliders wait for geometry.");

    int new_health = 0;
    passed &= Expect(registry.ApplyLocalDamage("p1", 10, new_health), "Known participant should take damage.");
    passed &= Expect(new_health == 90, "Damage should reduce health.");
    passed &= Expect(overlay.Resolve("p1", 100) == 90, "Damage should be recorded in the overlay.");
    passed &= Expect(!registry.ApplyLocalDamage("ghost", 10, new_health), "Unknown id should not take damage.");

    snapshot = {
        {.account = "p1", .x = 150.0, .y = 120.0, .health = 100},
        {.account = "p2", .x = 210.0, .y = 200.0, .health = 20},
        {.x = 1.0, .y = 1.0},
    };
    result = registry.ApplyRosterSnapshot(snapshot, true);
    passed &= Expect(result.updated_count == 2, "Both participants should be updated.");
    passed &= Expect(result.skipped_malformed_count == 1, "Entry without account should be skipped.");
    p1 = registry.Find("p1");
    p2 = registry.Find("p2");
    if (p1 != nullptr && p2 != nullptr) {
        passed &= Expect(p1->x == 150.0F && p1->y == 120.0F, "Position should be last-write-wins.");
        passed &= Expect(p1->health == 90, "Overlay should beat the snapshot health.");
        passed &= Expect(p2->health == 20, "Participants without overlay should follow the snapshot.");
    }
    sim::BridgePosition position{};
    passed &= Expect(
        physics.TryGetPosition("p1", position) && position.x == 150.0F,
        "Updated position should reach the physics bridge.");

    snapshot = {
        Entry("p2", 210.0, 200.0),
        {.account = "p3", .x = std::nullopt, .y = 50.0},
    };
    result = registry.ApplyRosterSnapshot(snapshot, true);
    passed &= Expect(result.removed_count == 1, "Absent participant should be removed.");
    passed &= Expect(!registry.Contains("p1"), "p1 should be gone.");
    passed &= Expect(!overlay.Contains("p1"), "Departure should drop the overlay entry.");
    passed &= Expect(!physics.TryGetPosition("p1", position), "Departure should release physics state.");
    passed &= Expect(!registry.Contains("p3"), "Entry without a position should not be created.");
    passed &= Expect(result.skipped_malformed_count == 1, "Entry without a position should be counted.");

    snapshot = {Entry("p1", 10.0, 10.0), Entry("p2", 210.0, 200.0)};
    result = registry.ApplyRosterSnapshot(snapshot, true);
    p1 = registry.Find("p1");
    passed &= Expect(p1 != nullptr && p1->health == 100, "Reintroduced participant should use the snapshot.");
    // "p1" hashes to departure slot 2, so its exit freed p2's color.
    passed &= Expect(
        p1 != nullptr && p1->color_index == 2 && colors.IsInUse(1),
        "Departure should release the hash-derived slot.");
    passed &= Expect(physics.HasGeometryCollider("p1"), "Late joiner should collide with existing geometry.");

    snapshot = {Entry("p2", 210.0, 200.0), {.account = "p1", .y = 4.0}};
    result = registry.ApplyRosterSnapshot(snapshot, true);
    passed &= Expect(
        registry.Contains("p1") && result.removed_count == 0,
        "Malformed entry should not remove an existing participant.");

    registry.ApplyRosterSnapshot({}, true);
    passed &= Expect(registry.Size() == 0, "Empty snapshot should clear the registry.");

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] skirmish_participant_registry_tests\n";
    return 0;
}
