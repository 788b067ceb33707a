#pragma once

#include "core/config.h"
#include "session/message_schema.h"
#include "session/session_channel.h"
#include "sim/collision.h"
#include "sim/tick_context.h"
#include "sync/color_allocator.h"
#include "sync/ephemeral_entities.h"
#include "sync/health_overlay.h"
#include "sync/hit_registry.h"
#include "sync/outbound_sync.h"
#include "sync/participant.h"
#include "sync/participant_registry.h"
#include "sync/powerup_registry.h"
#include "sync/scheduled_tasks.h"
#include "sync/world_bootstrap.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::sync {

inline constexpr std::string_view kMeleeProjectileId = "melee_attack";

struct RenderParticipant final {
    std::string id;
    std::string name;
    float x = 0.0F;
    float y = 0.0F;
    int facing = kFacingRight;
    int health = 0;
    int color_index = 0;
    bool is_local = false;
};

struct RenderView final {
    std::vector<RenderParticipant> participants;
    std::vector<ProjectileView> projectiles;
    std::optional<AttackEvent> local_attack;
    std::vector<GeometryBlock> geometry;
    std::vector<Powerup> powerups;
    bool speed_boost_active = false;
};

struct EngineDiagnostics final {
    std::uint64_t melee_hits_applied = 0;
    std::uint64_t melee_hits_deduplicated = 0;
    std::uint64_t projectile_hits_taken = 0;
    std::uint64_t projectile_geometry_collisions = 0;
    std::uint64_t projectiles_expired = 0;
    std::uint64_t self_projectile_echoes_ignored = 0;
    std::uint64_t local_deaths = 0;
    std::uint64_t attacks_rejected_cooldown = 0;
    std::uint64_t malformed_messages_skipped = 0;
    std::uint64_t malformed_entries_skipped = 0;
    std::uint64_t premature_invocations = 0;
    std::uint64_t ignored_bootstrap_attempts = 0;
    std::uint64_t powerups_collected = 0;
    std::uint64_t position_pushes = 0;
};

// Per-session context that merges local combat effects with server pushes.
// All entry points run on one logic thread; inbound handlers may land between
// any two ticks.
class ReconciliationEngine final {
public:
    ReconciliationEngine(const core::EngineConfig& config, sim::IPhysicsBridge& physics);
    ~ReconciliationEngine();

    ReconciliationEngine(const ReconciliationEngine&) = delete;
    ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;

    bool Join(session::ISessionChannel& session, std::string& out_error);
    void Leave();
    bool IsJoined() const;
    void MarkWorldReady();

    void SetLocalMotion(float x, float y, int facing);
    bool RequestAttack();
    bool FireProjectile(float target_x, float target_y);

    void ApplyRosterPayload(wire::ByteSpan payload);
    void ApplyRosterSnapshot(const session::RosterSnapshot& snapshot);
    void ApplyRoomStatePayload(wire::ByteSpan payload);
    void ApplyRoomState(const session::RoomState& state);

    void Tick(const sim::TickContext& tick_context);

    const Participant& LocalParticipant() const;
    const ParticipantRegistry& Participants() const;
    const HealthOverlay& Overlay() const;
    const HitRegistry& Hits() const;
    const ColorAllocator& Colors() const;
    const WorldBootstrapGuard& World() const;
    const EphemeralEntityManager& Ephemera() const;
    const PowerupRegistry& Powerups() const;
    const ScheduledTaskList& ScheduledTasks() const;
    bool AttackOnCooldown() const;
    bool SpeedBoostActive() const;
    std::uint64_t NowMs() const;
    RenderView BuildRenderView() const;
    EngineDiagnostics Diagnostics() const;

private:
    void SubscribeSessionChannels();
    void HandleProjectileFired(wire::ByteSpan payload);
    void HandlePowerupSpawned(wire::ByteSpan payload);
    void RunMeleeHitChecks();
    void RunPowerupPickup();
    void HandlePlayerHit(
        const std::string& target_id,
        const std::string& attacker_id,
        std::string_view projectile_id);
    void HandleLocalDeath(const std::string& killer_id);
    void PlaceLocalAtRandomSpawn();
    std::vector<std::string> KnownParticipantIds() const;
    sim::Aabb LocalBounds() const;
    void CallRemote(std::string_view name, const wire::ByteBuffer& args);

    const core::EngineConfig config_;
    sim::IPhysicsBridge& physics_;
    session::ISessionChannel* session_ = nullptr;
    // Handlers registered with the session hold a weak reference to this
    // token; Leave() resets it so late deliveries become no-ops.
    std::shared_ptr<int> session_token_;
    bool joined_ = false;
    std::uint64_t now_ms_ = 0;

    Participant local_{};
    ColorAllocator color_allocator_{};
    HealthOverlay health_overlay_{};
    HitRegistry hit_registry_{};
    ScheduledTaskList scheduled_tasks_{};
    ParticipantRegistry participants_;
    WorldBootstrapGuard world_;
    EphemeralEntityManager ephemera_;
    PowerupRegistry powerups_;
    OutboundSyncScheduler outbound_;

    bool attack_cooldown_ = false;
    std::uint64_t speed_boost_until_ms_ = 0;
    std::uint64_t projectile_sequence_ = 0;
    std::mt19937_64 spawn_rng_;
    EngineDiagnostics diagnostics_{};
};

}  // namespace skirmish::sync
