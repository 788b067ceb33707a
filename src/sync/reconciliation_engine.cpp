#include "sync/reconciliation_engine.h"

#include "core/logger.h"

#include <algorithm>
#include <utility>

namespace skirmish::sync {

ReconciliationEngine::ReconciliationEngine(
    const core::EngineConfig& config,
    sim::IPhysicsBridge& physics)
    : config_(config),
      physics_(physics),
      participants_(config_, color_allocator_, health_overlay_, physics_),
      world_(config_, physics_),
      ephemera_(config_, scheduled_tasks_, hit_registry_, physics_),
      powerups_(config_, physics_),
      outbound_(config_),
      spawn_rng_(config_.respawn_seed) {}

ReconciliationEngine::~ReconciliationEngine() {
    Leave();
}

bool ReconciliationEngine::Join(session::ISessionChannel& session, std::string& out_error) {
    if (joined_) {
        out_error = "Reconciliation engine already joined a session.";
        return false;
    }

    if (!core::ConfigLoader::Validate(config_, out_error)) {
        out_error = "Invalid engine config: " + out_error;
        return false;
    }

    const std::string account = session.Account();
    if (account.empty()) {
        out_error = "Session account is empty.";
        return false;
    }

    session_ = &session;
    session_token_ = std::make_shared<int>(0);
    joined_ = true;

    local_ = Participant{};
    local_.id = account;
    local_.name = config_.player_name;
    local_.health = config_.max_health;
    local_.color_index = 0;
    participants_.SetLocalId(account);
    PlaceLocalAtRandomSpawn();

    SubscribeSessionChannels();
    outbound_.PushNow(now_ms_, local_, session);
    ++diagnostics_.position_pushes;

    core::Logger::Info(
        "session",
        "Joined room '" + config_.room_id + "' as " + account + ".");
    out_error.clear();
    return true;
}

void ReconciliationEngine::Leave() {
    if (!joined_) {
        return;
    }

    session_token_.reset();
    scheduled_tasks_.Clear();
    ephemera_.Clear();
    hit_registry_.Clear();
    participants_.Clear();
    health_overlay_.Reset();
    color_allocator_.Clear();
    world_.Reset();
    powerups_.Clear();
    outbound_.Reset();
    physics_.ReleaseParticipant(local_.id);

    core::Logger::Info("session", "Left room '" + config_.room_id + "' as " + local_.id + ".");
    local_ = Participant{};
    attack_cooldown_ = false;
    speed_boost_until_ms_ = 0;
    session_ = nullptr;
    joined_ = false;
}

bool ReconciliationEngine::IsJoined() const {
    return joined_;
}

void ReconciliationEngine::MarkWorldReady() {
    world_.MarkResourcesReady();
}

void ReconciliationEngine::SetLocalMotion(float x, float y, int facing) {
    if (!joined_) {
        return;
    }

    local_.x = x;
    local_.y = y;
    local_.facing = facing < 0 ? kFacingLeft : kFacingRight;
    physics_.MoveTo(local_.id, x, y);
}

bool ReconciliationEngine::RequestAttack() {
    if (!joined_) {
        ++diagnostics_.premature_invocations;
        core::Logger::Warn("combat", "Attack requested outside a session.");
        return false;
    }

    if (attack_cooldown_) {
        ++diagnostics_.attacks_rejected_cooldown;
        return false;
    }

    attack_cooldown_ = true;
    const std::string attack_id = "attack_" + local_.id + "_" + std::to_string(now_ms_);
    const AttackEvent attack = ephemera_.SpawnAttack(
        attack_id,
        local_.id,
        local_.x,
        local_.y,
        local_.facing,
        now_ms_);

    CallRemote(
        session::kCallPlayerAttack,
        session::EncodePlayerAttack(session::PlayerAttackMessage{
            .id = attack.id,
            .x = attack.origin_x,
            .y = attack.origin_y,
            .direction = attack.direction,
            .owner_id = local_.id,
            .owner_name = local_.name,
        }));

    scheduled_tasks_.Schedule(
        now_ms_ + static_cast<std::uint64_t>(config_.attack_cooldown_ms),
        [this]() { attack_cooldown_ = false; });
    return true;
}

bool ReconciliationEngine::FireProjectile(float target_x, float target_y) {
    if (!joined_) {
        ++diagnostics_.premature_invocations;
        core::Logger::Warn("combat", "Projectile fired outside a session.");
        return false;
    }

    ++projectile_sequence_;
    const std::string projectile_id = "projectile_" + local_.id + "_" +
        std::to_string(now_ms_) + "_" + std::to_string(projectile_sequence_);
    const ProjectileSpec spec{
        .id = projectile_id,
        .owner_id = local_.id,
        .origin_x = local_.x,
        .origin_y = local_.y,
        .target_x = target_x,
        .target_y = target_y,
    };
    if (!ephemera_.SpawnProjectile(spec, now_ms_)) {
        return false;
    }

    CallRemote(
        session::kCallFireProjectile,
        session::EncodeProjectileFired(session::ProjectileFiredMessage{
            .x = spec.origin_x,
            .y = spec.origin_y,
            .target_x = target_x,
            .target_y = target_y,
            .id = spec.id,
            .owner_id = spec.owner_id,
        }));
    return true;
}

void ReconciliationEngine::ApplyRosterPayload(wire::ByteSpan payload) {
    session::RosterSnapshot snapshot;
    if (!session::TryDecodeRosterSnapshot(payload, snapshot)) {
        ++diagnostics_.malformed_messages_skipped;
        core::Logger::Warn("roster", "Dropped undecodable roster snapshot.");
        return;
    }
    ApplyRosterSnapshot(snapshot);
}

void ReconciliationEngine::ApplyRosterSnapshot(const session::RosterSnapshot& snapshot) {
    if (!joined_) {
        ++diagnostics_.premature_invocations;
        core::Logger::Warn("roster", "Roster snapshot arrived outside a session.");
        return;
    }

    const RosterApplyResult result =
        participants_.ApplyRosterSnapshot(snapshot, world_.IsBootstrapped());
    diagnostics_.malformed_entries_skipped += result.skipped_malformed_count;
}

void ReconciliationEngine::ApplyRoomStatePayload(wire::ByteSpan payload) {
    session::RoomState state;
    if (!session::TryDecodeRoomState(payload, state)) {
        ++diagnostics_.malformed_messages_skipped;
        core::Logger::Warn("world", "Dropped undecodable room state.");
        return;
    }
    ApplyRoomState(state);
}

void ReconciliationEngine::ApplyRoomState(const session::RoomState& state) {
    if (!joined_) {
        ++diagnostics_.premature_invocations;
        core::Logger::Warn("world", "Room state arrived outside a session.");
        return;
    }

    if (state.powerups.has_value()) {
        if (!world_.ResourcesReady()) {
            ++diagnostics_.premature_invocations;
            core::Logger::Warn("powerup", "Powerup sync arrived before world resources were ready.");
        } else {
            diagnostics_.malformed_entries_skipped += powerups_.SyncFromRoomState(*state.powerups);
        }
    }

    if (!state.obstacles.has_value()) {
        return;
    }

    if (world_.IsBootstrapped()) {
        ++diagnostics_.ignored_bootstrap_attempts;
        return;
    }

    const std::size_t skipped_before = world_.SkippedObstacleCount();
    const BootstrapOutcome outcome =
        world_.TryBootstrap(*state.obstacles, KnownParticipantIds());
    switch (outcome) {
        case BootstrapOutcome::Materialized:
            diagnostics_.malformed_entries_skipped +=
                world_.SkippedObstacleCount() - skipped_before;
            break;
        case BootstrapOutcome::AlreadyBootstrapped:
            ++diagnostics_.ignored_bootstrap_attempts;
            break;
        case BootstrapOutcome::ResourcesNotReady:
            ++diagnostics_.premature_invocations;
            core::Logger::Warn(
                "world",
                std::string("Obstacle data dropped: ") + BootstrapOutcomeName(outcome) + ".");
            break;
    }
}

void ReconciliationEngine::Tick(const sim::TickContext& tick_context) {
    now_ms_ = tick_context.now_ms;
    if (!joined_) {
        return;
    }

    scheduled_tasks_.RunDue(now_ms_);

    const EphemeralTickResult ephemeral_result =
        ephemera_.Tick(tick_context, world_, local_.id, LocalBounds());
    diagnostics_.projectile_geometry_collisions += ephemeral_result.geometry_collision_count;
    diagnostics_.projectiles_expired += ephemeral_result.expired_count;
    for (const ProjectileHit& hit : ephemeral_result.local_hits) {
        ++diagnostics_.projectile_hits_taken;
        HandlePlayerHit(local_.id, hit.owner_id, hit.projectile_id);
    }

    RunMeleeHitChecks();
    RunPowerupPickup();

    if (outbound_.MaybePush(now_ms_, local_, *session_)) {
        ++diagnostics_.position_pushes;
    }
}

const Participant& ReconciliationEngine::LocalParticipant() const {
    return local_;
}

const ParticipantRegistry& ReconciliationEngine::Participants() const {
    return participants_;
}

const HealthOverlay& ReconciliationEngine::Overlay() const {
    return health_overlay_;
}

const HitRegistry& ReconciliationEngine::Hits() const {
    return hit_registry_;
}

const ColorAllocator& ReconciliationEngine::Colors() const {
    return color_allocator_;
}

const WorldBootstrapGuard& ReconciliationEngine::World() const {
    return world_;
}

const EphemeralEntityManager& ReconciliationEngine::Ephemera() const {
    return ephemera_;
}

const PowerupRegistry& ReconciliationEngine::Powerups() const {
    return powerups_;
}

const ScheduledTaskList& ReconciliationEngine::ScheduledTasks() const {
    return scheduled_tasks_;
}

bool ReconciliationEngine::AttackOnCooldown() const {
    return attack_cooldown_;
}

bool ReconciliationEngine::SpeedBoostActive() const {
    return now_ms_ < speed_boost_until_ms_;
}

std::uint64_t ReconciliationEngine::NowMs() const {
    return now_ms_;
}

RenderView ReconciliationEngine::BuildRenderView() const {
    RenderView view{};
    if (!joined_) {
        return view;
    }

    view.participants.push_back(RenderParticipant{
        .id = local_.id,
        .name = local_.name,
        .x = local_.x,
        .y = local_.y,
        .facing = local_.facing,
        .health = local_.health,
        .color_index = local_.color_index,
        .is_local = true,
    });
    participants_.ForEach([&view](const Participant& participant) {
        view.participants.push_back(RenderParticipant{
            .id = participant.id,
            .name = participant.name,
            .x = participant.x,
            .y = participant.y,
            .facing = participant.facing,
            .health = participant.health,
            .color_index = participant.color_index,
            .is_local = false,
        });
    });

    view.projectiles = ephemera_.Projectiles();
    view.local_attack = ephemera_.ActiveAttack(local_.id);
    view.geometry = world_.Blocks();
    view.powerups = powerups_.Powerups();
    view.speed_boost_active = SpeedBoostActive();
    return view;
}

EngineDiagnostics ReconciliationEngine::Diagnostics() const {
    return diagnostics_;
}

void ReconciliationEngine::SubscribeSessionChannels() {
    const std::weak_ptr<int> token = session_token_;
    session_->Subscribe(
        config_.room_id,
        session::kEventProjectileFired,
        [this, token](wire::ByteSpan payload) {
            if (token.expired()) {
                return;
            }
            HandleProjectileFired(payload);
        });
    session_->Subscribe(
        config_.room_id,
        session::kEventPowerupSpawned,
        [this, token](wire::ByteSpan payload) {
            if (token.expired()) {
                return;
            }
            HandlePowerupSpawned(payload);
        });
    session_->SubscribeState(
        config_.room_id,
        [this, token](wire::ByteSpan encoded_state) {
            if (token.expired()) {
                return;
            }
            ApplyRoomStatePayload(encoded_state);
        });
}

void ReconciliationEngine::HandleProjectileFired(wire::ByteSpan payload) {
    if (!world_.ResourcesReady()) {
        ++diagnostics_.premature_invocations;
        core::Logger::Warn("combat", "Projectile event arrived before world resources were ready.");
        return;
    }

    session::ProjectileFiredMessage message;
    if (!session::TryDecodeProjectileFired(payload, message)) {
        ++diagnostics_.malformed_messages_skipped;
        core::Logger::Warn("combat", "Dropped malformed projectileFired event.");
        return;
    }

    // Our own projectiles were created when they were fired.
    if (message.owner_id == local_.id) {
        ++diagnostics_.self_projectile_echoes_ignored;
        return;
    }

    ephemera_.SpawnProjectile(
        ProjectileSpec{
            .id = message.id,
            .owner_id = message.owner_id,
            .origin_x = static_cast<float>(message.x),
            .origin_y = static_cast<float>(message.y),
            .target_x = static_cast<float>(message.target_x),
            .target_y = static_cast<float>(message.target_y),
        },
        now_ms_);
}

void ReconciliationEngine::HandlePowerupSpawned(wire::ByteSpan payload) {
    if (!world_.ResourcesReady()) {
        ++diagnostics_.premature_invocations;
        core::Logger::Warn("powerup", "Powerup event arrived before world resources were ready.");
        return;
    }

    session::PowerupSpawnedMessage message;
    if (!session::TryDecodePowerupSpawned(payload, message)) {
        ++diagnostics_.malformed_messages_skipped;
        core::Logger::Warn("powerup", "Dropped malformed powerupSpawned event.");
        return;
    }

    powerups_.Spawn(message);
}

void ReconciliationEngine::RunMeleeHitChecks() {
    const std::optional<AttackEvent> attack = ephemera_.ActiveAttack(local_.id);
    if (!attack.has_value()) {
        return;
    }

    // Ids are copied up front; the roster may change between two checks.
    for (const std::string& participant_id : participants_.Ids()) {
        const Participant* participant = participants_.Find(participant_id);
        if (participant == nullptr) {
            continue;
        }
        if (!physics_.Overlaps(attack->hitbox, participants_.BoundsOf(*participant))) {
            continue;
        }
        if (!hit_registry_.CanHit(attack->id, participant_id)) {
            ++diagnostics_.melee_hits_deduplicated;
            continue;
        }

        ++diagnostics_.melee_hits_applied;
        core::Logger::Info("combat", "Hitbox collision with participant " + participant_id + ".");
        HandlePlayerHit(participant_id, local_.id, kMeleeProjectileId);
    }
}

void ReconciliationEngine::RunPowerupPickup() {
    if (!world_.ResourcesReady() || powerups_.Size() == 0) {
        return;
    }

    for (const Powerup& powerup : powerups_.CollectOverlapping(LocalBounds())) {
        if (powerup.type == session::kPowerupTypeHealth) {
            local_.health = std::min(config_.max_health, local_.health + config_.powerup_heal_amount);
        } else if (powerup.type == session::kPowerupTypeSpeed) {
            speed_boost_until_ms_ =
                now_ms_ + static_cast<std::uint64_t>(config_.speed_boost_duration_ms);
        }

        ++diagnostics_.powerups_collected;
        CallRemote(
            session::kCallCollectPowerup,
            session::EncodeCollectPowerup(session::CollectPowerupMessage{.id = powerup.id}));
    }
}

void ReconciliationEngine::HandlePlayerHit(
    const std::string& target_id,
    const std::string& attacker_id,
    std::string_view projectile_id) {
    if (target_id == local_.id) {
        local_.health = ClampHealth(local_.health - config_.hit_damage);
        core::Logger::Info(
            "combat",
            "Local participant hit by " + attacker_id + ", health=" +
                std::to_string(local_.health) + ".");
        if (local_.health <= 0) {
            HandleLocalDeath(attacker_id);
        }
    } else {
        int new_health = 0;
        if (participants_.ApplyLocalDamage(target_id, config_.hit_damage, new_health)) {
            core::Logger::Info(
                "combat",
                "Participant " + target_id + " hit, overlay health=" +
                    std::to_string(new_health) + ".");
        }
    }

    CallRemote(
        session::kCallPlayerHit,
        session::EncodePlayerHit(session::PlayerHitMessage{
            .target_id = target_id,
            .attacker_id = attacker_id,
            .projectile_id = std::string(projectile_id),
            .damage = config_.hit_damage,
        }));
}

void ReconciliationEngine::HandleLocalDeath(const std::string& killer_id) {
    ++diagnostics_.local_deaths;
    PlaceLocalAtRandomSpawn();
    local_.health = config_.max_health;
    core::Logger::Info("combat", "Local participant killed by " + killer_id + ", respawned.");

    CallRemote(
        session::kCallPlayerDied,
        session::EncodePlayerDied(session::PlayerDiedMessage{
            .player_id = local_.id,
            .killer_id = killer_id,
        }));
}

void ReconciliationEngine::PlaceLocalAtRandomSpawn() {
    std::uniform_int_distribution<int> distribution(config_.respawn_min, config_.respawn_max);
    local_.x = static_cast<float>(distribution(spawn_rng_));
    local_.y = static_cast<float>(distribution(spawn_rng_));
    physics_.MoveTo(local_.id, local_.x, local_.y);
}

std::vector<std::string> ReconciliationEngine::KnownParticipantIds() const {
    std::vector<std::string> ids;
    ids.push_back(local_.id);
    const std::vector<std::string> remote_ids = participants_.Ids();
    ids.insert(ids.end(), remote_ids.begin(), remote_ids.end());
    return ids;
}

sim::Aabb ReconciliationEngine::LocalBounds() const {
    return sim::MakeCenteredAabb(
        local_.x,
        local_.y,
        static_cast<float>(config_.participant_width),
        static_cast<float>(config_.participant_height));
}

void ReconciliationEngine::CallRemote(std::string_view name, const wire::ByteBuffer& args) {
    if (!joined_ || session_ == nullptr) {
        return;
    }
    session_->Call(name, wire::AsSpan(args), session::CallOptions{});
}

}  // namespace skirmish::sync
