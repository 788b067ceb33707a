#include "core/cfg_parser.h"
#include "core/config.h"
#include "core/logger.h"
#include "session/message_schema.h"
#include "session/session_channel_stub.h"
#include "sim/collision.h"
#include "sync/reconciliation_engine.h"

#include <cstdint>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace {

struct SoakOptions final {
    std::uint64_t ticks = 36000;
    std::uint64_t seed = 1;
    std::uint64_t max_remotes = 12;
    std::uint64_t roster_interval_ticks = 6;
    bool inject_malformed = true;
    skirmish::core::LogLevel log_level = skirmish::core::LogLevel::Warn;
    std::string config_path;
};

bool ParseArguments(
    int argc,
    char** argv,
    SoakOptions& out_options,
    std::string& out_error) {
    for (int index = 1; index < argc; ++index) {
        const std::string arg = argv[index];
        auto read_value = [&](const char* key) -> std::string {
            if (index + 1 >= argc) {
                out_error = std::string("Missing value for option: ") + key;
                return {};
            }
            ++index;
            return argv[index];
        };

        if (arg == "--config") {
            out_options.config_path = read_value("--config");
            if (out_options.config_path.empty()) {
                return false;
            }
            continue;
        }

        if (arg == "--log-level") {
            const std::string value = read_value("--log-level");
            if (value.empty()) {
                return false;
            }
            if (!skirmish::core::Logger::ParseLevel(value, out_options.log_level)) {
                out_error = "Invalid --log-level value (info|warn|error)";
                return false;
            }
            continue;
        }

        if (arg == "--inject-malformed") {
            const std::string value = read_value("--inject-malformed");
            if (value.empty()) {
                return false;
            }
            if (!skirmish::core::cfg::ParseBool(value, out_options.inject_malformed)) {
                out_error = "Invalid --inject-malformed value";
                return false;
            }
            continue;
        }

        std::uint64_t* target = nullptr;
        if (arg == "--ticks") {
            target = &out_options.ticks;
        } else if (arg == "--seed") {
            target = &out_options.seed;
        } else if (arg == "--max-remotes") {
            target = &out_options.max_remotes;
        } else if (arg == "--roster-interval") {
            target = &out_options.roster_interval_ticks;
        }
        if (target == nullptr) {
            out_error = "Unknown option: " + arg;
            return false;
        }

        const std::string value = read_value(arg.c_str());
        if (value.empty()) {
            return false;
        }
        if (!skirmish::core::cfg::ParseUInt64(value, *target)) {
            out_error = "Invalid " + arg + " value";
            return false;
        }
    }

    if (out_options.ticks == 0) {
        out_error = "ticks must be > 0";
        return false;
    }
    if (out_options.roster_interval_ticks == 0) {
        out_error = "roster_interval must be > 0";
        return false;
    }

    out_error.clear();
    return true;
}

void PrintUsage() {
    std::cout
        << "Usage:\n"
        << "  skirmish_sync_soak [--ticks <count>] [--seed <value>] "
        << "[--max-remotes <count>] [--roster-interval <ticks>] "
        << "[--inject-malformed <true|false>] [--log-level <info|warn|error>] "
        << "[--config <path>]\n";
}

struct InvariantReport final {
    std::uint64_t membership_mismatches = 0;
    std::uint64_t local_in_registry = 0;
    std::uint64_t orphan_overlay_entries = 0;
    std::uint64_t negative_health = 0;
    std::uint64_t extra_open_attacks = 0;
    std::uint64_t geometry_changes = 0;
    std::uint64_t overaged_projectiles = 0;

    std::uint64_t Total() const {
        return membership_mismatches + local_in_registry + orphan_overlay_entries +
            negative_health + extra_open_attacks + geometry_changes + overaged_projectiles;
    }
};

class SoakDriver final {
public:
    SoakDriver(const skirmish::core::EngineConfig& config, const SoakOptions& options)
        : config_(config),
          options_(options),
          session_("soak_local"),
          engine_(config_, physics_),
          rng_(options.seed) {}

    bool Run() {
        std::string error;
        if (!engine_.Join(session_, error)) {
            skirmish::core::Logger::Error("soak", "Join failed: " + error);
            return false;
        }

        const std::uint64_t frame_ms = 16;
        for (std::uint64_t tick = 1; tick <= options_.ticks; ++tick) {
            const std::uint64_t now_ms = tick * frame_ms;
            session_.SetNowMs(now_ms);

            if (tick == 20) {
                engine_.MarkWorldReady();
            }
            if (tick == 10 || tick == 40 || tick == 41) {
                PublishObstacles();
            }
            if (tick % options_.roster_interval_ticks == 0) {
                PublishRoster();
            }

            MoveLocal();
            if (Chance(0.05)) {
                engine_.RequestAttack();
            }
            if (Chance(0.02)) {
                engine_.FireProjectile(Coordinate(), Coordinate());
            }
            if (Chance(0.04)) {
                PublishRemoteProjectile();
            }
            if (options_.inject_malformed && Chance(0.005)) {
                const skirmish::wire::ByteBuffer garbage{0xFF, 0x01};
                session_.PublishEvent(
                    config_.room_id,
                    skirmish::session::kEventProjectileFired,
                    skirmish::wire::AsSpan(garbage));
            }

            engine_.Tick(skirmish::sim::TickContext{
                .tick_index = tick,
                .now_ms = now_ms,
                .fixed_delta_seconds = static_cast<double>(frame_ms) / 1000.0,
            });
            CheckInvariants(now_ms);
        }

        engine_.Leave();
        return true;
    }

    const InvariantReport& Report() const {
        return report_;
    }

    skirmish::sync::EngineDiagnostics Diagnostics() const {
        return engine_.Diagnostics();
    }

    std::size_t CallCount() const {
        return session_.Calls().size();
    }

private:
    bool Chance(double probability) {
        return std::bernoulli_distribution(probability)(rng_);
    }

    double Coordinate() {
        return std::uniform_real_distribution<double>(
            static_cast<double>(config_.respawn_min),
            static_cast<double>(config_.respawn_max))(rng_);
    }

    double NearLocal(float center) {
        return static_cast<double>(center) + std::uniform_real_distribution<double>(-90.0, 90.0)(rng_);
    }

    std::string RemoteId(std::uint64_t index) const {
        return "remote_" + std::to_string(index);
    }

    void MoveLocal() {
        const skirmish::sync::Participant& local = engine_.LocalParticipant();
        const int facing = Chance(0.5) ? skirmish::sync::kFacingLeft : skirmish::sync::kFacingRight;
        engine_.SetLocalMotion(
            local.x + static_cast<float>(facing) * 2.0F,
            local.y,
            facing);
    }

    void PublishRoster() {
        const skirmish::sync::Participant& local = engine_.LocalParticipant();
        skirmish::session::RosterSnapshot snapshot;
        expected_ids_.clear();
        snapshot.push_back(skirmish::session::RosterEntry{
            .account = local.id,
            .x = local.x,
            .y = local.y,
        });
        for (std::uint64_t index = 0; index < options_.max_remotes; ++index) {
            if (!Chance(0.7)) {
                continue;
            }
            const std::string id = RemoteId(index);
            skirmish::session::RosterEntry entry{
                .account = id,
                .x = NearLocal(local.x),
                .y = NearLocal(local.y),
            };
            if (Chance(0.8)) {
                entry.health = static_cast<int>(
                    std::uniform_int_distribution<int>(0, config_.max_health)(rng_));
            }
            snapshot.push_back(entry);
            expected_ids_.insert(id);
        }
        if (options_.inject_malformed && Chance(0.1)) {
            snapshot.push_back(skirmish::session::RosterEntry{.x = 1.0, .y = 1.0});
        }

        const skirmish::wire::ByteBuffer payload = skirmish::session::EncodeRosterSnapshot(snapshot);
        engine_.ApplyRosterPayload(skirmish::wire::AsSpan(payload));
    }

    void PublishObstacles() {
        skirmish::session::RoomState state{};
        std::vector<skirmish::session::ObstacleEntry> obstacles;
        for (int index = 0; index < 12; ++index) {
            obstacles.push_back(skirmish::session::ObstacleEntry{.x = Coordinate(), .y = Coordinate()});
        }
        state.obstacles = std::move(obstacles);
        const skirmish::wire::ByteBuffer payload = skirmish::session::EncodeRoomState(state);
        session_.PublishState(config_.room_id, skirmish::wire::AsSpan(payload));
    }

    void PublishRemoteProjectile() {
        if (expected_ids_.empty()) {
            return;
        }
        const skirmish::sync::Participant& local = engine_.LocalParticipant();
        const std::string owner = RemoteId(
            std::uniform_int_distribution<std::uint64_t>(0, options_.max_remotes - 1)(rng_));
        ++remote_projectile_sequence_;
        const skirmish::wire::ByteBuffer payload = skirmish::session::EncodeProjectileFired({
            .x = NearLocal(local.x),
            .y = NearLocal(local.y),
            .target_x = local.x,
            .target_y = local.y,
            .id = "projectile_" + owner + "_" + std::to_string(remote_projectile_sequence_),
            .owner_id = owner,
        });
        session_.PublishEvent(
            config_.room_id,
            skirmish::session::kEventProjectileFired,
            skirmish::wire::AsSpan(payload));
    }

    void CheckInvariants(std::uint64_t now_ms) {
        const skirmish::sync::ParticipantRegistry& registry = engine_.Participants();
        const std::vector<std::string> ids = registry.Ids();
        if (std::set<std::string>(ids.begin(), ids.end()) != expected_ids_) {
            ++report_.membership_mismatches;
        }
        if (registry.Contains(engine_.LocalParticipant().id)) {
            ++report_.local_in_registry;
        }

        std::size_t overlay_entries_in_registry = 0;
        registry.ForEach([&](const skirmish::sync::Participant& participant) {
            if (participant.health < 0) {
                ++report_.negative_health;
            }
            if (engine_.Overlay().Contains(participant.id)) {
                ++overlay_entries_in_registry;
            }
        });
        if (overlay_entries_in_registry != engine_.Overlay().Size()) {
            ++report_.orphan_overlay_entries;
        }
        if (engine_.LocalParticipant().health < 0) {
            ++report_.negative_health;
        }

        if (engine_.Hits().OpenAttackCount() > 1) {
            ++report_.extra_open_attacks;
        }

        if (engine_.World().IsBootstrapped()) {
            const std::size_t block_count = engine_.World().BlockCount();
            if (bootstrapped_block_count_ == 0) {
                bootstrapped_block_count_ = block_count;
            } else if (block_count != bootstrapped_block_count_) {
                ++report_.geometry_changes;
            }
        }

        const std::uint64_t ttl_ms = static_cast<std::uint64_t>(config_.projectile_ttl_ms);
        for (const skirmish::sync::ProjectileView& projectile : engine_.Ephemera().Projectiles()) {
            if (now_ms >= projectile.created_ms + ttl_ms) {
                ++report_.overaged_projectiles;
            }
        }
    }

    skirmish::core::EngineConfig config_;
    SoakOptions options_;
    skirmish::sim::AabbPhysicsBridge physics_;
    skirmish::session::SessionChannelStub session_;
    skirmish::sync::ReconciliationEngine engine_;
    std::mt19937_64 rng_;
    std::set<std::string> expected_ids_;
    std::size_t bootstrapped_block_count_ = 0;
    std::uint64_t remote_projectile_sequence_ = 0;
    InvariantReport report_{};
};

}  // namespace

int main(int argc, char** argv) {
    SoakOptions options{};
    std::string error;
    if (!ParseArguments(argc, argv, options, error)) {
        std::cerr << "[ERROR] " << error << '\n';
        PrintUsage();
        return 1;
    }
    skirmish::core::Logger::SetMinimumLevel(options.log_level);

    skirmish::core::EngineConfig config{};
    if (!options.config_path.empty() &&
        !skirmish::core::ConfigLoader::Load(options.config_path, config, error)) {
        std::cerr << "[ERROR] config load failed: " << error << '\n';
        return 1;
    }
    config.respawn_seed = options.seed;

    SoakDriver driver(config, options);
    if (!driver.Run()) {
        return 1;
    }

    const skirmish::sync::EngineDiagnostics diagnostics = driver.Diagnostics();
    const InvariantReport& report = driver.Report();
    std::cout
        << "[INFO] summary: ticks=" << options.ticks
        << ", calls=" << driver.CallCount()
        << ", melee_hits=" << diagnostics.melee_hits_applied
        << ", melee_dedup=" << diagnostics.melee_hits_deduplicated
        << ", projectile_hits=" << diagnostics.projectile_hits_taken
        << ", projectiles_expired=" << diagnostics.projectiles_expired
        << ", local_deaths=" << diagnostics.local_deaths
        << ", malformed_messages=" << diagnostics.malformed_messages_skipped
        << ", malformed_entries=" << diagnostics.malformed_entries_skipped
        << ", ignored_bootstraps=" << diagnostics.ignored_bootstrap_attempts
        << ", pushes=" << diagnostics.position_pushes
        << '\n';

    if (report.Total() != 0) {
        std::cerr
            << "[FAIL] soak invariants violated: membership=" << report.membership_mismatches
            << ", local_in_registry=" << report.local_in_registry
            << ", orphan_overlay=" << report.orphan_overlay_entries
            << ", negative_health=" << report.negative_health
            << ", extra_open_attacks=" << report.extra_open_attacks
            << ", geometry_changes=" << report.geometry_changes
            << ", overaged_projectiles=" << report.overaged_projectiles
            << '\n';
        return 1;
    }

    std::cout << "[PASS] skirmish_sync_soak\n";
    return 0;
}
