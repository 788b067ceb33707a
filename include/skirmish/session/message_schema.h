#pragma once

#include "wire/byte_io.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::session {

inline constexpr std::string_view kEventProjectileFired = "projectileFired";
inline constexpr std::string_view kEventPowerupSpawned = "powerupSpawned";

inline constexpr std::string_view kCallPlayerAttack = "playerAttack";
inline constexpr std::string_view kCallPlayerHit = "playerHit";
inline constexpr std::string_view kCallPlayerDied = "playerDied";
inline constexpr std::string_view kCallUpdatePlayerPosition = "updatePlayerPosition";
inline constexpr std::string_view kCallCollectPowerup = "collectPowerup";
inline constexpr std::string_view kCallFireProjectile = "fireProjectile";

inline constexpr std::string_view kPowerupTypeHealth = "health";
inline constexpr std::string_view kPowerupTypeSpeed = "speed";

struct ProjectileFiredMessage final {
    double x = 0.0;
    double y = 0.0;
    double target_x = 0.0;
    double target_y = 0.0;
    std::string id;
    std::string owner_id;
};

struct PowerupSpawnedMessage final {
    double x = 0.0;
    double y = 0.0;
    std::string id;
    std::string type;
};

struct PlayerAttackMessage final {
    std::string id;
    double x = 0.0;
    double y = 0.0;
    int direction = 1;
    std::string owner_id;
    std::string owner_name;
};

struct PlayerHitMessage final {
    std::string target_id;
    std::string attacker_id;
    std::string projectile_id;
    int damage = 0;
};

struct PlayerDiedMessage final {
    std::string player_id;
    std::string killer_id;
};

struct PlayerPositionMessage final {
    double x = 0.0;
    double y = 0.0;
    double angle = 0.0;
    int health = 0;
    std::string name;
};

struct CollectPowerupMessage final {
    std::string id;
};

// Room-state and roster entries keep every field optional so that a missing
// field survives decoding and can be rejected per entry.
struct ObstacleEntry final {
    std::optional<double> x;
    std::optional<double> y;
};

struct PowerupEntry final {
    std::optional<std::string> id;
    std::optional<std::string> type;
    std::optional<double> x;
    std::optional<double> y;
};

struct RoomState final {
    std::optional<std::vector<ObstacleEntry>> obstacles;
    std::optional<std::vector<PowerupEntry>> powerups;
};

struct RosterEntry final {
    std::optional<std::string> account;
    std::optional<double> x;
    std::optional<double> y;
    std::optional<std::string> name;
    std::optional<int> health;
};

using RosterSnapshot = std::vector<RosterEntry>;

wire::ByteBuffer EncodeProjectileFired(const ProjectileFiredMessage& message);
bool TryDecodeProjectileFired(wire::ByteSpan payload, ProjectileFiredMessage& out_message);

wire::ByteBuffer EncodePowerupSpawned(const PowerupSpawnedMessage& message);
bool TryDecodePowerupSpawned(wire::ByteSpan payload, PowerupSpawnedMessage& out_message);

wire::ByteBuffer EncodePlayerAttack(const PlayerAttackMessage& message);
bool TryDecodePlayerAttack(wire::ByteSpan payload, PlayerAttackMessage& out_message);

wire::ByteBuffer EncodePlayerHit(const PlayerHitMessage& message);
bool TryDecodePlayerHit(wire::ByteSpan payload, PlayerHitMessage& out_message);

wire::ByteBuffer EncodePlayerDied(const PlayerDiedMessage& message);
bool TryDecodePlayerDied(wire::ByteSpan payload, PlayerDiedMessage& out_message);

wire::ByteBuffer EncodePlayerPosition(const PlayerPositionMessage& message);
bool TryDecodePlayerPosition(wire::ByteSpan payload, PlayerPositionMessage& out_message);

wire::ByteBuffer EncodeCollectPowerup(const CollectPowerupMessage& message);
bool TryDecodeCollectPowerup(wire::ByteSpan payload, CollectPowerupMessage& out_message);

wire::ByteBuffer EncodeRoomState(const RoomState& state);
bool TryDecodeRoomState(wire::ByteSpan payload, RoomState& out_state);

wire::ByteBuffer EncodeRosterSnapshot(const RosterSnapshot& snapshot);
bool TryDecodeRosterSnapshot(wire::ByteSpan payload, RosterSnapshot& out_snapshot);

}  // namespace skirmish::session
