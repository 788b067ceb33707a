#include "session/message_schema.h"

#include <limits>
#include <utility>

namespace skirmish::session {
namespace {

constexpr std::uint64_t kMaxListEntries = 4096;

constexpr wire::Byte kFieldX = 1U << 0U;
constexpr wire::Byte kFieldY = 1U << 1U;
constexpr wire::Byte kFieldId = 1U << 2U;
constexpr wire::Byte kFieldType = 1U << 3U;
constexpr wire::Byte kFieldName = 1U << 4U;
constexpr wire::Byte kFieldHealth = 1U << 5U;
constexpr wire::Byte kFieldAccount = 1U << 6U;

constexpr wire::Byte kStateObstacles = 1U << 0U;
constexpr wire::Byte kStatePowerups = 1U << 1U;

bool TryReadInt32(wire::ByteReader& reader, int& out_value) {
    std::int64_t parsed = 0;
    if (!reader.ReadVarInt(parsed)) {
        return false;
    }
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        return false;
    }
    out_value = static_cast<int>(parsed);
    return true;
}

bool TryReadListLength(wire::ByteReader& reader, std::size_t& out_length) {
    std::uint64_t length = 0;
    if (!reader.ReadVarUInt(length) || length > kMaxListEntries) {
        return false;
    }
    out_length = static_cast<std::size_t>(length);
    return true;
}

bool TryReadOptionalMilli(
    wire::ByteReader& reader,
    wire::Byte mask,
    wire::Byte field,
    std::optional<double>& out_value) {
    out_value.reset();
    if ((mask & field) == 0) {
        return true;
    }
    double value = 0.0;
    if (!reader.ReadMilli(value)) {
        return false;
    }
    out_value = value;
    return true;
}

bool TryReadOptionalString(
    wire::ByteReader& reader,
    wire::Byte mask,
    wire::Byte field,
    std::optional<std::string>& out_value) {
    out_value.reset();
    if ((mask & field) == 0) {
        return true;
    }
    std::string value;
    if (!reader.ReadString(value)) {
        return false;
    }
    out_value = std::move(value);
    return true;
}

void WriteObstacleEntry(wire::ByteWriter& writer, const ObstacleEntry& entry) {
    wire::Byte mask = 0;
    mask |= entry.x.has_value() ? kFieldX : 0;
    mask |= entry.y.has_value() ? kFieldY : 0;
    writer.WriteU8(mask);
    if (entry.x.has_value()) {
        writer.WriteMilli(*entry.x);
    }
    if (entry.y.has_value()) {
        writer.WriteMilli(*entry.y);
    }
}

bool TryReadObstacleEntry(wire::ByteReader& reader, ObstacleEntry& out_entry) {
    wire::Byte mask = 0;
    return reader.ReadU8(mask) &&
        TryReadOptionalMilli(reader, mask, kFieldX, out_entry.x) &&
        TryReadOptionalMilli(reader, mask, kFieldY, out_entry.y);
}

void WritePowerupEntry(wire::ByteWriter& writer, const PowerupEntry& entry) {
    wire::Byte mask = 0;
    mask |= entry.id.has_value() ? kFieldId : 0;
    mask |= entry.type.has_value() ? kFieldType : 0;
    mask |= entry.x.has_value() ? kFieldX : 0;
    mask |= entry.y.has_value() ? kFieldY : 0;
    writer.WriteU8(mask);
    if (entry.id.has_value()) {
        writer.WriteString(*entry.id);
    }
    if (entry.type.has_value()) {
        writer.WriteString(*entry.type);
    }
    if (entry.x.has_value()) {
        writer.WriteMilli(*entry.x);
    }
    if (entry.y.has_value()) {
        writer.WriteMilli(*entry.y);
    }
}

bool TryReadPowerupEntry(wire::ByteReader& reader, PowerupEntry& out_entry) {
    wire::Byte mask = 0;
    return reader.ReadU8(mask) &&
        TryReadOptionalString(reader, mask, kFieldId, out_entry.id) &&
        TryReadOptionalString(reader, mask, kFieldType, out_entry.type) &&
        TryReadOptionalMilli(reader, mask, kFieldX, out_entry.x) &&
        TryReadOptionalMilli(reader, mask, kFieldY, out_entry.y);
}

}  // namespace

wire::ByteBuffer EncodeProjectileFired(const ProjectileFiredMessage& message) {
    wire::ByteWriter writer;
    writer.WriteMilli(message.x);
    writer.WriteMilli(message.y);
    writer.WriteMilli(message.target_x);
    writer.WriteMilli(message.target_y);
    writer.WriteString(message.id);
    writer.WriteString(message.owner_id);
    return writer.TakeBuffer();
}

bool TryDecodeProjectileFired(wire::ByteSpan payload, ProjectileFiredMessage& out_message) {
    wire::ByteReader reader(payload);
    ProjectileFiredMessage message{};
    if (!reader.ReadMilli(message.x) ||
        !reader.ReadMilli(message.y) ||
        !reader.ReadMilli(message.target_x) ||
        !reader.ReadMilli(message.target_y) ||
        !reader.ReadString(message.id) ||
        !reader.ReadString(message.owner_id) ||
        !reader.IsFullyConsumed()) {
        return false;
    }
    if (message.id.empty() || message.owner_id.empty()) {
        return false;
    }
    out_message = std::move(message);
    return true;
}

wire::ByteBuffer EncodePowerupSpawned(const PowerupSpawnedMessage& message) {
    wire::ByteWriter writer;
    writer.WriteMilli(message.x);
    writer.WriteMilli(message.y);
    writer.WriteString(message.id);
    writer.WriteString(message.type);
    return writer.TakeBuffer();
}

bool TryDecodePowerupSpawned(wire::ByteSpan payload, PowerupSpawnedMessage& out_message) {
    wire::ByteReader reader(payload);
    PowerupSpawnedMessage message{};
    if (!reader.ReadMilli(message.x) ||
        !reader.ReadMilli(message.y) ||
        !reader.ReadString(message.id) ||
        !reader.ReadString(message.type) ||
        !reader.IsFullyConsumed()) {
        return false;
    }
    if (message.id.empty() || message.type.empty()) {
        return false;
    }
    out_message = std::move(message);
    return true;
}

wire::ByteBuffer EncodePlayerAttack(const PlayerAttackMessage& message) {
    wire::ByteWriter writer;
    writer.WriteString(message.id);
    writer.WriteMilli(message.x);
    writer.WriteMilli(message.y);
    writer.WriteVarInt(message.direction);
    writer.WriteString(message.owner_id);
    writer.WriteString(message.owner_name);
    return writer.TakeBuffer();
}

bool TryDecodePlayerAttack(wire::ByteSpan payload, PlayerAttackMessage& out_message) {
    wire::ByteReader reader(payload);
    PlayerAttackMessage message{};
    if (!reader.ReadString(message.id) ||
        !reader.ReadMilli(message.x) ||
        !reader.ReadMilli(message.y) ||
        !TryReadInt32(reader, message.direction) ||
        !reader.ReadString(message.owner_id) ||
        !reader.ReadString(message.owner_name) ||
        !reader.IsFullyConsumed()) {
        return false;
    }
    if (message.direction != -1 && message.direction != 1) {
        return false;
    }
    out_message = std::move(message);
    return true;
}

wire::ByteBuffer EncodePlayerHit(const PlayerHitMessage& message) {
    wire::ByteWriter writer;
    writer.WriteString(message.target_id);
    writer.WriteString(message.attacker_id);
    writer.WriteString(message.projectile_id);
    writer.WriteVarInt(message.damage);
    return writer.TakeBuffer();
}

bool TryDecodePlayerHit(wire::ByteSpan payload, PlayerHitMessage& out_message) {
    wire::ByteReader reader(payload);
    PlayerHitMessage message{};
    if (!reader.ReadString(message.target_id) ||
        !reader.ReadString(message.attacker_id) ||
        !reader.ReadString(message.projectile_id) ||
        !TryReadInt32(reader, message.damage) ||
        !reader.IsFullyConsumed()) {
        return false;
    }
    out_message = std::move(message);
    return true;
}

wire::ByteBuffer EncodePlayerDied(const PlayerDiedMessage& message) {
    wire::ByteWriter writer;
    writer.WriteString(message.player_id);
    writer.WriteString(message.killer_id);
    return writer.TakeBuffer();
}

bool TryDecodePlayerDied(wire::ByteSpan payload, PlayerDiedMessage& out_message) {
    wire::ByteReader reader(payload);
    PlayerDiedMessage message{};
    if (!reader.ReadString(message.player_id) ||
        !reader.ReadString(message.killer_id) ||
        !reader.IsFullyConsumed()) {
        return false;
    }
    out_message = std::move(message);
    return true;
}

wire::ByteBuffer EncodePlayerPosition(const PlayerPositionMessage& message) {
    wire::ByteWriter writer;
    writer.WriteMilli(message.x);
    writer.WriteMilli(message.y);
    writer.WriteMilli(message.angle);
    writer.WriteVarInt(message.health);
    writer.WriteString(message.name);
    return writer.TakeBuffer();
}

bool TryDecodePlayerPosition(wire::ByteSpan payload, PlayerPositionMessage& out_message) {
    wire::ByteReader reader(payload);
    PlayerPositionMessage message{};
    if (!reader.ReadMilli(message.x) ||
        !reader.ReadMilli(message.y) ||
        !reader.ReadMilli(message.angle) ||
        !TryReadInt32(reader, message.health) ||
        !reader.ReadString(message.name) ||
        !reader.IsFullyConsumed()) {
        return false;
    }
    out_message = std::move(message);
    return true;
}

wire::ByteBuffer EncodeCollectPowerup(const CollectPowerupMessage& message) {
    wire::ByteWriter writer;
    writer.WriteString(message.id);
    return writer.TakeBuffer();
}

bool TryDecodeCollectPowerup(wire::ByteSpan payload, CollectPowerupMessage& out_message) {
    wire::ByteReader reader(payload);
    CollectPowerupMessage message{};
    if (!reader.ReadString(message.id) || !reader.IsFullyConsumed()) {
        return false;
    }
    out_message = std::move(message);
    return true;
}

wire::ByteBuffer EncodeRoomState(const RoomState& state) {
    wire::ByteWriter writer;
    wire::Byte mask = 0;
    mask |= state.obstacles.has_value() ? kStateObstacles : 0;
    mask |= state.powerups.has_value() ? kStatePowerups : 0;
    writer.WriteU8(mask);

    if (state.obstacles.has_value()) {
        writer.WriteVarUInt(state.obstacles->size());
        for (const ObstacleEntry& entry : *state.obstacles) {
            WriteObstacleEntry(writer, entry);
        }
    }

    if (state.powerups.has_value()) {
        writer.WriteVarUInt(state.powerups->size());
        for (const PowerupEntry& entry : *state.powerups) {
            WritePowerupEntry(writer, entry);
        }
    }

    return writer.TakeBuffer();
}

bool TryDecodeRoomState(wire::ByteSpan payload, RoomState& out_state) {
    wire::ByteReader reader(payload);
    wire::Byte mask = 0;
    if (!reader.ReadU8(mask)) {
        return false;
    }

    RoomState state{};
    if ((mask & kStateObstacles) != 0) {
        std::size_t count = 0;
        if (!TryReadListLength(reader, count)) {
            return false;
        }
        std::vector<ObstacleEntry> obstacles(count);
        for (ObstacleEntry& entry : obstacles) {
            if (!TryReadObstacleEntry(reader, entry)) {
                return false;
            }
        }
        state.obstacles = std::move(obstacles);
    }

    if ((mask & kStatePowerups) != 0) {
        std::size_t count = 0;
        if (!TryReadListLength(reader, count)) {
            return false;
        }
        std::vector<PowerupEntry> powerups(count);
        for (PowerupEntry& entry : powerups) {
            if (!TryReadPowerupEntry(reader, entry)) {
                return false;
            }
        }
        state.powerups = std::move(powerups);
    }

    if (!reader.IsFullyConsumed()) {
        return false;
    }

    out_state = std::move(state);
    return true;
}

wire::ByteBuffer EncodeRosterSnapshot(const RosterSnapshot& snapshot) {
    wire::ByteWriter writer;
    writer.WriteVarUInt(snapshot.size());
    for (const RosterEntry& entry : snapshot) {
        wire::Byte mask = 0;
        mask |= entry.account.has_value() ? kFieldAccount : 0;
        mask |= entry.x.has_value() ? kFieldX : 0;
        mask |= entry.y.has_value() ? kFieldY : 0;
        mask |= entry.name.has_value() ? kFieldName : 0;
        mask |= entry.health.has_value() ? kFieldHealth : 0;
        writer.WriteU8(mask);
        if (entry.account.has_value()) {
            writer.WriteString(*entry.account);
        }
        if (entry.x.has_value()) {
            writer.WriteMilli(*entry.x);
        }
        if (entry.y.has_value()) {
            writer.WriteMilli(*entry.y);
        }
        if (entry.name.has_value()) {
            writer.WriteString(*entry.name);
        }
        if (entry.health.has_value()) {
            writer.WriteVarInt(*entry.health);
        }
    }
    return writer.TakeBuffer();
}

bool TryDecodeRosterSnapshot(wire::ByteSpan payload, RosterSnapshot& out_snapshot) {
    wire::ByteReader reader(payload);
    std::size_t count = 0;
    if (!TryReadListLength(reader, count)) {
        return false;
    }

    RosterSnapshot snapshot(count);
    for (RosterEntry& entry : snapshot) {
        wire::Byte mask = 0;
        if (!reader.ReadU8(mask) ||
            !TryReadOptionalString(reader, mask, kFieldAccount, entry.account) ||
            !TryReadOptionalMilli(reader, mask, kFieldX, entry.x) ||
            !TryReadOptionalMilli(reader, mask, kFieldY, entry.y) ||
            !TryReadOptionalString(reader, mask, kFieldName, entry.name)) {
            return false;
        }
        if ((mask & kFieldHealth) != 0) {
            int health = 0;
            if (!TryReadInt32(reader, health)) {
                return false;
            }
            entry.health = health;
        }
    }

    if (!reader.IsFullyConsumed()) {
        return false;
    }

    out_snapshot = std::move(snapshot);
    return true;
}

}  // namespace skirmish::session
