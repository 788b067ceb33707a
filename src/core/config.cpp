#include "core/config.h"

#include "core/cfg_parser.h"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace skirmish::core {
namespace {

struct IntField final {
    std::string_view key;
    int EngineConfig::*member = nullptr;
    int min_value = 0;
};

constexpr std::array<IntField, 21> kIntFields{{
    {"world_size", &EngineConfig::world_size, 1},
    {"border_step", &EngineConfig::border_step, 1},
    {"obstacle_size", &EngineConfig::obstacle_size, 1},
    {"participant_width", &EngineConfig::participant_width, 1},
    {"participant_height", &EngineConfig::participant_height, 1},
    {"default_health", &EngineConfig::default_health, 0},
    {"max_health", &EngineConfig::max_health, 1},
    {"hitbox_width", &EngineConfig::hitbox_width, 1},
    {"hitbox_height", &EngineConfig::hitbox_height, 1},
    {"hitbox_lifetime_ms", &EngineConfig::hitbox_lifetime_ms, 1},
    {"attack_cooldown_ms", &EngineConfig::attack_cooldown_ms, 1},
    {"hit_damage", &EngineConfig::hit_damage, 0},
    {"projectile_speed", &EngineConfig::projectile_speed, 0},
    {"projectile_size", &EngineConfig::projectile_size, 1},
    {"projectile_ttl_ms", &EngineConfig::projectile_ttl_ms, 1},
    {"position_push_interval_ms", &EngineConfig::position_push_interval_ms, 0},
    {"powerup_size", &EngineConfig::powerup_size, 1},
    {"powerup_heal_amount", &EngineConfig::powerup_heal_amount, 0},
    {"speed_boost_duration_ms", &EngineConfig::speed_boost_duration_ms, 0},
    {"respawn_min", &EngineConfig::respawn_min, 0},
    {"respawn_max", &EngineConfig::respawn_max, 0},
}};

const IntField* FindIntField(std::string_view key) {
    for (const IntField& field : kIntFields) {
        if (field.key == key) {
            return &field;
        }
    }
    return nullptr;
}

std::string LineSuffix(int line_number) {
    return ": line " + std::to_string(line_number);
}

}  // namespace

bool ConfigLoader::Load(
    const std::filesystem::path& file_path,
    EngineConfig& out_config,
    std::string& out_error) {
    std::vector<cfg::KeyValueLine> lines;
    if (!cfg::ParseFile(file_path, lines, out_error)) {
        return false;
    }

    EngineConfig parsed = out_config;
    for (const cfg::KeyValueLine& line : lines) {
        if (line.key == "room_id") {
            if (!cfg::ParseQuotedString(line.value, parsed.room_id) || parsed.room_id.empty()) {
                out_error = "room_id expects non-empty string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (line.key == "player_name") {
            if (!cfg::ParseQuotedString(line.value, parsed.player_name)) {
                out_error = "player_name expects string" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        if (line.key == "respawn_seed") {
            if (!cfg::ParseUInt64(line.value, parsed.respawn_seed)) {
                out_error = "respawn_seed expects unsigned integer" + LineSuffix(line.line_number);
                return false;
            }
            continue;
        }

        const IntField* field = FindIntField(line.key);
        if (field == nullptr) {
            out_error = "Unknown config key '" + line.key + "'" + LineSuffix(line.line_number);
            return false;
        }

        int value = 0;
        if (!cfg::ParseInt(line.value, value)) {
            out_error = line.key + " expects integer" + LineSuffix(line.line_number);
            return false;
        }
        if (value < field->min_value) {
            out_error = line.key + " must be >= " + std::to_string(field->min_value) +
                LineSuffix(line.line_number);
            return false;
        }
        parsed.*(field->member) = value;
    }

    if (!Validate(parsed, out_error)) {
        return false;
    }

    out_config = std::move(parsed);
    out_error.clear();
    return true;
}

bool ConfigLoader::Validate(const EngineConfig& config, std::string& out_error) {
    if (config.room_id.empty()) {
        out_error = "room_id must not be empty.";
        return false;
    }

    for (const IntField& field : kIntFields) {
        if (config.*(field.member) < field.min_value) {
            out_error = std::string(field.key) + " must be >= " + std::to_string(field.min_value) + ".";
            return false;
        }
    }

    if (config.hitbox_lifetime_ms >= config.attack_cooldown_ms) {
        out_error = "hitbox_lifetime_ms must be shorter than attack_cooldown_ms.";
        return false;
    }

    if (config.default_health > config.max_health) {
        out_error = "default_health must not exceed max_health.";
        return false;
    }

    if (config.respawn_min > config.respawn_max || config.respawn_max > config.world_size) {
        out_error = "respawn range must satisfy respawn_min <= respawn_max <= world_size.";
        return false;
    }

    if (config.border_step > config.world_size) {
        out_error = "border_step must not exceed world_size.";
        return false;
    }

    out_error.clear();
    return true;
}

}  // namespace skirmish::core
