#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace skirmish::core {

struct EngineConfig final {
    std::string room_id = "arena";
    std::string player_name = "Knight";

    int world_size = 2000;
    int border_step = 50;
    int obstacle_size = 32;

    int participant_width = 48;
    int participant_height = 48;
    int default_health = 100;
    int max_health = 100;

    int hitbox_width = 80;
    int hitbox_height = 60;
    int hitbox_lifetime_ms = 300;
    int attack_cooldown_ms = 500;
    int hit_damage = 10;

    int projectile_speed = 500;
    int projectile_size = 8;
    int projectile_ttl_ms = 2000;

    int position_push_interval_ms = 50;

    int powerup_size = 24;
    int powerup_heal_amount = 25;
    int speed_boost_duration_ms = 5000;

    int respawn_min = 100;
    int respawn_max = 1900;
    std::uint64_t respawn_seed = 0;
};

class ConfigLoader final {
public:
    static bool Load(
        const std::filesystem::path& file_path,
        EngineConfig& out_config,
        std::string& out_error);

    static bool Validate(const EngineConfig& config, std::string& out_error);
};

}  // namespace skirmish::core
