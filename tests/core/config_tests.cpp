#include "core/config.h"
#include "core/logger.h"

#include <chrono>
#include <filesystem>
#include <fstream>
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

std::filesystem::path BuildTestDirectory() {
    const auto unique_seed =
        std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
        ("skirmish_config_loader_test_" + std::to_string(unique_seed));
}

bool WriteConfigFile(const std::filesystem::path& file_path, const std::string& content) {
    std::ofstream file(file_path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.close();
    return true;
}

}  // namespace

int main() {
    bool passed = true;

    const std::filesystem::path test_dir = BuildTestDirectory();
    const std::filesystem::path config_path = test_dir / "skirmish.cfg";
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
    std::filesystem::create_directories(test_dir, ec);

    skirmish::core::EngineConfig defaults{};
    std::string error;
    passed &= Expect(
        skirmish::core::ConfigLoader::Validate(defaults, error),
        "Default config should validate.");
    passed &= Expect(defaults.hitbox_lifetime_ms == 300, "Default hitbox lifetime should be 300ms.");
    passed &= Expect(defaults.attack_cooldown_ms == 500, "Default attack cooldown should be 500ms.");
    passed &= Expect(defaults.projectile_ttl_ms == 2000, "Default projectile ttl should be 2000ms.");
    passed &= Expect(defaults.position_push_interval_ms == 50, "Default push interval should be 50ms.");

    passed &= Expect(
        WriteConfigFile(
            config_path,
            "# arena tuning\n"
            "[session]\n"
            "room_id = \"duel\"\n"
            "player_name = \"Rogue #2\"  # hash inside quotes stays\n"
            "\n"
            "[combat]\n"
            "hit_damage = 15  # heavier blows\n"
            "projectile_ttl_ms = 1500\n"
            "respawn_seed = 42\n"),
        "Config file write should succeed.");

    skirmish::core::EngineConfig loaded{};
    passed &= Expect(
        skirmish::core::ConfigLoader::Load(config_path, loaded, error),
        "Config load should succeed.");
    passed &= Expect(error.empty(), "Config load should not return error.");
    passed &= Expect(loaded.room_id == "duel", "room_id should be loaded.");
    passed &= Expect(loaded.player_name == "Rogue #2", "Quoted '#' should not start a comment.");
    passed &= Expect(loaded.hit_damage == 15, "hit_damage should be loaded.");
    passed &= Expect(loaded.projectile_ttl_ms == 1500, "projectile_ttl_ms should be loaded.");
    passed &= Expect(loaded.respawn_seed == 42, "respawn_seed should be loaded.");
    passed &= Expect(loaded.world_size == 2000, "Unspecified keys should keep defaults.");

    passed &= Expect(
        WriteConfigFile(config_path, "hit_damage = 20\nmystery_key = 1\n"),
        "Unknown key config write should succeed.");
    skirmish::core::EngineConfig untouched{};
    passed &= Expect(
        !skirmish::core::ConfigLoader::Load(config_path, untouched, error),
        "Unknown key should fail config load.");
    passed &= Expect(error.find("mystery_key") != std::string::npos, "Error should name the unknown key.");
    passed &= Expect(untouched.hit_damage == 10, "Failed load should leave config untouched.");

    passed &= Expect(
        WriteConfigFile(config_path, "projectile_speed = fast\n"),
        "Type error config write should succeed.");
    passed &= Expect(
        !skirmish::core::ConfigLoader::Load(config_path, untouched, error),
        "Non-integer value should fail config load.");

    passed &= Expect(
        WriteConfigFile(config_path, "participant_width = 0\n"),
        "Range error config write should succeed.");
    passed &= Expect(
        !skirmish::core::ConfigLoader::Load(config_path, untouched, error),
        "Non-positive size should fail config load.");

    passed &= Expect(
        WriteConfigFile(config_path, "hitbox_lifetime_ms = 500\nattack_cooldown_ms = 500\n"),
        "Lifetime config write should succeed.");
    passed &= Expect(
        !skirmish::core::ConfigLoader::Load(config_path, untouched, error),
        "Hitbox lifetime equal to cooldown should fail validation.");
    passed &= Expect(untouched.hitbox_lifetime_ms == 300, "Failed validation should leave config untouched.");

    passed &= Expect(
        WriteConfigFile(config_path, "[combat\nhit_damage = 20\n"),
        "Broken section config write should succeed.");
    passed &= Expect(
        !skirmish::core::ConfigLoader::Load(config_path, untouched, error),
        "Unterminated section header should fail config load.");

    passed &= Expect(
        WriteConfigFile(config_path, "room_id = \"\"\n"),
        "Empty room config write should succeed.");
    passed &= Expect(
        !skirmish::core::ConfigLoader::Load(config_path, untouched, error),
        "Empty room_id should fail config load.");

    passed &= Expect(
        !skirmish::core::ConfigLoader::Load(test_dir / "missing.cfg", untouched, error),
        "Missing file should fail config load.");
    passed &= Expect(!error.empty(), "Missing file should report an error.");

    skirmish::core::LogLevel level = skirmish::core::LogLevel::Info;
    passed &= Expect(
        skirmish::core::Logger::ParseLevel("warn", level) && level == skirmish::core::LogLevel::Warn,
        "Log level 'warn' should parse.");
    passed &= Expect(
        !skirmish::core::Logger::ParseLevel("loud", level) && level == skirmish::core::LogLevel::Warn,
        "Unknown log level should be rejected without changing output.");
    skirmish::core::Logger::SetMinimumLevel(skirmish::core::LogLevel::Error);
    passed &= Expect(
        skirmish::core::Logger::MinimumLevel() == skirmish::core::LogLevel::Error,
        "Minimum log level should be stored.");
    skirmish::core::Logger::SetMinimumLevel(skirmish::core::LogLevel::Info);

    skirmish::core::EngineConfig zero_step{};
    zero_step.border_step = 0;
    passed &= Expect(
        !skirmish::core::ConfigLoader::Validate(zero_step, error),
        "Validate should apply field minimums to built configs.");
    passed &= Expect(error.find("border_step") != std::string::npos, "Minimum error should name the field.");

    skirmish::core::EngineConfig negative_damage{};
    negative_damage.hit_damage = -1;
    passed &= Expect(
        !skirmish::core::ConfigLoader::Validate(negative_damage, error),
        "Negative hit damage should fail validation.");

    skirmish::core::EngineConfig unnamed_room{};
    unnamed_room.room_id.clear();
    passed &= Expect(
        !skirmish::core::ConfigLoader::Validate(unnamed_room, error),
        "Empty room_id should fail validation.");

    skirmish::core::EngineConfig bad_respawn{};
    bad_respawn.respawn_max = 2500;
    passed &= Expect(
        !skirmish::core::ConfigLoader::Validate(bad_respawn, error),
        "Respawn range beyond world size should fail validation.");

    std::filesystem::remove_all(test_dir, ec);

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] skirmish_config_tests\n";
    return 0;
}
