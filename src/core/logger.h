#pragma once

#include <string_view>

namespace skirmish::core {

enum class LogLevel : int {
    Info = 0,
    Warn = 1,
    Error = 2,
};

class Logger final {
public:
    static void Info(std::string_view module, std::string_view message);
    static void Warn(std::string_view module, std::string_view message);
    static void Error(std::string_view module, std::string_view message);

    // Lines below `level` are dropped. Defaults to LogLevel::Info.
    static void SetMinimumLevel(LogLevel level);
    static LogLevel MinimumLevel();
    static bool ParseLevel(std::string_view text, LogLevel& out_level);

private:
    static void Write(LogLevel level, std::string_view module, std::string_view message);
};

}  // namespace skirmish::core
