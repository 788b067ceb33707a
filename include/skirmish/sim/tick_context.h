#pragma once

#include <cstdint>

namespace skirmish::sim {

struct TickContext final {
    std::uint64_t tick_index = 0;
    std::uint64_t now_ms = 0;
    double fixed_delta_seconds = 0.0;
};

}  // namespace skirmish::sim
