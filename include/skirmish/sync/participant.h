#pragma once

#include <string>

namespace skirmish::sync {

inline constexpr int kFacingLeft = -1;
inline constexpr int kFacingRight = 1;

struct Participant final {
    std::string id;
    std::string name;
    float x = 0.0F;
    float y = 0.0F;
    int facing = kFacingRight;
    int health = 0;
    // 0 is reserved for the local participant.
    int color_index = 0;
};

int ClampHealth(int health);

}  // namespace skirmish::sync
