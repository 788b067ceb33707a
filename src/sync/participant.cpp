#include "sync/participant.h"

#include <algorithm>

namespace skirmish::sync {

int ClampHealth(int health) {
    return std::max(health, 0);
}

}  // namespace skirmish::sync
