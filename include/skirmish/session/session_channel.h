#pragma once

#include "wire/byte_io.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace skirmish::session {

struct CallOptions final {
    // Minimum spacing between two calls of the same name; 0 disables throttling.
    std::uint32_t throttle_ms = 0;
};

using EventHandler = std::function<void(wire::ByteSpan payload)>;
using StateHandler = std::function<void(wire::ByteSpan encoded_state)>;

// Narrow view of the remote session server. Delivery is at most once per
// published message, and handlers run on the caller's single logic thread.
class ISessionChannel {
public:
    virtual ~ISessionChannel() = default;

    virtual std::string Account() const = 0;
    virtual void Subscribe(
        std::string_view room_id,
        std::string_view event_name,
        EventHandler handler) = 0;
    virtual void SubscribeState(std::string_view room_id, StateHandler handler) = 0;
    virtual void Call(
        std::string_view name,
        wire::ByteSpan args,
        const CallOptions& options) = 0;
};

}  // namespace skirmish::session
