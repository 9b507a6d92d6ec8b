#pragma once

#include "ecs/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <string_view>

// [NETWORK_AGENT] Outbound half of the session transport.
// Delivery is reliable and ordered per connection; framing belongs to the
// implementation.

namespace Midgard {

class SessionChannel {
public:
    virtual ~SessionChannel() = default;

    // Push one named event to one connection
    virtual void send(ConnectionID connection, std::string_view event,
                      const nlohmann::json& payload) = 0;
};

} // namespace Midgard
