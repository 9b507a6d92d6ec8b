#pragma once

#include "ecs/StateStore.hpp"
#include "netcode/SessionChannel.hpp"
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// [ZONE_AGENT] Area of Interest (AOI) system for event fan-out
// Decides which connected players receive an event. Plain Euclidean distance
// over the map membership index; map populations are small enough that no
// spatial index is kept.

namespace Midgard {

class AreaOfInterestSystem {
public:
    AreaOfInterestSystem(StateStore& store, SessionChannel& channel);

    // True when b is inside the AOI radius around a (inclusive)
    [[nodiscard]] static bool withinRadius(const glm::vec2& a, const glm::vec2& b);

    // Fan-out to same-map members within the radius of origin, skipping
    // excludeIdentity (may be empty) and players without a connection.
    // Returns the number of deliveries.
    size_t broadcastToAOI(std::string_view excludeIdentity, const glm::vec2& origin,
                          const std::string& mapId, std::string_view event,
                          const nlohmann::json& payload);

    // Fan-out to every connected member of mapId regardless of distance
    size_t broadcastToMap(const std::string& mapId, std::string_view event,
                          const nlohmann::json& payload);

    // Fan-out to every connected player in the world
    size_t broadcastToAll(std::string_view event, const nlohmann::json& payload);

    // Single delivery; dropped silently when the player is offline
    bool sendTo(EntityID player, std::string_view event, const nlohmann::json& payload);

    // Snapshot of same-map members within the radius of origin, excluding
    // excludeIdentity. Read-only.
    [[nodiscard]] std::vector<EntityID> playersInAOI(std::string_view excludeIdentity,
                                                     const glm::vec2& origin,
                                                     const std::string& mapId) const;

private:
    [[nodiscard]] ConnectionID connectionOf(EntityID player) const;

    StateStore& store_;
    SessionChannel& channel_;
};

} // namespace Midgard
