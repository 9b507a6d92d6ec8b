#include "zones/AreaOfInterest.hpp"
#include "Constants.hpp"

namespace Midgard {

AreaOfInterestSystem::AreaOfInterestSystem(StateStore& store, SessionChannel& channel)
    : store_(store), channel_(channel) {}

bool AreaOfInterestSystem::withinRadius(const glm::vec2& a, const glm::vec2& b) {
    return glm::distance(a, b) <= Constants::AOI_RADIUS;
}

ConnectionID AreaOfInterestSystem::connectionOf(EntityID player) const {
    const PlayerInfo* info = store_.registry().try_get<PlayerInfo>(player);
    if (!info || !info->online) {
        return INVALID_CONNECTION;
    }
    return info->connectionId;
}

size_t AreaOfInterestSystem::broadcastToAOI(std::string_view excludeIdentity,
                                            const glm::vec2& origin,
                                            const std::string& mapId,
                                            std::string_view event,
                                            const nlohmann::json& payload) {
    size_t delivered = 0;
    for (EntityID player : playersInAOI(excludeIdentity, origin, mapId)) {
        ConnectionID conn = connectionOf(player);
        if (conn == INVALID_CONNECTION) continue;
        channel_.send(conn, event, payload);
        ++delivered;
    }
    return delivered;
}

size_t AreaOfInterestSystem::broadcastToMap(const std::string& mapId,
                                            std::string_view event,
                                            const nlohmann::json& payload) {
    size_t delivered = 0;
    for (EntityID player : store_.playersInMap(mapId)) {
        ConnectionID conn = connectionOf(player);
        if (conn == INVALID_CONNECTION) continue;
        channel_.send(conn, event, payload);
        ++delivered;
    }
    return delivered;
}

size_t AreaOfInterestSystem::broadcastToAll(std::string_view event,
                                            const nlohmann::json& payload) {
    size_t delivered = 0;
    for (EntityID player : store_.allPlayers()) {
        ConnectionID conn = connectionOf(player);
        if (conn == INVALID_CONNECTION) continue;
        channel_.send(conn, event, payload);
        ++delivered;
    }
    return delivered;
}

bool AreaOfInterestSystem::sendTo(EntityID player, std::string_view event,
                                  const nlohmann::json& payload) {
    ConnectionID conn = connectionOf(player);
    if (conn == INVALID_CONNECTION) {
        return false;
    }
    channel_.send(conn, event, payload);
    return true;
}

std::vector<EntityID> AreaOfInterestSystem::playersInAOI(std::string_view excludeIdentity,
                                                         const glm::vec2& origin,
                                                         const std::string& mapId) const {
    const Registry& registry = store_.registry();
    std::vector<EntityID> result;

    for (EntityID player : store_.playersInMap(mapId)) {
        const PlayerInfo& info = registry.get<PlayerInfo>(player);
        if (!excludeIdentity.empty() && info.identity == excludeIdentity) continue;

        const Transform& transform = registry.get<Transform>(player);
        if (withinRadius(origin, transform.position)) {
            result.push_back(player);
        }
    }
    return result;
}

} // namespace Midgard
