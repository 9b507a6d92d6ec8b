// [NETWORK_AGENT] Session gateway implementation

#include "netcode/SessionGateway.hpp"
#include "netcode/Events.hpp"
#include "Constants.hpp"
#include <cstdint>
#include <limits>
#include <iostream>
#include <vector>

namespace Midgard {

SessionGateway::SessionGateway(StateStore& store, PlayerLifecycle& lifecycle,
                               CombatSystem& combat, ChatSystem& chat,
                               SessionChannel& channel)
    : store_(store), lifecycle_(lifecycle), combat_(combat), chat_(chat), channel_(channel) {}

EntityID SessionGateway::playerFor(ConnectionID connection) const {
    auto it = identities_.find(connection);
    if (it == identities_.end()) {
        return entt::null;
    }
    return store_.findPlayer(it->second);
}

bool SessionGateway::handleEvent(ConnectionID connection, std::string_view event,
                                 const nlohmann::json& payload, uint32_t nowMs) {
    try {
        bool accepted = dispatch(connection, event, payload, nowMs);
        if (accepted) {
            ++eventsHandled_;
        }
        return accepted;
    } catch (const nlohmann::json::exception& e) {
        ++eventsMalformed_;
        std::cerr << "[GATEWAY] Malformed " << event << " from connection " << connection
                  << ": " << e.what() << std::endl;
        return false;
    }
}

void SessionGateway::onConnectionClosed(ConnectionID connection, uint32_t nowMs) {
    onDisconnect(connection, nowMs);
}

// ============================================================================
// Dispatch
// ============================================================================

bool SessionGateway::dispatch(ConnectionID connection, std::string_view event,
                              const nlohmann::json& payload, uint32_t nowMs) {
    if (event == Events::PLAYER_JOIN) {
        return onJoin(connection, payload, nowMs);
    }

    EntityID player = playerFor(connection);
    if (player == entt::null) {
        return false;
    }

    if (event == Events::DISCONNECT) {
        return onDisconnect(connection, nowMs);
    }

    if (event == Events::PLAYER_MOVE) {
        MoveRequest request;
        request.position = parsePosition(payload.at("position"));
        if (auto direction = optionalString(payload, "direction")) {
            request.facing = parseFacing(*direction);
        }
        if (auto state = optionalString(payload, "state")) {
            request.state = parseAnimationState(*state);
        }
        return lifecycle_.move(player, request, nowMs);
    }

    if (event == Events::PLAYER_ATTACK) {
        return lifecycle_.relayAttack(player, rawField(payload, "damage"));
    }

    if (event == Events::PLAYER_SKILL) {
        return lifecycle_.relaySkill(player, rawField(payload, "skillType"), rawField(payload, "data"));
    }

    if (event == Events::MONSTER_HIT) {
        const auto monsterId = payload.at("monsterId").get<std::string>();
        const auto damage = payload.at("damage").get<double>();
        return combat_.handleMonsterHit(player, monsterId, damage, nowMs);
    }

    if (event == Events::PLAYER_PVP_ATTACK) {
        const auto target = payload.at("targetEmail").get<std::string>();
        return combat_.pvpAttack(player, target, nowMs).accepted;
    }

    if (event == Events::PLAYER_HIT) {
        const auto damage = payload.at("damage").get<double>();
        return combat_.handleReportedHit(player, damage, optionalString(payload, "attackerEmail"), nowMs);
    }

    if (event == Events::PLAYER_ALLOCATE_STAT) {
        const auto stat = payload.at("stat").get<std::string>();
        const auto points = boundedInt(payload.at("points"), std::numeric_limits<int>::min(),
                                       std::numeric_limits<int>::max());
        if (!points) {
            return rejectMalformed(connection, Events::PLAYER_ALLOCATE_STAT, "points");
        }
        auto key = parseAttributeKey(stat);
        if (!key) {
            return false;
        }
        return lifecycle_.allocateStat(player, *key, *points);
    }

    if (event == Events::PLAYER_CHANGE_MAP) {
        const auto mapId = payload.at("map").get<std::string>();
        std::optional<glm::vec2> position;
        if (payload.contains("position") && !payload.at("position").is_null()) {
            position = parsePosition(payload.at("position"));
        }
        return lifecycle_.changeMap(player, mapId, position, nowMs);
    }

    if (event == Events::PLAYER_SEND_CHAT) {
        const auto message = payload.at("message").get<std::string>();
        const auto channel = optionalString(payload, "type").value_or("");
        return chat_.send(player, message, channel, optionalString(payload, "targetEmail"), nowMs)
            == ChatOutcome::DELIVERED;
    }

    if (event == Events::DROP_PICKUP) {
        return lifecycle_.pickupDrop(player, payload.at("dropId").get<std::string>());
    }

    std::cerr << "[GATEWAY] Unknown event " << event << " from connection " << connection << std::endl;
    return false;
}

// ============================================================================
// Session binding
// ============================================================================

bool SessionGateway::onJoin(ConnectionID connection, const nlohmann::json& payload, uint32_t nowMs) {
    JoinRequest request;
    request.identity = payload.at("email").get<std::string>();
    request.mapId = payload.at("map").get<std::string>();
    request.name = optionalString(payload, "name").value_or(request.identity);
    request.classTag = optionalString(payload, "character_class").value_or("assassin");
    if (payload.contains("level") && !payload.at("level").is_null()) {
        auto level = boundedInt(payload.at("level"), std::numeric_limits<int>::min(), Constants::MAX_LEVEL);
        if (!level) {
            return rejectMalformed(connection, Events::PLAYER_JOIN, "level");
        }
        request.level = *level;
    }
    if (payload.contains("xp") && !payload.at("xp").is_null()) {
        auto xp = boundedInt(payload.at("xp"), std::numeric_limits<int>::min(), Constants::MAX_XP);
        if (!xp) {
            return rejectMalformed(connection, Events::PLAYER_JOIN, "xp");
        }
        request.xp = *xp;
    }
    if (payload.contains("position") && !payload.at("position").is_null()) {
        request.position = parsePosition(payload.at("position"));
    }

    // A connection switching identity leaves as the old player first
    auto bound = identities_.find(connection);
    if (bound != identities_.end() && bound->second != request.identity) {
        onDisconnect(connection, nowMs);
    }

    JoinResult result = lifecycle_.join(connection, request, nowMs);
    if (result.error) {
        channel_.send(connection, Events::PLAYER_MAP_ERROR, Events::message(*result.error));
        return false;
    }
    if (result.player == entt::null) {
        return false;
    }

    // The identity now lives on this connection only
    std::vector<ConnectionID> stale;
    for (const auto& [conn, identity] : identities_) {
        if (conn != connection && identity == request.identity) {
            stale.push_back(conn);
        }
    }
    for (ConnectionID conn : stale) {
        identities_.erase(conn);
    }

    identities_[connection] = request.identity;
    return true;
}

bool SessionGateway::onDisconnect(ConnectionID connection, uint32_t nowMs) {
    auto it = identities_.find(connection);
    if (it == identities_.end()) {
        return false;
    }

    EntityID player = store_.findPlayer(it->second);
    identities_.erase(it);
    if (player == entt::null) {
        return false;
    }
    return lifecycle_.disconnect(player, nowMs);
}

// ============================================================================
// Decoding helpers
// ============================================================================

glm::vec2 SessionGateway::parsePosition(const nlohmann::json& value) {
    return glm::vec2(value.at("x").get<float>(), value.at("y").get<float>());
}

std::optional<std::string> SessionGateway::optionalString(const nlohmann::json& payload,
                                                          const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<int> SessionGateway::boundedInt(const nlohmann::json& value, int lo, int hi) {
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    int64_t number = 0;
    if (value.is_number_unsigned()) {
        const auto raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        number = static_cast<int64_t>(raw);
    } else {
        number = value.get<int64_t>();
    }
    if (number < lo || number > hi) {
        return std::nullopt;
    }
    return static_cast<int>(number);
}

bool SessionGateway::rejectMalformed(ConnectionID connection, std::string_view event, const char* field) {
    ++eventsMalformed_;
    std::cerr << "[GATEWAY] Malformed " << event << " from connection " << connection
              << ": bad " << field << std::endl;
    return false;
}

nlohmann::json SessionGateway::rawField(const nlohmann::json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return nullptr;
    }
    return *it;
}

} // namespace Midgard
