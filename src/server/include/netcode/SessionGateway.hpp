#pragma once

#include "ecs/StateStore.hpp"
#include "zones/PlayerLifecycle.hpp"
#include "combat/CombatSystem.hpp"
#include "chat/ChatSystem.hpp"
#include "netcode/SessionChannel.hpp"
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

// [NETWORK_AGENT] Inbound half of the session transport
// Binds connections to player identities, decodes named JSON events and
// dispatches them to the simulation systems. Malformed payloads are logged
// and dropped; events from connections that have not joined are ignored.

namespace Midgard {

class SessionGateway {
public:
    SessionGateway(StateStore& store, PlayerLifecycle& lifecycle, CombatSystem& combat,
                   ChatSystem& chat, SessionChannel& channel);

    // Decode and dispatch one event. Returns true if it reached a handler
    // and was accepted there.
    bool handleEvent(ConnectionID connection, std::string_view event,
                     const nlohmann::json& payload, uint32_t nowMs);

    // Transport-level close; same as an inbound disconnect event
    void onConnectionClosed(ConnectionID connection, uint32_t nowMs);

    // Player bound to connection, or entt::null
    [[nodiscard]] EntityID playerFor(ConnectionID connection) const;

    [[nodiscard]] size_t sessionCount() const { return identities_.size(); }

    // Inbound event counters
    [[nodiscard]] uint64_t getEventsHandled() const { return eventsHandled_; }
    [[nodiscard]] uint64_t getEventsMalformed() const { return eventsMalformed_; }

private:
    bool dispatch(ConnectionID connection, std::string_view event,
                  const nlohmann::json& payload, uint32_t nowMs);

    bool onJoin(ConnectionID connection, const nlohmann::json& payload, uint32_t nowMs);
    bool onDisconnect(ConnectionID connection, uint32_t nowMs);

    // Decoding helpers; throw nlohmann::json::exception on malformed input
    static glm::vec2 parsePosition(const nlohmann::json& value);
    static std::optional<std::string> optionalString(const nlohmann::json& payload, const char* key);
    static nlohmann::json rawField(const nlohmann::json& payload, const char* key);

    // Integer within [lo, hi]; floats and out-of-range numbers give nullopt
    static std::optional<int> boundedInt(const nlohmann::json& value, int lo, int hi);
    bool rejectMalformed(ConnectionID connection, std::string_view event, const char* field);

    StateStore& store_;
    PlayerLifecycle& lifecycle_;
    CombatSystem& combat_;
    ChatSystem& chat_;
    SessionChannel& channel_;

    std::unordered_map<ConnectionID, std::string> identities_;

    uint64_t eventsHandled_{0};
    uint64_t eventsMalformed_{0};
};

} // namespace Midgard
