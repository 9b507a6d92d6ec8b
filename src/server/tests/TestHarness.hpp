#pragma once

#include "zones/WorldServer.hpp"
#include "netcode/SessionChannel.hpp"
#include "db/ProfileStore.hpp"
#include "netcode/Events.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// [ZONE_AGENT] Shared test doubles and a small deterministic world

namespace Midgard {
namespace Test {

struct SentEvent {
    ConnectionID connection{INVALID_CONNECTION};
    std::string event;
    nlohmann::json payload;
};

// Captures every outbound event in send order
class RecordingChannel : public SessionChannel {
public:
    void send(ConnectionID connection, std::string_view event,
              const nlohmann::json& payload) override {
        sent.push_back({connection, std::string(event), payload});
    }

    [[nodiscard]] size_t count(ConnectionID connection, std::string_view event) const {
        size_t n = 0;
        for (const auto& e : sent) {
            if (e.connection == connection && e.event == event) ++n;
        }
        return n;
    }

    [[nodiscard]] size_t countEvent(std::string_view event) const {
        size_t n = 0;
        for (const auto& e : sent) {
            if (e.event == event) ++n;
        }
        return n;
    }

    // Most recent matching event, or nullptr
    [[nodiscard]] const SentEvent* last(ConnectionID connection, std::string_view event) const {
        for (auto it = sent.rbegin(); it != sent.rend(); ++it) {
            if (it->connection == connection && it->event == event) return &*it;
        }
        return nullptr;
    }

    void clear() { sent.clear(); }

    std::vector<SentEvent> sent;
};

// Holds completions until update(), like the Redis store does
class RecordingProfileStore : public ProfileStore {
public:
    void saveProfile(const PlayerProfile& profile, SaveCallback callback = nullptr) override {
        saved.push_back(profile);
        pending_.emplace_back(std::move(callback));
    }

    void update() override {
        std::vector<SaveCallback> ready;
        ready.swap(pending_);
        for (auto& callback : ready) {
            if (callback) callback(succeed);
            ++completed;
        }
    }

    bool succeed{true};
    size_t completed{0};
    std::vector<PlayerProfile> saved;

private:
    std::vector<SaveCallback> pending_;
};

// town_1 (safe, spawn 100,100)
// field_1 (spawn 500,500, one slime pinned at 600,500)
// pvp_arena (PvP, level 10+, spawn 300,300)
inline MapCatalog testCatalog() {
    MapCatalog catalog;
    catalog.addMap({"town_1", glm::vec2(100.0f, 100.0f), true, std::nullopt, false});
    catalog.addMap({"field_1", glm::vec2(500.0f, 500.0f), false, std::nullopt, false});
    catalog.addMap({"pvp_arena", glm::vec2(300.0f, 300.0f), false, 10, true});
    catalog.setDefaultTown("town_1");

    catalog.addMonsterType({"slime", 50.0, 5.0, 2.0f, 150.0f, 40.0f, 1500, 5, {"potion"}});
    catalog.addSpawn({"field_1", 1, {"slime"}, SpawnBounds{600.0f, 600.0f, 500.0f, 500.0f}});
    return catalog;
}

inline constexpr const char* FIELD_SLIME = "field_1_slime_1";

// A WorldServer over a recording channel with a fixed seed and no Redis
struct TestWorld {
    explicit TestWorld(bool trustClientDamage = true) {
        WorldConfig config;
        config.persistProfiles = false;
        config.rngSeed = 1234;
        config.trustClientDamage = trustClientDamage;
        ready = server.initialize(config, testCatalog(), &profiles);
    }

    bool join(ConnectionID conn, const std::string& email, const std::string& map,
              nlohmann::json extra = nlohmann::json::object(), uint32_t nowMs = 0) {
        nlohmann::json payload = std::move(extra);
        payload["email"] = email;
        payload["map"] = map;
        return server.getGateway().handleEvent(conn, Events::PLAYER_JOIN, payload, nowMs);
    }

    bool send(ConnectionID conn, std::string_view event, const nlohmann::json& payload,
              uint32_t nowMs = 0) {
        return server.getGateway().handleEvent(conn, event, payload, nowMs);
    }

    [[nodiscard]] EntityID player(const std::string& email) {
        return server.getStore().findPlayer(email);
    }

    template <typename Component>
    Component& get(EntityID entity) {
        return server.getStore().registry().get<Component>(entity);
    }

    RecordingChannel channel;
    RecordingProfileStore profiles;
    WorldServer server{channel};
    bool ready{false};
};

inline nlohmann::json positionAt(float x, float y) {
    return {{"position", {{"x", x}, {"y", y}}}};
}

} // namespace Test
} // namespace Midgard
