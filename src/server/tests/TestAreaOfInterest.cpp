// [ZONE_AGENT] Area of Interest system unit tests

#include <catch2/catch_test_macros.hpp>
#include "zones/AreaOfInterest.hpp"
#include "TestHarness.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <string>

using namespace Midgard;
using Midgard::Test::RecordingChannel;

namespace {

EntityID placePlayer(StateStore& store, const std::string& identity, ConnectionID conn,
                     const std::string& mapId, glm::vec2 position, bool online = true) {
    EntityID player = store.upsertPlayer(identity).first;
    PlayerInfo& info = store.registry().get<PlayerInfo>(player);
    info.connectionId = conn;
    info.online = online;
    store.registry().get<Transform>(player).position = position;
    store.addPlayerToMap(player, mapId);
    return player;
}

} // anonymous namespace

TEST_CASE("AOI radius is inclusive", "[aoi]") {
    REQUIRE(AreaOfInterestSystem::withinRadius({0.0f, 0.0f}, {800.0f, 0.0f}));
    REQUIRE_FALSE(AreaOfInterestSystem::withinRadius({0.0f, 0.0f}, {800.5f, 0.0f}));
    REQUIRE(AreaOfInterestSystem::withinRadius({100.0f, 100.0f}, {100.0f, 100.0f}));
}

TEST_CASE("AOI broadcast fan-out", "[aoi]") {
    StateStore store;
    RecordingChannel channel;
    AreaOfInterestSystem aoi(store, channel);

    placePlayer(store, "origin@x", 1, "field_1", {0.0f, 0.0f});
    placePlayer(store, "near@x", 2, "field_1", {300.0f, 400.0f});      // 500 away
    placePlayer(store, "far@x", 3, "field_1", {900.0f, 0.0f});         // 900 away
    placePlayer(store, "elsewhere@x", 4, "town_1", {0.0f, 0.0f});
    placePlayer(store, "offline@x", 5, "field_1", {10.0f, 0.0f}, false);

    const nlohmann::json payload = {{"k", 1}};

    SECTION("Within radius, same map, excluding the origin player") {
        size_t delivered = aoi.broadcastToAOI("origin@x", {0.0f, 0.0f}, "field_1", "test:event", payload);

        REQUIRE(delivered == 1);
        REQUIRE(channel.count(2, "test:event") == 1);
        REQUIRE(channel.count(1, "test:event") == 0);
        REQUIRE(channel.count(3, "test:event") == 0);
        REQUIRE(channel.count(4, "test:event") == 0);
        REQUIRE(channel.count(5, "test:event") == 0);
    }

    SECTION("Empty exclusion includes everyone in range") {
        size_t delivered = aoi.broadcastToAOI("", {0.0f, 0.0f}, "field_1", "test:event", payload);
        REQUIRE(delivered == 2);
    }

    SECTION("Map broadcast ignores distance") {
        size_t delivered = aoi.broadcastToMap("field_1", "test:event", payload);

        REQUIRE(delivered == 3);
        REQUIRE(channel.count(3, "test:event") == 1);
        REQUIRE(channel.count(4, "test:event") == 0);
    }

    SECTION("World broadcast reaches every online player") {
        REQUIRE(aoi.broadcastToAll("test:event", payload) == 4);
    }

    SECTION("Single delivery to an offline player is dropped") {
        EntityID offline = store.findPlayer("offline@x");
        REQUIRE_FALSE(aoi.sendTo(offline, "test:event", payload));
        REQUIRE(channel.sent.empty());
    }

    SECTION("Query returns the same set without sending") {
        auto visible = aoi.playersInAOI("origin@x", {0.0f, 0.0f}, "field_1");

        // Offline players are still in the AOI, they just receive nothing
        REQUIRE(visible.size() == 2);
        REQUIRE(channel.sent.empty());
    }
}
