// [ZONE_AGENT] World server wiring tests

#include <catch2/catch_test_macros.hpp>
#include "zones/WorldServer.hpp"
#include "TestHarness.hpp"

using namespace Midgard;
using namespace Midgard::Test;

TEST_CASE("World server initialization", "[world]") {
    RecordingChannel channel;
    RecordingProfileStore profiles;
    WorldServer server(channel);

    WorldConfig config;
    config.persistProfiles = false;
    config.rngSeed = 7;

    SECTION("Registers the three periodic tasks") {
        REQUIRE(server.initialize(config, testCatalog(), &profiles));
        REQUIRE(server.getScheduler().periodicCount() == 3);
        REQUIRE(server.getCatalog().defaultTown() == "town_1");
        REQUIRE_FALSE(server.isRunning());
    }

    SECTION("Only once") {
        REQUIRE(server.initialize(config, testCatalog(), &profiles));
        REQUIRE_FALSE(server.initialize(config, testCatalog(), &profiles));
    }

    SECTION("Invalid catalog stops startup") {
        MapCatalog broken = testCatalog();
        broken.setDefaultTown("nowhere");
        REQUIRE_FALSE(server.initialize(config, broken, &profiles));
    }

    SECTION("Unreadable catalog file stops startup") {
        config.mapsFile = "/nonexistent/maps.json";
        REQUIRE_FALSE(server.initialize(config, &profiles));
    }

    SECTION("Built-in catalog without persistence") {
        REQUIRE(server.initialize(config));
        REQUIRE(server.getCatalog().findMap("monster_field_1") != nullptr);
    }

    SECTION("Shutdown request flips the flags") {
        REQUIRE(server.initialize(config, testCatalog(), &profiles));
        server.requestShutdown();
        REQUIRE(server.isShutdownRequested());
        REQUIRE_FALSE(server.isRunning());
    }
}

TEST_CASE("Seeded worlds are reproducible", "[world]") {
    TestWorld first;
    TestWorld second;

    REQUIRE(first.join(1, "a@x", "field_1"));
    REQUIRE(second.join(1, "a@x", "field_1"));
    REQUIRE(first.send(1, Events::MONSTER_HIT, {{"monsterId", FIELD_SLIME}, {"damage", 100}}));
    REQUIRE(second.send(1, Events::MONSTER_HIT, {{"monsterId", FIELD_SLIME}, {"damage", 100}}));

    const SentEvent* a = first.channel.last(1, Events::MONSTER_KILLED);
    const SentEvent* b = second.channel.last(1, Events::MONSTER_KILLED);
    REQUIRE(a != nullptr);
    REQUIRE(b != nullptr);
    REQUIRE(a->payload["bcoins"] == b->payload["bcoins"]);
}
