// [DATABASE_AGENT] Profile persistence and JSON-lines transport tests
// No live Redis needed: only the disconnected paths are exercised here.

#include <catch2/catch_test_macros.hpp>
#include "db/RedisProfileStore.hpp"
#include "netcode/StdioTransport.hpp"
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace Midgard;

TEST_CASE("Redis key naming", "[redis]") {
    REQUIRE(RedisKeys::profile("a@x") == "profile:a@x");
}

TEST_CASE("Redis store before initialize", "[redis]") {
    RedisProfileStore store;
    REQUIRE_FALSE(store.isConnected());

    PlayerProfile profile;
    profile.identity = "a@x";
    profile.attributes.vit = 4;
    profile.statPoints = 2;

    std::vector<bool> results;
    store.saveProfile(profile, [&results](bool success) { results.push_back(success); });

    // Completions only arrive through update()
    REQUIRE(results.empty());
    store.update();
    REQUIRE(results == std::vector<bool>{false});
    REQUIRE(store.getCommandsSent() == 1);
    REQUIRE(store.getCommandsFailed() == 1);

    SECTION("A null callback is allowed") {
        store.saveProfile(profile);
        store.update();
        REQUIRE(store.getCommandsFailed() == 2);
    }

    SECTION("Shutdown without initialize is harmless") {
        store.shutdown();
        REQUIRE_FALSE(store.isConnected());
    }
}

TEST_CASE("JSON-lines input parsing", "[transport]") {
    InboundMessage message;

    SECTION("Full message") {
        REQUIRE(StdioTransport::parseLine(
            R"({"conn": 7, "event": "player:move", "payload": {"position": {"x": 1, "y": 2}}})", message));
        REQUIRE(message.connection == 7);
        REQUIRE(message.event == "player:move");
        REQUIRE(message.payload["position"]["y"] == 2);
    }

    SECTION("Payload defaults to an empty object") {
        REQUIRE(StdioTransport::parseLine(R"({"conn": 3, "event": "disconnect"})", message));
        REQUIRE(message.payload.is_object());
        REQUIRE(message.payload.empty());
    }

    SECTION("Rejected lines") {
        REQUIRE_FALSE(StdioTransport::parseLine("not json", message));
        REQUIRE_FALSE(StdioTransport::parseLine("[1, 2]", message));
        REQUIRE_FALSE(StdioTransport::parseLine(R"({"event": "player:move"})", message));
        REQUIRE_FALSE(StdioTransport::parseLine(R"({"conn": "7", "event": "player:move"})", message));
        REQUIRE_FALSE(StdioTransport::parseLine(R"({"conn": -1, "event": "player:move"})", message));
        REQUIRE_FALSE(StdioTransport::parseLine(R"({"conn": 0, "event": "player:move"})", message));
        REQUIRE_FALSE(StdioTransport::parseLine(R"({"conn": 1, "event": 5})", message));
    }
}

TEST_CASE("JSON-lines output framing", "[transport]") {
    std::istringstream in;
    std::ostringstream out;
    StdioTransport transport(in, out);

    transport.send(4, "chat:message", {{"message", "hi"}});
    transport.send(5, "player:left", {{"email", "a@x"}});

    std::istringstream lines(out.str());
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);
    REQUIRE_FALSE(first.empty());
    REQUIRE_FALSE(second.empty());

    nlohmann::json a = nlohmann::json::parse(first);
    REQUIRE(a["conn"] == 4);
    REQUIRE(a["event"] == "chat:message");
    REQUIRE(a["payload"]["message"] == "hi");

    nlohmann::json b = nlohmann::json::parse(second);
    REQUIRE(b["conn"] == 5);
    REQUIRE(transport.getMessagesSent() == 2);
}
