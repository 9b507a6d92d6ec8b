// [CHAT_AGENT] Chat routing and cooldown tests

#include <catch2/catch_test_macros.hpp>
#include "chat/ChatSystem.hpp"
#include "TestHarness.hpp"
#include <string>

using namespace Midgard;
using namespace Midgard::Test;

TEST_CASE("Chat trimming", "[chat]") {
    REQUIRE(ChatSystem::trim("  hello \t\n") == "hello");
    REQUIRE(ChatSystem::trim("   ").empty());
    REQUIRE(ChatSystem::trim("a b") == "a b");
}

TEST_CASE("Chat channels", "[chat]") {
    TestWorld world;
    REQUIRE(world.join(1, "a@x", "town_1", {{"name", "Alice"}}));
    REQUIRE(world.join(2, "b@x", "town_1"));
    REQUIRE(world.join(3, "c@x", "field_1"));
    ChatSystem& chat = world.server.getChat();
    EntityID alice = world.player("a@x");

    SECTION("Global reaches every online player") {
        REQUIRE(chat.send(alice, "  hi all  ", "global", std::nullopt, 0) == ChatOutcome::DELIVERED);

        REQUIRE(world.channel.count(1, Events::CHAT_MESSAGE) == 1);
        REQUIRE(world.channel.count(2, Events::CHAT_MESSAGE) == 1);
        REQUIRE(world.channel.count(3, Events::CHAT_MESSAGE) == 1);

        const SentEvent* msg = world.channel.last(3, Events::CHAT_MESSAGE);
        REQUIRE(msg->payload["from"] == "Alice");
        REQUIRE(msg->payload["senderEmail"] == "a@x");
        REQUIRE(msg->payload["message"] == "hi all");
        REQUIRE(msg->payload["type"] == "global");
    }

    SECTION("Map chat stays on the sender's map") {
        REQUIRE(chat.send(alice, "hello town", "map", std::nullopt, 0) == ChatOutcome::DELIVERED);
        REQUIRE(world.channel.count(2, Events::CHAT_MESSAGE) == 1);
        REQUIRE(world.channel.count(3, Events::CHAT_MESSAGE) == 0);
    }

    SECTION("Town chat needs a safe zone") {
        REQUIRE(chat.send(alice, "from town", "town", std::nullopt, 0) == ChatOutcome::DELIVERED);
        REQUIRE(world.channel.count(3, Events::CHAT_MESSAGE) == 0);

        EntityID carol = world.player("c@x");
        REQUIRE(chat.send(carol, "from field", "town", std::nullopt, 0) == ChatOutcome::REJECTED);
        REQUIRE(world.channel.last(3, Events::CHAT_ERROR)->payload["message"] == "You are not in a town map.");
    }

    SECTION("Private goes to the target and echoes to the sender") {
        REQUIRE(chat.send(alice, "psst", "private", std::string("c@x"), 0) == ChatOutcome::DELIVERED);

        REQUIRE(world.channel.count(3, Events::CHAT_MESSAGE) == 1);
        REQUIRE(world.channel.count(1, Events::CHAT_MESSAGE) == 1);
        REQUIRE(world.channel.count(2, Events::CHAT_MESSAGE) == 0);
    }

    SECTION("Private to oneself is delivered once") {
        REQUIRE(chat.send(alice, "note", "private", std::string("a@x"), 0) == ChatOutcome::DELIVERED);
        REQUIRE(world.channel.count(1, Events::CHAT_MESSAGE) == 1);
    }

    SECTION("Private to an offline player is dropped without a cooldown") {
        world.server.getGateway().onConnectionClosed(3, 0);

        REQUIRE(chat.send(alice, "psst", "private", std::string("c@x"), 0) == ChatOutcome::IGNORED);
        REQUIRE(chat.send(alice, "psst", "private", std::string("nobody@x"), 0) == ChatOutcome::IGNORED);
        REQUIRE(world.channel.count(1, Events::CHAT_MESSAGE) == 0);

        REQUIRE(chat.send(alice, "psst", "private", std::string("b@x"), 10) == ChatOutcome::DELIVERED);
    }
}

TEST_CASE("Chat validation", "[chat]") {
    TestWorld world;
    REQUIRE(world.join(1, "a@x", "town_1"));
    ChatSystem& chat = world.server.getChat();
    EntityID alice = world.player("a@x");

    SECTION("Too long") {
        std::string text(Constants::CHAT_MAX_LENGTH + 1, 'x');
        REQUIRE(chat.send(alice, text, "global", std::nullopt, 0) == ChatOutcome::REJECTED);
        REQUIRE(world.channel.last(1, Events::CHAT_ERROR)->payload["message"] ==
                "Message is too long (max 200 characters).");
    }

    SECTION("Exactly the limit after trimming is fine") {
        std::string text = "  " + std::string(Constants::CHAT_MAX_LENGTH, 'x') + "  ";
        REQUIRE(chat.send(alice, text, "global", std::nullopt, 0) == ChatOutcome::DELIVERED);
    }

    SECTION("Blank messages are ignored silently") {
        REQUIRE(chat.send(alice, "   ", "global", std::nullopt, 0) == ChatOutcome::IGNORED);
        REQUIRE(world.channel.count(1, Events::CHAT_ERROR) == 0);
    }

    SECTION("Unknown channel") {
        REQUIRE(chat.send(alice, "hi", "guild", std::nullopt, 0) == ChatOutcome::REJECTED);
        REQUIRE(world.channel.last(1, Events::CHAT_ERROR)->payload["message"] == "Invalid chat type.");
    }
}

TEST_CASE("Chat cooldown", "[chat]") {
    TestWorld world;
    REQUIRE(world.join(1, "a@x", "town_1"));
    ChatSystem& chat = world.server.getChat();
    EntityID alice = world.player("a@x");

    REQUIRE(chat.send(alice, "one", "global", std::nullopt, 1000) == ChatOutcome::DELIVERED);

    SECTION("Same channel inside the window is blocked") {
        REQUIRE(chat.send(alice, "two", "global", std::nullopt, 5999) == ChatOutcome::SPAM_BLOCKED);
        REQUIRE(world.channel.last(1, Events::CHAT_SPAM_BLOCKED)->payload["message"] ==
                "You are sending global messages too quickly. Please wait a moment.");
        REQUIRE(chat.send(alice, "three", "global", std::nullopt, 6000) == ChatOutcome::DELIVERED);
    }

    SECTION("Channels cool down independently") {
        REQUIRE(chat.send(alice, "two", "map", std::nullopt, 1001) == ChatOutcome::DELIVERED);
    }

    SECTION("Through the gateway") {
        REQUIRE(world.send(1, Events::PLAYER_SEND_CHAT, {{"message", "hey"}, {"type", "town"}}, 1000));
        REQUIRE_FALSE(world.send(1, Events::PLAYER_SEND_CHAT, {{"message", "hey"}, {"type", "town"}}, 2000));
        REQUIRE(world.channel.count(1, Events::CHAT_SPAM_BLOCKED) == 1);
    }
}
