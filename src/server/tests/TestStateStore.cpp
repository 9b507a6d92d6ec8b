// [ECS_AGENT] State store unit tests

#include <catch2/catch_test_macros.hpp>
#include "ecs/StateStore.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>

using namespace Midgard;

TEST_CASE("StateStore player records", "[state]") {
    StateStore store;

    SECTION("Upsert creates once and returns the same entity afterwards") {
        auto [first, created] = store.upsertPlayer("a@x");
        auto [second, createdAgain] = store.upsertPlayer("a@x");

        REQUIRE(created);
        REQUIRE_FALSE(createdAgain);
        REQUIRE(first == second);
        REQUIRE(store.playerCount() == 1);
        REQUIRE(store.findPlayer("a@x") == first);
    }

    SECTION("New players carry every player component") {
        EntityID player = store.upsertPlayer("a@x").first;
        const Registry& registry = store.registry();

        REQUIRE(registry.all_of<PlayerTag, PlayerInfo, Transform, Progression,
                                Attributes, CombatState, Equipment, Inventory,
                                ActionTimers>(player));
        REQUIRE(registry.get<PlayerInfo>(player).identity == "a@x");
        REQUIRE(registry.get<Progression>(player).statPoints == Constants::INITIAL_STAT_POINTS);
        REQUIRE_FALSE(store.isRegistered(player));
    }

    SECTION("Unknown identity is null") {
        REQUIRE(store.findPlayer("nobody") == entt::null);
    }
}

TEST_CASE("StateStore map membership", "[state]") {
    StateStore store;
    EntityID a = store.upsertPlayer("a@x").first;
    EntityID b = store.upsertPlayer("b@x").first;

    SECTION("Adding registers once") {
        REQUIRE(store.addPlayerToMap(a, "town_1"));
        REQUIRE_FALSE(store.addPlayerToMap(a, "town_1"));
        REQUIRE(store.playerCountInMap("town_1") == 1);
        REQUIRE(store.isRegistered(a));
        REQUIRE(store.registry().get<Transform>(a).mapId == "town_1");
        REQUIRE(store.checkConsistency());
    }

    SECTION("Adding to another map moves the player between indices") {
        store.addPlayerToMap(a, "town_1");
        store.addPlayerToMap(b, "town_1");
        REQUIRE(store.addPlayerToMap(a, "field_1"));

        REQUIRE(store.playerCountInMap("town_1") == 1);
        REQUIRE(store.playerCountInMap("field_1") == 1);
        REQUIRE(store.playersInMap("field_1").front() == a);
        REQUIRE(store.checkConsistency());
    }

    SECTION("Removing returns the map left") {
        store.addPlayerToMap(a, "town_1");

        auto left = store.removePlayerFromMap(a);
        REQUIRE(left.has_value());
        REQUIRE(*left == "town_1");
        REQUIRE_FALSE(store.removePlayerFromMap(a).has_value());
        REQUIRE(store.playerCountInMap("town_1") == 0);
        REQUIRE(store.mapsWithPlayers().empty());
        REQUIRE(store.checkConsistency());
    }

    SECTION("Maps with players lists only occupied maps") {
        store.addPlayerToMap(a, "town_1");
        store.addPlayerToMap(b, "field_1");
        store.removePlayerFromMap(b);

        auto maps = store.mapsWithPlayers();
        REQUIRE(maps.size() == 1);
        REQUIRE(maps.front() == "town_1");
    }
}

TEST_CASE("StateStore monsters", "[state]") {
    StateStore store;

    SECTION("Upsert registers the monster in its map") {
        EntityID m = store.upsertMonster("m1", "field_1");

        REQUIRE(store.findMonster("m1") == m);
        REQUIRE(store.monsterCountInMap("field_1") == 1);
        REQUIRE(store.upsertMonster("m1", "field_1") == m);
        REQUIRE(store.registry().get<MonsterBrain>(m).id == "m1");
        REQUIRE(store.checkConsistency());
    }

    SECTION("Remove all destroys the whole map set") {
        store.upsertMonster("m1", "field_1");
        store.upsertMonster("m2", "field_1");
        store.upsertMonster("m3", "field_2");

        REQUIRE(store.removeAllMonstersInMap("field_1") == 2);
        REQUIRE(store.findMonster("m1") == entt::null);
        REQUIRE(store.findMonster("m2") == entt::null);
        REQUIRE(store.monsterCountInMap("field_1") == 0);
        REQUIRE(store.monsterCountInMap("field_2") == 1);
        REQUIRE(store.allMonsters().size() == 1);
        REQUIRE(store.checkConsistency());
    }

    SECTION("Remove single monster") {
        store.upsertMonster("m1", "field_1");
        REQUIRE(store.removeMonster("m1"));
        REQUIRE_FALSE(store.removeMonster("m1"));
        REQUIRE(store.monsterCountInMap("field_1") == 0);
    }
}

TEST_CASE("StateStore floor drops", "[state]") {
    StateStore store;

    FloorDrop drop;
    drop.id = "drop_1";
    drop.mapId = "field_1";
    drop.position = glm::vec2(10.0f, 20.0f);
    drop.amount = 12;
    store.addDrop(drop);

    SECTION("Take is scoped to the drop's map") {
        REQUIRE_FALSE(store.takeDrop("town_1", "drop_1").has_value());

        auto taken = store.takeDrop("field_1", "drop_1");
        REQUIRE(taken.has_value());
        REQUIRE(taken->amount == 12);
        REQUIRE_FALSE(store.takeDrop("field_1", "drop_1").has_value());
    }

    SECTION("Clear drops everything on a map") {
        drop.id = "drop_2";
        store.addDrop(drop);

        REQUIRE(store.dropCountInMap("field_1") == 2);
        REQUIRE(store.clearDrops("field_1") == 2);
        REQUIRE(store.dropCountInMap("field_1") == 0);
    }
}
