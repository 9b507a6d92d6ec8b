// [AI_AGENT] Monster AI state machine tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ai/MonsterAISystem.hpp"
#include "TestHarness.hpp"
#include <entt/entt.hpp>
#include <glm/glm.hpp>

using namespace Midgard;
using namespace Midgard::Test;
using Catch::Approx;

TEST_CASE("Facing from movement direction", "[ai]") {
    REQUIRE(MonsterAISystem::facingFor({1.0f, 0.2f}) == Facing::RIGHT);
    REQUIRE(MonsterAISystem::facingFor({-1.0f, 0.2f}) == Facing::LEFT);
    REQUIRE(MonsterAISystem::facingFor({0.1f, 1.0f}) == Facing::FRONT);
    REQUIRE(MonsterAISystem::facingFor({0.1f, -1.0f}) == Facing::BACK);
}

TEST_CASE("Target selection", "[ai]") {
    TestWorld world;
    MonsterAISystem& ai = world.server.getMonsterAI();

    SECTION("Nearest living player inside the aggro radius") {
        REQUIRE(world.join(1, "a@x", "field_1", positionAt(700.0f, 500.0f)));
        REQUIRE(world.join(2, "b@x", "field_1", positionAt(650.0f, 500.0f)));
        EntityID slime = world.server.getStore().findMonster(FIELD_SLIME);

        REQUIRE(ai.findTarget(slime) == world.player("b@x"));

        world.get<CombatState>(world.player("b@x")).isDead = true;
        REQUIRE(ai.findTarget(slime) == world.player("a@x"));
    }

    SECTION("The aggro boundary itself is outside") {
        REQUIRE(world.join(1, "a@x", "field_1", positionAt(750.0f, 500.0f)));
        EntityID slime = world.server.getStore().findMonster(FIELD_SLIME);

        REQUIRE(ai.findTarget(slime) == entt::null);

        ai.updateMonster(slime, 100);
        REQUIRE(world.get<MonsterBrain>(slime).state == MonsterState::IDLE);
        REQUIRE_FALSE(world.get<MonsterBrain>(slime).target.has_value());
        REQUIRE(world.get<Transform>(slime).position == glm::vec2(600.0f, 500.0f));
    }
}

TEST_CASE("Chasing", "[ai]") {
    TestWorld world;
    REQUIRE(world.join(1, "a@x", "field_1", positionAt(700.0f, 500.0f)));
    MonsterAISystem& ai = world.server.getMonsterAI();
    EntityID slime = world.server.getStore().findMonster(FIELD_SLIME);
    world.channel.clear();

    ai.updateMonster(slime, 200);

    const MonsterBrain& brain = world.get<MonsterBrain>(slime);
    const Transform& transform = world.get<Transform>(slime);
    REQUIRE(brain.state == MonsterState::CHASING);
    REQUIRE(brain.target == std::optional<std::string>("a@x"));
    REQUIRE(transform.position.x == Approx(602.0f));
    REQUIRE(transform.position.y == Approx(500.0f));
    REQUIRE(transform.facing == Facing::RIGHT);
    REQUIRE(world.channel.count(1, Events::MONSTER_MOVE) == 1);

    SECTION("Move broadcasts are throttled") {
        ai.updateMonster(slime, 250);
        REQUIRE(world.get<Transform>(slime).position.x == Approx(604.0f));
        REQUIRE(world.channel.count(1, Events::MONSTER_MOVE) == 1);

        ai.updateMonster(slime, 301);
        REQUIRE(world.channel.count(1, Events::MONSTER_MOVE) == 2);
    }
}

TEST_CASE("Attacking", "[ai]") {
    TestWorld world;
    REQUIRE(world.join(1, "a@x", "field_1", positionAt(620.0f, 500.0f)));
    MonsterAISystem& ai = world.server.getMonsterAI();
    Scheduler& scheduler = world.server.getScheduler();
    EntityID slime = world.server.getStore().findMonster(FIELD_SLIME);
    EntityID player = world.player("a@x");

    ai.updateMonster(slime, 100);

    REQUIRE(world.get<MonsterBrain>(slime).state == MonsterState::ATTACKING);
    REQUIRE(world.get<CombatState>(player).hp == Approx(115.0));
    REQUIRE(world.channel.last(1, Events::MONSTER_ATTACK)->payload["targetEmail"] == "a@x");
    REQUIRE(world.channel.last(1, Events::PLAYER_HP_CHANGED)->payload["attacker"] == FIELD_SLIME);

    SECTION("Returns to idle after the attack window") {
        scheduler.advance(100 + Constants::ATTACK_STATE_RESET_MS - 1);
        REQUIRE(world.get<MonsterBrain>(slime).state == MonsterState::ATTACKING);

        scheduler.advance(100 + Constants::ATTACK_STATE_RESET_MS);
        REQUIRE(world.get<MonsterBrain>(slime).state == MonsterState::IDLE);
    }

    SECTION("Respects the attack cooldown") {
        ai.updateMonster(slime, 1599);
        REQUIRE(world.get<CombatState>(player).hp == Approx(115.0));

        ai.updateMonster(slime, 1600);
        REQUIRE(world.get<CombatState>(player).hp == Approx(110.0));
    }

    SECTION("Dead players are left alone") {
        world.get<CombatState>(player).isDead = true;
        ai.updateMonster(slime, 2000);
        REQUIRE(world.get<CombatState>(player).hp == Approx(115.0));
        REQUIRE_FALSE(world.get<MonsterBrain>(slime).target.has_value());
    }
}

TEST_CASE("A strike that empties the map", "[ai][death]") {
    TestWorld world;
    REQUIRE(world.join(1, "a@x", "field_1", positionAt(620.0f, 500.0f)));
    EntityID player = world.player("a@x");
    StateStore& store = world.server.getStore();
    world.get<CombatState>(player).hp = 3.0;

    world.server.getMonsterAI().update(100);

    REQUIRE(world.get<CombatState>(player).isDead);
    REQUIRE(world.get<Transform>(player).mapId == "town_1");
    REQUIRE(store.findMonster(FIELD_SLIME) == entt::null);
    REQUIRE_FALSE(world.server.getScheduler().isPending({TaskKind::MONSTER_ATTACK_RESET, FIELD_SLIME}));
    REQUIRE(world.server.getScheduler().isPending({TaskKind::PLAYER_REVIVE, "a@x"}));
    REQUIRE(store.checkConsistency());

    // Later ticks run cleanly over the empty field
    world.server.tick(200);
    world.server.tick(400);
    REQUIRE(store.monsterCountInMap("field_1") == 0);
}

TEST_CASE("AI ignores monsters on empty maps", "[ai]") {
    TestWorld world;
    StateStore& store = world.server.getStore();
    EntityID orphan = store.upsertMonster("orphan", "field_1");
    world.get<CombatState>(orphan).hp = 10.0;
    world.get<MonsterBrain>(orphan).aggroRadius = 1000.0f;

    world.server.getMonsterAI().update(1000);

    REQUIRE(world.get<MonsterBrain>(orphan).state == MonsterState::IDLE);
    REQUIRE(world.channel.sent.empty());
}

TEST_CASE("Idle monsters wander", "[ai]") {
    TestWorld world;
    REQUIRE(world.join(1, "a@x", "field_1", positionAt(100.0f, 100.0f)));
    MonsterAISystem& ai = world.server.getMonsterAI();
    EntityID slime = world.server.getStore().findMonster(FIELD_SLIME);
    world.channel.clear();

    // Nobody in aggro range; step until the first wander fires
    const glm::vec2 start = world.get<Transform>(slime).position;
    uint32_t now = Constants::WANDER_MIN_GAP_MS;
    while (world.get<Transform>(slime).position == start && now < 1000000) {
        now += Constants::MONSTER_AI_INTERVAL_MS;
        ai.updateMonster(slime, now);
    }

    const glm::vec2 moved = world.get<Transform>(slime).position;
    REQUIRE(moved != start);
    REQUIRE(glm::distance(start, moved) == Approx(Constants::WANDER_STEP));
    REQUIRE(world.get<MonsterBrain>(slime).state == MonsterState::IDLE);
    REQUIRE(world.get<MonsterBrain>(slime).lastUpdateMs == now);
    REQUIRE(world.channel.count(1, Events::MONSTER_MOVE) == 1);

    SECTION("No second step inside the gap") {
        for (int i = 0; i < 2000; ++i) {
            ai.updateMonster(slime, now + Constants::WANDER_MIN_GAP_MS);
        }
        REQUIRE(world.get<Transform>(slime).position == moved);
        REQUIRE(world.channel.count(1, Events::MONSTER_MOVE) == 1);
    }
}
