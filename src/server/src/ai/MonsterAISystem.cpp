// [AI_AGENT] Monster AI implementation

#include "ai/MonsterAISystem.hpp"
#include "netcode/Events.hpp"
#include "Constants.hpp"
#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace Midgard {

namespace {

constexpr float TWO_PI = 6.28318530718f;

} // anonymous namespace

MonsterAISystem::MonsterAISystem(StateStore& store, AreaOfInterestSystem& aoi,
                                 CombatSystem& combat, Scheduler& scheduler,
                                 RandomSource& random)
    : store_(store), aoi_(aoi), combat_(combat), scheduler_(scheduler), random_(random) {}

void MonsterAISystem::update(uint32_t nowMs) {
    // Snapshot first: a strike can kill the last player on a map, and the
    // resulting cleanup destroys that map's monsters mid-iteration.
    const std::vector<EntityID> monsters = store_.allMonsters();

    for (EntityID monster : monsters) {
        if (!store_.registry().valid(monster)) continue;
        updateMonster(monster, nowMs);
    }
}

void MonsterAISystem::updateMonster(EntityID monster, uint32_t nowMs) {
    Registry& registry = store_.registry();
    const CombatState* combat = registry.try_get<CombatState>(monster);
    const Transform* transform = registry.try_get<Transform>(monster);
    if (!combat || !transform || combat->hp <= 0.0) return;
    if (store_.playerCountInMap(transform->mapId) == 0) return;

    MonsterBrain& brain = registry.get<MonsterBrain>(monster);
    EntityID target = findTarget(monster);

    if (target == entt::null) {
        brain.target.reset();
        brain.state = MonsterState::IDLE;
        wander(monster, nowMs);
        return;
    }

    brain.target = registry.get<PlayerInfo>(target).identity;
    const glm::vec2 targetPos = registry.get<Transform>(target).position;
    const float dist = glm::distance(transform->position, targetPos);

    if (dist > brain.attackRadius) {
        chase(monster, targetPos, nowMs);
        return;
    }

    const bool cooledDown = !brain.lastAttackMs ||
                            nowMs - *brain.lastAttackMs >= brain.attackCooldownMs;
    if (cooledDown) {
        strike(monster, target, nowMs);
    }
}

EntityID MonsterAISystem::findTarget(EntityID monster) const {
    const Registry& registry = store_.registry();
    const Transform& transform = registry.get<Transform>(monster);
    const MonsterBrain& brain = registry.get<MonsterBrain>(monster);

    EntityID closest = entt::null;
    float closestDist = std::numeric_limits<float>::max();

    for (EntityID player : store_.playersInMap(transform.mapId)) {
        if (registry.get<CombatState>(player).isDead) continue;

        float dist = glm::distance(transform.position, registry.get<Transform>(player).position);
        if (dist < brain.aggroRadius && dist < closestDist) {
            closestDist = dist;
            closest = player;
        }
    }
    return closest;
}

Facing MonsterAISystem::facingFor(const glm::vec2& direction) {
    if (std::abs(direction.x) > std::abs(direction.y)) {
        return direction.x > 0.0f ? Facing::RIGHT : Facing::LEFT;
    }
    return direction.y > 0.0f ? Facing::FRONT : Facing::BACK;
}

void MonsterAISystem::chase(EntityID monster, const glm::vec2& targetPos, uint32_t nowMs) {
    Registry& registry = store_.registry();
    Transform& transform = registry.get<Transform>(monster);
    MonsterBrain& brain = registry.get<MonsterBrain>(monster);
    const CombatState& combat = registry.get<CombatState>(monster);

    const glm::vec2 direction = glm::normalize(targetPos - transform.position);
    transform.position += direction * static_cast<float>(combat.speed);
    transform.facing = facingFor(direction);
    brain.state = MonsterState::CHASING;

    if (nowMs - brain.lastUpdateMs > Constants::MONSTER_BROADCAST_THROTTLE_MS) {
        aoi_.broadcastToMap(transform.mapId, Events::MONSTER_MOVE, Events::monsterMove(registry, monster));
        brain.lastUpdateMs = nowMs;
    }
}

void MonsterAISystem::strike(EntityID monster, EntityID target, uint32_t nowMs) {
    Registry& registry = store_.registry();
    MonsterBrain& brain = registry.get<MonsterBrain>(monster);
    const Transform& transform = registry.get<Transform>(monster);

    brain.state = MonsterState::ATTACKING;
    brain.lastAttackMs = nowMs;

    const std::string& targetIdentity = registry.get<PlayerInfo>(target).identity;
    aoi_.broadcastToMap(transform.mapId, Events::MONSTER_ATTACK,
                        Events::monsterAttack(registry, monster, targetIdentity));

    scheduler_.scheduleAt(TaskKey{TaskKind::MONSTER_ATTACK_RESET, brain.id},
                          nowMs + Constants::ATTACK_STATE_RESET_MS,
                          [this](const std::string& id, uint32_t) {
                              EntityID m = store_.findMonster(id);
                              if (m == entt::null) return;
                              Registry& reg = store_.registry();
                              MonsterBrain& b = reg.get<MonsterBrain>(m);
                              if (reg.get<CombatState>(m).hp > 0.0 && b.state == MonsterState::ATTACKING) {
                                  b.state = MonsterState::IDLE;
                              }
                          });

    // May kill the target and, through map cleanup, this monster. Nothing
    // below may touch the monster's components.
    combat_.monsterAttackPlayer(monster, target, nowMs);
}

void MonsterAISystem::wander(EntityID monster, uint32_t nowMs) {
    Registry& registry = store_.registry();
    MonsterBrain& brain = registry.get<MonsterBrain>(monster);

    if (!random_.chance(Constants::WANDER_PROBABILITY)) return;
    if (nowMs - brain.lastUpdateMs <= Constants::WANDER_MIN_GAP_MS) return;

    Transform& transform = registry.get<Transform>(monster);
    const float angle = random_.range(0.0f, TWO_PI);
    transform.position += glm::vec2(std::cos(angle), std::sin(angle)) * Constants::WANDER_STEP;

    aoi_.broadcastToMap(transform.mapId, Events::MONSTER_MOVE, Events::monsterMove(registry, monster));
    brain.lastUpdateMs = nowMs;
}

} // namespace Midgard
