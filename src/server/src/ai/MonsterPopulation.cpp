// [AI_AGENT] Monster population: spawn, cleanup, respawn

#include "ai/MonsterPopulation.hpp"
#include "netcode/Events.hpp"
#include "Constants.hpp"
#include <iostream>
#include <vector>

namespace Midgard {

MonsterPopulation::MonsterPopulation(StateStore& store, const MapCatalog& catalog,
                                     AreaOfInterestSystem& aoi, Scheduler& scheduler,
                                     RandomSource& random)
    : store_(store), catalog_(catalog), aoi_(aoi), scheduler_(scheduler), random_(random) {}

size_t MonsterPopulation::ensureSpawned(const std::string& mapId, uint32_t nowMs) {
    const MonsterSpawnConfig* spawn = catalog_.findSpawn(mapId);
    if (!spawn || spawn->types.empty()) {
        return 0;
    }

    Registry& registry = store_.registry();
    size_t spawned = 0;

    while (store_.monsterCountInMap(mapId) < spawn->count) {
        const std::string& type = spawn->types[random_.index(spawn->types.size())];
        const MonsterTypeDef* def = catalog_.findMonsterType(type);
        if (!def) {
            std::cerr << "[AI] Unknown monster type " << type << " for map " << mapId << std::endl;
            break;
        }

        std::string id = mapId + "_" + type + "_" + std::to_string(++serial_);
        EntityID monster = store_.upsertMonster(id, mapId);

        glm::vec2 origin(random_.range(spawn->bounds.minX, spawn->bounds.maxX),
                         random_.range(spawn->bounds.minY, spawn->bounds.maxY));

        Transform& transform = registry.get<Transform>(monster);
        transform.position = origin;
        transform.facing = Facing::FRONT;

        CombatState& combat = registry.get<CombatState>(monster);
        combat.hp = def->hp;
        combat.maxHp = def->hp;
        combat.attack = def->attack;
        combat.speed = def->speed;

        MonsterBrain& brain = registry.get<MonsterBrain>(monster);
        brain.type = type;
        brain.spawnOrigin = origin;
        brain.state = MonsterState::IDLE;
        brain.aggroRadius = def->aggroRadius;
        brain.attackRadius = def->attackRadius;
        brain.attackCooldownMs = def->attackCooldownMs;
        brain.lastUpdateMs = nowMs;

        aoi_.broadcastToMap(mapId, Events::MONSTER_SPAWN, Events::monsterSpawn(registry, monster, false));
        ++spawned;
    }

    if (spawned > 0) {
        std::cout << "[AI] Monsters ensured for map " << mapId << " ("
                  << store_.monsterCountInMap(mapId) << "/" << spawn->count << ")" << std::endl;
    }
    return spawned;
}

bool MonsterPopulation::cleanupIfEmpty(const std::string& mapId) {
    if (store_.playerCountInMap(mapId) > 0) {
        return false;
    }

    const Registry& registry = store_.registry();
    std::vector<std::string> ids;
    for (EntityID monster : store_.monstersInMap(mapId)) {
        ids.push_back(registry.get<MonsterBrain>(monster).id);
    }
    for (const auto& id : ids) {
        scheduler_.cancelAllFor(id);
    }

    size_t monsters = store_.removeAllMonstersInMap(mapId);
    size_t drops = store_.clearDrops(mapId);
    if (monsters == 0 && drops == 0) {
        return false;
    }

    std::cout << "[AI] Cleared " << monsters << " monsters and " << drops
              << " drops for empty map " << mapId << std::endl;
    return true;
}

void MonsterPopulation::scheduleRespawn(const std::string& monsterId, uint32_t nowMs) {
    scheduler_.scheduleAt(TaskKey{TaskKind::MONSTER_RESPAWN, monsterId},
                          nowMs + Constants::MONSTER_RESPAWN_DELAY_MS,
                          [this](const std::string& id, uint32_t) { respawn(id); });
}

bool MonsterPopulation::respawn(const std::string& monsterId) {
    EntityID monster = store_.findMonster(monsterId);
    if (monster == entt::null) {
        return false;
    }

    Registry& registry = store_.registry();
    MonsterBrain& brain = registry.get<MonsterBrain>(monster);
    Transform& transform = registry.get<Transform>(monster);
    CombatState& combat = registry.get<CombatState>(monster);

    combat.hp = combat.maxHp;
    transform.position = brain.spawnOrigin;
    brain.state = MonsterState::IDLE;
    brain.target.reset();
    brain.lastHitBy.reset();

    aoi_.broadcastToMap(transform.mapId, Events::MONSTER_SPAWN,
                        Events::monsterSpawn(registry, monster, false));
    return true;
}

size_t MonsterPopulation::sendSnapshot(EntityID player) {
    const Registry& registry = store_.registry();
    const Transform* transform = registry.try_get<Transform>(player);
    if (!transform) return 0;

    size_t sent = 0;
    for (EntityID monster : store_.monstersInMap(transform->mapId)) {
        if (registry.get<CombatState>(monster).hp <= 0.0) continue;
        if (aoi_.sendTo(player, Events::MONSTER_SPAWN, Events::monsterSpawn(registry, monster, true))) {
            ++sent;
        }
    }
    return sent;
}

} // namespace Midgard
