// [COMBAT_AGENT] Combat system implementation
// Damage application, kill credit, loot, leveling and PvP

#include "combat/CombatSystem.hpp"
#include "combat/StatPipeline.hpp"
#include "netcode/Events.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>

namespace Midgard {

// ============================================================================
// CombatSystem Implementation
// ============================================================================

CombatSystem::CombatSystem(StateStore& store, const MapCatalog& catalog,
                           AreaOfInterestSystem& aoi, MonsterPopulation& population,
                           RandomSource& random, const CombatConfig& config)
    : store_(store), catalog_(catalog), aoi_(aoi), population_(population),
      random_(random), config_(config) {}

bool CombatSystem::isAlivePlayer(EntityID entity) const {
    const Registry& registry = store_.registry();
    if (!registry.valid(entity) || !registry.all_of<PlayerTag>(entity)) {
        return false;
    }
    return !registry.get<CombatState>(entity).isDead;
}

bool CombatSystem::applyPlayerDamage(EntityID victim, double damage,
                                     const std::optional<std::string>& attacker,
                                     uint32_t nowMs) {
    if (!isAlivePlayer(victim)) {
        return false;
    }

    Registry& registry = store_.registry();
    CombatState& combat = registry.get<CombatState>(victim);
    const PlayerInfo& info = registry.get<PlayerInfo>(victim);
    const Transform& transform = registry.get<Transform>(victim);

    combat.hp = std::clamp(combat.hp - damage, 0.0, combat.maxHp);

    aoi_.sendTo(victim, Events::PLAYER_HP_CHANGED, Events::hpChanged(combat, damage, attacker));
    aoi_.broadcastToAOI(info.identity, transform.position, transform.mapId,
                        Events::PLAYER_DAMAGED, Events::playerDamaged(info.identity, damage, attacker));

    if (combat.hp <= 0.0 && onPlayerDeath_) {
        onPlayerDeath_(victim, nowMs);
    }
    return true;
}

bool CombatSystem::monsterAttackPlayer(EntityID monster, EntityID target, uint32_t nowMs) {
    const Registry& registry = store_.registry();
    const MonsterBrain* brain = registry.try_get<MonsterBrain>(monster);
    const CombatState* combat = registry.try_get<CombatState>(monster);
    if (!brain || !combat || combat->hp <= 0.0) {
        return false;
    }
    return applyPlayerDamage(target, combat->attack, brain->id, nowMs);
}

bool CombatSystem::handleMonsterHit(EntityID attacker, const std::string& monsterId,
                                    double reportedDamage, uint32_t nowMs) {
    if (!isAlivePlayer(attacker) || !store_.isRegistered(attacker)) {
        return false;
    }
    if (!std::isfinite(reportedDamage) || reportedDamage < 0.0) {
        return false;
    }

    EntityID monster = store_.findMonster(monsterId);
    if (monster == entt::null) {
        return false;
    }

    Registry& registry = store_.registry();
    const Transform& attackerTransform = registry.get<Transform>(attacker);
    const Transform& monsterTransform = registry.get<Transform>(monster);
    CombatState& monsterCombat = registry.get<CombatState>(monster);
    if (monsterTransform.mapId != attackerTransform.mapId || monsterCombat.hp <= 0.0) {
        return false;
    }

    const double damage = config_.trustClientDamage
        ? reportedDamage
        : registry.get<CombatState>(attacker).attack;

    MonsterBrain& brain = registry.get<MonsterBrain>(monster);
    monsterCombat.hp = std::max(0.0, monsterCombat.hp - damage);
    brain.lastHitBy = registry.get<PlayerInfo>(attacker).identity;

    aoi_.broadcastToMap(monsterTransform.mapId, Events::MONSTER_HIT_BROADCAST,
                        Events::monsterHit(registry, monster, damage));

    if (monsterCombat.hp > 0.0) {
        return true;
    }

    // Monster down
    aoi_.broadcastToMap(monsterTransform.mapId, Events::MONSTER_DESPAWN,
                        Events::monsterDespawn(brain.id, monsterTransform.mapId));
    brain.target.reset();
    brain.state = MonsterState::IDLE;

    EntityID killer = store_.findPlayer(*brain.lastHitBy);
    if (killer != entt::null) {
        awardKill(killer, monster);
    }

    population_.scheduleRespawn(brain.id, nowMs);
    return true;
}

void CombatSystem::awardKill(EntityID killer, EntityID monster) {
    Registry& registry = store_.registry();
    const MonsterBrain& brain = registry.get<MonsterBrain>(monster);
    const Transform& monsterTransform = registry.get<Transform>(monster);

    const MonsterTypeDef* def = catalog_.findMonsterType(brain.type);
    if (!def) {
        std::cerr << "[COMBAT] No type definition for " << brain.type << ", kill not credited" << std::endl;
        return;
    }

    giveXp(killer, def->xpReward);

    const int bcoins = random_.between(Constants::BCOIN_MIN, Constants::BCOIN_MAX);
    std::string lootItem;
    if (!def->lootTable.empty()) {
        lootItem = def->lootTable[random_.index(def->lootTable.size())];
        registry.get<Inventory>(killer).items.push_back(lootItem);
    }

    FloorDrop drop;
    drop.id = "drop_" + std::to_string(++dropSerial_);
    drop.mapId = monsterTransform.mapId;
    drop.position = monsterTransform.position;
    drop.kind = random_.chance(Constants::BCOIN_DROP_CHANCE) ? DropKind::BCOINS : DropKind::ITEM;
    drop.amount = bcoins;
    drop.itemName = lootItem;

    aoi_.broadcastToMap(drop.mapId, Events::DROP_SPAWN, Events::dropSpawn(drop));
    store_.addDrop(std::move(drop));

    const Progression& progression = registry.get<Progression>(killer);
    aoi_.sendTo(killer, Events::MONSTER_KILLED,
                Events::monsterKilled(brain.id, def->xpReward, progression, bcoins, lootItem));

    std::cout << "[COMBAT] " << registry.get<PlayerInfo>(killer).identity << " killed "
              << brain.id << " (+" << def->xpReward << " xp, " << lootItem << ")" << std::endl;
}

PvpResult CombatSystem::pvpAttack(EntityID attacker, const std::string& targetIdentity,
                                  uint32_t nowMs) {
    PvpResult result;
    if (!isAlivePlayer(attacker) || !store_.isRegistered(attacker)) {
        return result;
    }

    EntityID target = store_.findPlayer(targetIdentity);
    if (target == entt::null || target == attacker || !isAlivePlayer(target)) {
        return result;
    }

    Registry& registry = store_.registry();
    const PlayerInfo& targetInfo = registry.get<PlayerInfo>(target);
    if (!targetInfo.online || !store_.isRegistered(target)) {
        return result;
    }

    // Both combatants must stand on the same PvP map
    const Transform& attackerTransform = registry.get<Transform>(attacker);
    const Transform& targetTransform = registry.get<Transform>(target);
    const MapDefinition* map = catalog_.findMap(attackerTransform.mapId);
    if (!map || !map->pvpEnabled || targetTransform.mapId != attackerTransform.mapId) {
        return result;
    }

    ActionTimers& timers = registry.get<ActionTimers>(attacker);
    if (timers.lastPvpAttackMs && nowMs - *timers.lastPvpAttackMs < Constants::PVP_ATTACK_COOLDOWN_MS) {
        return result;
    }
    timers.lastPvpAttackMs = nowMs;

    const CombatState& attackerCombat = registry.get<CombatState>(attacker);
    const int luck = registry.get<Attributes>(attacker).luck;
    result.critical = random_.unit() < luck * Constants::CRIT_CHANCE_PER_LUCK;
    result.damage = std::round(attackerCombat.attack * (result.critical ? Constants::CRIT_MULTIPLIER : 1));
    result.accepted = true;

    const std::string& attackerIdentity = registry.get<PlayerInfo>(attacker).identity;
    const CombatState& targetCombat = registry.get<CombatState>(target);
    const double targetHpAfter = std::clamp(targetCombat.hp - result.damage, 0.0, targetCombat.maxHp);

    aoi_.sendTo(attacker, Events::PLAYER_ATTACK_RESULT, {
        {"target", targetIdentity},
        {"damage", result.damage},
        {"targetHp", targetHpAfter},
        {"critical", result.critical}
    });
    aoi_.broadcastToAOI(attackerIdentity, attackerTransform.position, attackerTransform.mapId,
                        Events::PLAYER_PVP_HIT, {
                            {"attacker", attackerIdentity},
                            {"target", targetIdentity},
                            {"damage", result.damage}
                        });

    applyPlayerDamage(target, result.damage, attackerIdentity, nowMs);
    return result;
}

bool CombatSystem::handleReportedHit(EntityID victim, double damage,
                                     const std::optional<std::string>& attackerIdentity,
                                     uint32_t nowMs) {
    if (!isAlivePlayer(victim) || !store_.isRegistered(victim)) {
        return false;
    }
    if (!std::isfinite(damage) || damage < 0.0) {
        return false;
    }

    if (attackerIdentity && store_.findPlayer(*attackerIdentity) != entt::null) {
        const Transform& transform = store_.registry().get<Transform>(victim);
        const MapDefinition* map = catalog_.findMap(transform.mapId);
        if (!map || !map->pvpEnabled) {
            aoi_.sendTo(victim, Events::PLAYER_HIT_DENIED,
                        Events::message("You cannot attack other players outside the PvP arena."));
            return false;
        }
    }

    return applyPlayerDamage(victim, damage, attackerIdentity, nowMs);
}

// ============================================================================
// Progression
// ============================================================================

int CombatSystem::giveXp(EntityID player, int amount) {
    Registry& registry = store_.registry();
    Progression* progression = registry.try_get<Progression>(player);
    if (!progression || amount < 0) {
        return 0;
    }

    progression->xp = static_cast<int>(
        std::min<int64_t>(static_cast<int64_t>(progression->xp) + amount, Constants::MAX_XP));

    int levelsGained = 0;
    while (progression->level < Constants::MAX_LEVEL &&
           progression->xp >= progression->xpToLevel()) {
        progression->xp -= progression->xpToLevel();
        levelUp(player);
        ++levelsGained;
    }

    aoi_.sendTo(player, Events::PLAYER_XP_UPDATED, Events::xpUpdated(*progression));
    return levelsGained;
}

void CombatSystem::levelUp(EntityID player) {
    Registry& registry = store_.registry();
    Progression& progression = registry.get<Progression>(player);

    progression.level += 1;
    progression.statPoints += Constants::STAT_POINTS_PER_LEVEL;
    StatPipeline::recompute(registry, player, HpPolicy::FULL_HEAL);

    aoi_.sendTo(player, Events::PLAYER_LEVEL_UP, Events::levelUp(registry, player));
    std::cout << "[COMBAT] " << registry.get<PlayerInfo>(player).identity
              << " reached level " << progression.level << std::endl;
}

} // namespace Midgard
