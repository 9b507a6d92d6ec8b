// [ZONE_AGENT] Player life-cycle implementation

#include "zones/PlayerLifecycle.hpp"
#include "combat/StatPipeline.hpp"
#include "netcode/Events.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

namespace Midgard {

PlayerLifecycle::PlayerLifecycle(StateStore& store, const MapCatalog& catalog,
                                 AreaOfInterestSystem& aoi, MonsterPopulation& population,
                                 Scheduler& scheduler, ProfileStore* profiles)
    : store_(store), catalog_(catalog), aoi_(aoi), population_(population),
      scheduler_(scheduler), profiles_(profiles) {}

std::optional<std::string> PlayerLifecycle::checkEntry(const std::string& mapId, int level) const {
    const MapDefinition* map = catalog_.findMap(mapId);
    if (!map) {
        return std::string("Map does not exist.");
    }
    if (map->minLevel && level < *map->minLevel) {
        return "You need to be level " + std::to_string(*map->minLevel) + "+ to enter this map.";
    }
    return std::nullopt;
}

bool PlayerLifecycle::isAlive(EntityID player) const {
    const Registry& registry = store_.registry();
    if (!registry.valid(player) || !registry.all_of<PlayerTag>(player)) {
        return false;
    }
    return !registry.get<CombatState>(player).isDead;
}

// ============================================================================
// Join / Reconnect
// ============================================================================

JoinResult PlayerLifecycle::join(ConnectionID connection, const JoinRequest& request,
                                 uint32_t nowMs) {
    JoinResult result;
    if (request.identity.empty()) {
        return result;
    }

    Registry& registry = store_.registry();
    EntityID existing = store_.findPlayer(request.identity);
    const int level = existing != entt::null
        ? registry.get<Progression>(existing).level
        : std::clamp(request.level, 1, Constants::MAX_LEVEL);

    if (auto error = checkEntry(request.mapId, level)) {
        result.error = std::move(error);
        return result;
    }
    const MapDefinition& map = *catalog_.findMap(request.mapId);

    bool announce = false;
    if (existing == entt::null) {
        auto [player, created] = store_.upsertPlayer(request.identity);
        result.created = created;
        result.player = player;

        PlayerInfo& info = registry.get<PlayerInfo>(player);
        info.name = request.name;
        info.classTag = request.classTag;
        info.connectionId = connection;
        info.online = true;
        info.animState = AnimationState::IDLE;

        Progression& progression = registry.get<Progression>(player);
        progression.level = level;
        progression.xp = std::clamp(request.xp, 0, Constants::MAX_XP);
        progression.statPoints = Constants::INITIAL_STAT_POINTS;

        Transform& transform = registry.get<Transform>(player);
        transform.position = request.position.value_or(map.spawn);
        transform.facing = Facing::FRONT;

        StatPipeline::recompute(registry, player, HpPolicy::FULL_HEAL);
        store_.addPlayerToMap(player, map.id);
        announce = true;

        std::cout << "[LIFECYCLE] Player " << request.identity << " joined map " << map.id << std::endl;
    } else {
        EntityID player = existing;
        result.player = player;

        // Moving to a different map than the one still registered: leave it first
        const Transform& current = registry.get<Transform>(player);
        if (store_.isRegistered(player) && current.mapId != map.id) {
            leaveCurrentMap(player, false);
        }

        PlayerInfo& info = registry.get<PlayerInfo>(player);
        info.connectionId = connection;
        info.online = true;

        Transform& transform = registry.get<Transform>(player);
        if (request.position) {
            transform.position = *request.position;
        } else if (transform.mapId != map.id) {
            transform.position = map.spawn;
        }

        StatPipeline::recompute(registry, player, HpPolicy::PRESERVE_RATIO);
        announce = store_.addPlayerToMap(player, map.id);

        std::cout << "[LIFECYCLE] Player " << request.identity << " rejoined map " << map.id
                  << " with XP " << registry.get<Progression>(player).xp << std::endl;
    }

    EntityID player = result.player;
    aoi_.sendTo(player, Events::PLAYER_XP_UPDATED, Events::xpUpdated(registry.get<Progression>(player)));
    aoi_.sendTo(player, Events::PLAYER_STATS_INITIALIZED, Events::playerStats(registry, player));

    sendWorldSnapshot(player, nowMs);
    if (announce) {
        announceArrival(player);
    }
    return result;
}

void PlayerLifecycle::sendWorldSnapshot(EntityID player, uint32_t nowMs) {
    const Registry& registry = store_.registry();
    const PlayerInfo& info = registry.get<PlayerInfo>(player);
    const Transform& transform = registry.get<Transform>(player);

    population_.ensureSpawned(transform.mapId, nowMs);
    population_.sendSnapshot(player);

    for (EntityID other : aoi_.playersInAOI(info.identity, transform.position, transform.mapId)) {
        aoi_.sendTo(player, Events::PLAYER_JOINED, Events::playerJoined(registry, other));
    }
}

void PlayerLifecycle::announceArrival(EntityID player) {
    const Registry& registry = store_.registry();
    const PlayerInfo& info = registry.get<PlayerInfo>(player);
    const Transform& transform = registry.get<Transform>(player);

    aoi_.broadcastToAOI(info.identity, transform.position, transform.mapId,
                        Events::PLAYER_JOINED, Events::playerJoined(registry, player));
}

void PlayerLifecycle::leaveCurrentMap(EntityID player, bool aoiOnly) {
    std::optional<std::string> left = store_.removePlayerFromMap(player);
    if (!left) return;

    const Registry& registry = store_.registry();
    const std::string& identity = registry.get<PlayerInfo>(player).identity;

    if (aoiOnly) {
        aoi_.broadcastToAOI(identity, registry.get<Transform>(player).position, *left,
                            Events::PLAYER_LEFT, Events::playerLeft(identity));
    } else {
        aoi_.broadcastToMap(*left, Events::PLAYER_LEFT, Events::playerLeft(identity));
    }
    population_.cleanupIfEmpty(*left);
}

// ============================================================================
// Map Transfer
// ============================================================================

bool PlayerLifecycle::changeMap(EntityID player, const std::string& mapId,
                                const std::optional<glm::vec2>& position, uint32_t nowMs) {
    if (!isAlive(player) || !store_.isRegistered(player)) {
        return false;
    }

    Registry& registry = store_.registry();
    if (auto error = checkEntry(mapId, registry.get<Progression>(player).level)) {
        aoi_.sendTo(player, Events::PLAYER_MAP_ERROR, Events::message(*error));
        return false;
    }
    const MapDefinition& map = *catalog_.findMap(mapId);

    const std::string oldMap = registry.get<Transform>(player).mapId;
    leaveCurrentMap(player, false);

    registry.get<Transform>(player).position = position.value_or(map.spawn);
    store_.addPlayerToMap(player, map.id);

    std::cout << "[LIFECYCLE] " << registry.get<PlayerInfo>(player).identity << " moved "
              << oldMap << " -> " << map.id << std::endl;

    sendWorldSnapshot(player, nowMs);
    announceArrival(player);
    return true;
}

// ============================================================================
// Disconnect
// ============================================================================

bool PlayerLifecycle::disconnect(EntityID player, uint32_t /*nowMs*/) {
    Registry& registry = store_.registry();
    if (!registry.valid(player) || !registry.all_of<PlayerTag>(player)) {
        return false;
    }

    PlayerInfo& info = registry.get<PlayerInfo>(player);
    if (!info.online) {
        return false;
    }

    leaveCurrentMap(player, true);
    info.online = false;
    info.connectionId = INVALID_CONNECTION;

    std::cout << "[LIFECYCLE] Player " << info.identity << " disconnected" << std::endl;

    if (profiles_) {
        PlayerProfile profile;
        profile.identity = info.identity;
        profile.attributes = registry.get<Attributes>(player);
        profile.statPoints = registry.get<Progression>(player).statPoints;

        profiles_->saveProfile(profile, [identity = info.identity](bool success) {
            if (!success) {
                std::cerr << "[LIFECYCLE] Failed to save profile of " << identity << std::endl;
            }
        });
    }
    return true;
}

// ============================================================================
// Death / Revive
// ============================================================================

bool PlayerLifecycle::handleDeath(EntityID player, uint32_t nowMs) {
    if (!isAlive(player)) {
        return false;
    }
    const MapDefinition* map = catalog_.findMap(store_.registry().get<Transform>(player).mapId);
    if (map && map->pvpEnabled) {
        return handlePvpDeath(player, nowMs);
    }
    return handleDefaultDeath(player, nowMs);
}

bool PlayerLifecycle::handleDefaultDeath(EntityID player, uint32_t nowMs) {
    if (!isAlive(player)) {
        return false;
    }

    Registry& registry = store_.registry();
    CombatState& combat = registry.get<CombatState>(player);
    PlayerInfo& info = registry.get<PlayerInfo>(player);
    combat.isDead = true;
    combat.hp = 0.0;
    info.animState = AnimationState::DEAD;

    leaveCurrentMap(player, false);

    const std::string& town = catalog_.defaultTown();
    if (const MapDefinition* townMap = catalog_.findMap(town)) {
        registry.get<Transform>(player).position = townMap->spawn;
    }
    if (info.online) {
        store_.addPlayerToMap(player, town);
        population_.ensureSpawned(town, nowMs);
    } else {
        registry.get<Transform>(player).mapId = town;
    }

    aoi_.sendTo(player, Events::PLAYER_DIED, Events::playerDied(registry.get<Transform>(player)));

    scheduler_.scheduleAt(TaskKey{TaskKind::PLAYER_REVIVE, info.identity},
                          nowMs + Constants::PLAYER_REVIVE_DELAY_MS,
                          [this](const std::string& identity, uint32_t) { revive(identity, std::nullopt); });

    std::cout << "[LIFECYCLE] " << info.identity << " died, respawning in " << town << std::endl;
    return true;
}

bool PlayerLifecycle::handlePvpDeath(EntityID player, uint32_t nowMs) {
    if (!isAlive(player)) {
        return false;
    }

    Registry& registry = store_.registry();
    CombatState& combat = registry.get<CombatState>(player);
    PlayerInfo& info = registry.get<PlayerInfo>(player);
    combat.isDead = true;
    combat.hp = 0.0;
    info.animState = AnimationState::DEAD;

    aoi_.sendTo(player, Events::PLAYER_DIED, Events::playerDied(registry.get<Transform>(player)));

    scheduler_.scheduleAt(TaskKey{TaskKind::PLAYER_REVIVE, info.identity},
                          nowMs + Constants::PLAYER_REVIVE_DELAY_MS,
                          [this, mapId = registry.get<Transform>(player).mapId](
                              const std::string& identity, uint32_t) { revive(identity, mapId); });

    std::cout << "[LIFECYCLE] " << info.identity << " fell in "
              << registry.get<Transform>(player).mapId << std::endl;
    return true;
}

bool PlayerLifecycle::revive(const std::string& identity,
                             const std::optional<std::string>& spawnMapId) {
    EntityID player = store_.findPlayer(identity);
    if (player == entt::null) {
        return false;
    }

    Registry& registry = store_.registry();
    CombatState& combat = registry.get<CombatState>(player);
    if (!combat.isDead) {
        return false;
    }

    combat.isDead = false;
    StatPipeline::recompute(registry, player, HpPolicy::FULL_HEAL);
    registry.get<PlayerInfo>(player).animState = AnimationState::IDLE;

    Transform& transform = registry.get<Transform>(player);
    if (spawnMapId && transform.mapId == *spawnMapId) {
        if (const MapDefinition* map = catalog_.findMap(*spawnMapId)) {
            transform.position = map->spawn;
        }
    }

    aoi_.sendTo(player, Events::PLAYER_REVIVED, Events::playerRevived(combat, transform));
    std::cout << "[LIFECYCLE] " << identity << " revived in " << transform.mapId << std::endl;
    return true;
}

// ============================================================================
// Stats / Equipment
// ============================================================================

bool PlayerLifecycle::allocateStat(EntityID player, AttributeKey key, int points) {
    Registry& registry = store_.registry();
    if (!registry.valid(player) || !registry.all_of<PlayerTag>(player) || points < 1) {
        return false;
    }

    Progression& progression = registry.get<Progression>(player);
    if (progression.statPoints < points) {
        return false;
    }

    registry.get<Attributes>(player).ref(key) += points;
    progression.statPoints -= points;
    StatPipeline::recompute(registry, player, HpPolicy::PRESERVE_RATIO);

    aoi_.sendTo(player, Events::PLAYER_STATS_UPDATED, Events::playerStats(registry, player));
    return true;
}

bool PlayerLifecycle::setEquipment(EntityID player, const std::string& slot, const StatBag& bonuses) {
    Registry& registry = store_.registry();
    if (!registry.valid(player) || !registry.all_of<PlayerTag>(player) || slot.empty()) {
        return false;
    }

    Equipment& equipment = registry.get<Equipment>(player);
    if (bonuses.empty()) {
        equipment.slots.erase(slot);
    } else {
        equipment.slots[slot] = bonuses;
    }
    StatPipeline::recompute(registry, player, HpPolicy::PRESERVE_RATIO);

    aoi_.sendTo(player, Events::PLAYER_STATS_UPDATED, Events::playerStats(registry, player));
    return true;
}

// ============================================================================
// Movement / Relayed actions
// ============================================================================

bool PlayerLifecycle::move(EntityID player, const MoveRequest& request, uint32_t nowMs) {
    if (!isAlive(player) || !store_.isRegistered(player)) {
        return false;
    }

    Registry& registry = store_.registry();
    ActionTimers& timers = registry.get<ActionTimers>(player);
    if (timers.lastMoveMs && nowMs - *timers.lastMoveMs < Constants::MOVE_THROTTLE_MS) {
        return false;
    }

    Transform& transform = registry.get<Transform>(player);
    transform.position = request.position;
    if (request.facing) {
        transform.facing = *request.facing;
    }
    if (request.state && *request.state != AnimationState::DEAD) {
        registry.get<PlayerInfo>(player).animState = *request.state;
    }
    timers.lastMoveMs = nowMs;
    return true;
}

bool PlayerLifecycle::relayAttack(EntityID player, const nlohmann::json& damage) {
    if (!isAlive(player) || !store_.isRegistered(player)) {
        return false;
    }
    const Registry& registry = store_.registry();
    const std::string& identity = registry.get<PlayerInfo>(player).identity;
    const Transform& transform = registry.get<Transform>(player);

    aoi_.broadcastToAOI(identity, transform.position, transform.mapId, Events::PLAYER_ATTACKED,
                        Events::playerAttacked(identity, transform, damage));
    return true;
}

bool PlayerLifecycle::relaySkill(EntityID player, const nlohmann::json& skillType,
                                 const nlohmann::json& data) {
    if (!isAlive(player) || !store_.isRegistered(player)) {
        return false;
    }
    const Registry& registry = store_.registry();
    const std::string& identity = registry.get<PlayerInfo>(player).identity;
    const Transform& transform = registry.get<Transform>(player);

    aoi_.broadcastToAOI(identity, transform.position, transform.mapId, Events::PLAYER_SKILL_CAST,
                        Events::playerSkill(identity, transform, skillType, data));
    return true;
}

bool PlayerLifecycle::pickupDrop(EntityID player, const std::string& dropId) {
    if (!store_.isRegistered(player)) {
        return false;
    }
    const Registry& registry = store_.registry();
    const std::string& mapId = registry.get<Transform>(player).mapId;

    if (!store_.takeDrop(mapId, dropId)) {
        return false;
    }
    aoi_.broadcastToMap(mapId, Events::DROP_PICKED_UP,
                        Events::dropPickup(dropId, registry.get<PlayerInfo>(player).identity));
    return true;
}

// ============================================================================
// Periodic sync
// ============================================================================

void PlayerLifecycle::syncPlayerPositions(uint32_t nowMs) {
    const Registry& registry = store_.registry();
    for (EntityID player : store_.allPlayers()) {
        const PlayerInfo& info = registry.get<PlayerInfo>(player);
        if (!info.online || !store_.isRegistered(player)) continue;

        const Transform& transform = registry.get<Transform>(player);
        aoi_.broadcastToAOI(info.identity, transform.position, transform.mapId,
                            Events::PLAYER_MOVED, Events::playerMoved(registry, player, nowMs));
    }
}

void PlayerLifecycle::syncMonsterStates() {
    const Registry& registry = store_.registry();
    for (const std::string& mapId : store_.mapsWithPlayers()) {
        for (EntityID monster : store_.monstersInMap(mapId)) {
            if (registry.get<CombatState>(monster).hp <= 0.0) continue;
            aoi_.broadcastToMap(mapId, Events::MONSTER_UPDATE, Events::monsterUpdate(registry, monster));
        }
    }
}

} // namespace Midgard
