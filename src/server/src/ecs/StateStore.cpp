// [ECS_AGENT] State store implementation

#include "ecs/StateStore.hpp"
#include <iostream>

namespace Midgard {

// ============================================================================
// Players
// ============================================================================

std::pair<EntityID, bool> StateStore::upsertPlayer(const std::string& identity) {
    auto it = playersByIdentity_.find(identity);
    if (it != playersByIdentity_.end()) {
        return {it->second, false};
    }

    EntityID entity = registry_.create();
    registry_.emplace<PlayerTag>(entity);
    PlayerInfo& info = registry_.emplace<PlayerInfo>(entity);
    info.identity = identity;
    registry_.emplace<Transform>(entity);
    registry_.emplace<Progression>(entity);
    registry_.emplace<Attributes>(entity);
    registry_.emplace<CombatState>(entity);
    registry_.emplace<Equipment>(entity);
    registry_.emplace<Inventory>(entity);
    registry_.emplace<ActionTimers>(entity);

    playersByIdentity_.emplace(identity, entity);
    return {entity, true};
}

EntityID StateStore::findPlayer(std::string_view identity) const {
    auto it = playersByIdentity_.find(identity);
    if (it == playersByIdentity_.end()) {
        return entt::null;
    }
    return it->second;
}

bool StateStore::addPlayerToMap(EntityID player, const std::string& mapId) {
    const PlayerInfo* info = registry_.try_get<PlayerInfo>(player);
    Transform* transform = registry_.try_get<Transform>(player);
    if (!info || !transform) return false;

    if (registry_.all_of<MapMember>(player)) {
        if (transform->mapId == mapId) {
            return false;
        }
        eraseFromIndex(mapPlayers_, transform->mapId, info->identity);
    }

    transform->mapId = mapId;
    mapPlayers_[mapId].insert(info->identity);
    registry_.emplace_or_replace<MapMember>(player);
    return true;
}

std::optional<std::string> StateStore::removePlayerFromMap(EntityID player) {
    if (!registry_.valid(player) || !registry_.all_of<MapMember>(player)) {
        return std::nullopt;
    }
    const PlayerInfo& info = registry_.get<PlayerInfo>(player);
    const Transform& transform = registry_.get<Transform>(player);

    eraseFromIndex(mapPlayers_, transform.mapId, info.identity);
    registry_.remove<MapMember>(player);
    return transform.mapId;
}

bool StateStore::isRegistered(EntityID entity) const {
    return registry_.valid(entity) && registry_.all_of<MapMember>(entity);
}

std::vector<EntityID> StateStore::playersInMap(const std::string& mapId) const {
    std::vector<EntityID> result;
    auto it = mapPlayers_.find(mapId);
    if (it == mapPlayers_.end()) return result;

    result.reserve(it->second.size());
    for (const auto& identity : it->second) {
        EntityID entity = findPlayer(identity);
        if (entity != entt::null) {
            result.push_back(entity);
        }
    }
    return result;
}

size_t StateStore::playerCountInMap(const std::string& mapId) const {
    auto it = mapPlayers_.find(mapId);
    return it != mapPlayers_.end() ? it->second.size() : 0;
}

std::vector<std::string> StateStore::mapsWithPlayers() const {
    std::vector<std::string> maps;
    for (const auto& [mapId, members] : mapPlayers_) {
        if (!members.empty()) maps.push_back(mapId);
    }
    return maps;
}

std::vector<EntityID> StateStore::allPlayers() const {
    std::vector<EntityID> result;
    result.reserve(playersByIdentity_.size());
    for (const auto& [identity, entity] : playersByIdentity_) {
        result.push_back(entity);
    }
    return result;
}

// ============================================================================
// Monsters
// ============================================================================

EntityID StateStore::upsertMonster(const std::string& id, const std::string& mapId) {
    auto it = monstersById_.find(id);
    if (it != monstersById_.end()) {
        return it->second;
    }

    EntityID entity = registry_.create();
    registry_.emplace<MonsterTag>(entity);
    MonsterBrain& brain = registry_.emplace<MonsterBrain>(entity);
    brain.id = id;
    Transform& transform = registry_.emplace<Transform>(entity);
    transform.mapId = mapId;
    registry_.emplace<CombatState>(entity);
    registry_.emplace<MapMember>(entity);

    monstersById_.emplace(id, entity);
    mapMonsters_[mapId].insert(id);
    return entity;
}

bool StateStore::removeMonster(const std::string& id) {
    auto it = monstersById_.find(id);
    if (it == monstersById_.end()) return false;

    EntityID entity = it->second;
    if (const Transform* transform = registry_.try_get<Transform>(entity)) {
        eraseFromIndex(mapMonsters_, transform->mapId, id);
    }
    registry_.destroy(entity);
    monstersById_.erase(it);
    return true;
}

size_t StateStore::removeAllMonstersInMap(const std::string& mapId) {
    auto it = mapMonsters_.find(mapId);
    if (it == mapMonsters_.end()) return 0;

    // Detach the set before destroying its entities
    IdSet ids = std::move(it->second);
    mapMonsters_.erase(it);

    size_t removed = 0;
    for (const auto& id : ids) {
        auto found = monstersById_.find(id);
        if (found == monstersById_.end()) continue;
        registry_.destroy(found->second);
        monstersById_.erase(found);
        ++removed;
    }
    return removed;
}

EntityID StateStore::findMonster(std::string_view id) const {
    auto it = monstersById_.find(id);
    if (it == monstersById_.end()) {
        return entt::null;
    }
    return it->second;
}

std::vector<EntityID> StateStore::monstersInMap(const std::string& mapId) const {
    std::vector<EntityID> result;
    auto it = mapMonsters_.find(mapId);
    if (it == mapMonsters_.end()) return result;

    result.reserve(it->second.size());
    for (const auto& id : it->second) {
        EntityID entity = findMonster(id);
        if (entity != entt::null) {
            result.push_back(entity);
        }
    }
    return result;
}

size_t StateStore::monsterCountInMap(const std::string& mapId) const {
    auto it = mapMonsters_.find(mapId);
    return it != mapMonsters_.end() ? it->second.size() : 0;
}

std::vector<EntityID> StateStore::allMonsters() const {
    std::vector<EntityID> result;
    for (const auto& [mapId, ids] : mapMonsters_) {
        for (const auto& id : ids) {
            EntityID entity = findMonster(id);
            if (entity != entt::null) {
                result.push_back(entity);
            }
        }
    }
    return result;
}

// ============================================================================
// Floor drops
// ============================================================================

void StateStore::addDrop(FloorDrop drop) {
    auto& drops = mapDrops_[drop.mapId];
    std::string id = drop.id;
    drops.insert_or_assign(std::move(id), std::move(drop));
}

std::optional<FloorDrop> StateStore::takeDrop(const std::string& mapId, const std::string& dropId) {
    auto mapIt = mapDrops_.find(mapId);
    if (mapIt == mapDrops_.end()) return std::nullopt;

    auto it = mapIt->second.find(dropId);
    if (it == mapIt->second.end()) return std::nullopt;

    FloorDrop drop = std::move(it->second);
    mapIt->second.erase(it);
    if (mapIt->second.empty()) {
        mapDrops_.erase(mapIt);
    }
    return drop;
}

size_t StateStore::clearDrops(const std::string& mapId) {
    auto it = mapDrops_.find(mapId);
    if (it == mapDrops_.end()) return 0;
    size_t count = it->second.size();
    mapDrops_.erase(it);
    return count;
}

size_t StateStore::dropCountInMap(const std::string& mapId) const {
    auto it = mapDrops_.find(mapId);
    return it != mapDrops_.end() ? it->second.size() : 0;
}

// ============================================================================
// Diagnostics
// ============================================================================

bool StateStore::checkConsistency() const {
    // Entity side -> index side
    for (const auto& [identity, entity] : playersByIdentity_) {
        if (!registry_.valid(entity)) return false;
        const Transform& transform = registry_.get<Transform>(entity);
        bool member = registry_.all_of<MapMember>(entity);

        for (const auto& [mapId, members] : mapPlayers_) {
            bool listed = members.count(identity) > 0;
            bool expected = member && mapId == transform.mapId;
            if (listed != expected) {
                std::cerr << "[STATE] Player " << identity << " index mismatch on map "
                          << mapId << std::endl;
                return false;
            }
        }
        if (member && playerCountInMap(transform.mapId) == 0) {
            std::cerr << "[STATE] Player " << identity << " missing from index of "
                      << transform.mapId << std::endl;
            return false;
        }
    }

    for (const auto& [id, entity] : monstersById_) {
        if (!registry_.valid(entity)) return false;
        const Transform& transform = registry_.get<Transform>(entity);
        auto it = mapMonsters_.find(transform.mapId);
        if (it == mapMonsters_.end() || it->second.count(id) == 0) {
            std::cerr << "[STATE] Monster " << id << " missing from index of "
                      << transform.mapId << std::endl;
            return false;
        }
    }

    // Index side -> entity side
    for (const auto& [mapId, members] : mapPlayers_) {
        for (const auto& identity : members) {
            if (playersByIdentity_.find(identity) == playersByIdentity_.end()) {
                std::cerr << "[STATE] Dangling player " << identity << " in " << mapId << std::endl;
                return false;
            }
        }
    }
    for (const auto& [mapId, ids] : mapMonsters_) {
        for (const auto& id : ids) {
            EntityID entity = findMonster(id);
            if (entity == entt::null || registry_.get<Transform>(entity).mapId != mapId) {
                std::cerr << "[STATE] Dangling monster " << id << " in " << mapId << std::endl;
                return false;
            }
        }
    }
    return true;
}

void StateStore::eraseFromIndex(std::map<std::string, IdSet>& index,
                                const std::string& mapId, const std::string& id) {
    auto it = index.find(mapId);
    if (it == index.end()) return;
    it->second.erase(id);
    if (it->second.empty()) {
        index.erase(it);
    }
}

} // namespace Midgard
