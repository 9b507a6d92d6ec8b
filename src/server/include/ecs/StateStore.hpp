#pragma once

#include "ecs/CoreTypes.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// [ECS_AGENT] Authoritative world state: the entity registry plus the
// map-membership side indices derived from it.
//
// Invariant: an entity carries MapMember iff its id is in the index of
// Transform::mapId. Every mutation below updates both sides together.

namespace Midgard {

// Present while an entity is registered in the membership index of its map
struct MapMember {};

class StateStore {
public:
    StateStore() = default;
    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // ------------------------------------------------------------------------
    // Players
    // ------------------------------------------------------------------------

    // Returns the existing entity for identity or creates a fresh player with
    // default components. The boolean is true when the entity was created.
    std::pair<EntityID, bool> upsertPlayer(const std::string& identity);

    // entt::null when unknown
    [[nodiscard]] EntityID findPlayer(std::string_view identity) const;

    // Registers the player in mapId (leaving any previous map). Returns true
    // if the player was not already a member of mapId.
    bool addPlayerToMap(EntityID player, const std::string& mapId);

    // Unregisters the player from its current map. Returns the map left, or
    // nullopt if the player was not registered anywhere.
    std::optional<std::string> removePlayerFromMap(EntityID player);

    [[nodiscard]] bool isRegistered(EntityID entity) const;

    [[nodiscard]] std::vector<EntityID> playersInMap(const std::string& mapId) const;
    [[nodiscard]] size_t playerCountInMap(const std::string& mapId) const;
    [[nodiscard]] std::vector<std::string> mapsWithPlayers() const;

    // Every known player (online or not), ordered by identity
    [[nodiscard]] std::vector<EntityID> allPlayers() const;
    [[nodiscard]] size_t playerCount() const { return playersByIdentity_.size(); }

    // ------------------------------------------------------------------------
    // Monsters
    // ------------------------------------------------------------------------

    // Creates (or returns) the monster with this id, registered in mapId
    EntityID upsertMonster(const std::string& id, const std::string& mapId);

    bool removeMonster(const std::string& id);

    // Destroys the whole monster set of a map. Returns how many were removed.
    size_t removeAllMonstersInMap(const std::string& mapId);

    [[nodiscard]] EntityID findMonster(std::string_view id) const;
    [[nodiscard]] std::vector<EntityID> monstersInMap(const std::string& mapId) const;
    [[nodiscard]] size_t monsterCountInMap(const std::string& mapId) const;

    // Every monster in every map, ordered by map then id
    [[nodiscard]] std::vector<EntityID> allMonsters() const;

    // ------------------------------------------------------------------------
    // Floor drops
    // ------------------------------------------------------------------------

    void addDrop(FloorDrop drop);
    std::optional<FloorDrop> takeDrop(const std::string& mapId, const std::string& dropId);
    size_t clearDrops(const std::string& mapId);
    [[nodiscard]] size_t dropCountInMap(const std::string& mapId) const;

    // ------------------------------------------------------------------------
    // Diagnostics
    // ------------------------------------------------------------------------

    // Verifies the entity/index invariant in both directions
    [[nodiscard]] bool checkConsistency() const;

    [[nodiscard]] Registry& registry() { return registry_; }
    [[nodiscard]] const Registry& registry() const { return registry_; }

private:
    using IdSet = std::set<std::string>;

    static void eraseFromIndex(std::map<std::string, IdSet>& index,
                               const std::string& mapId, const std::string& id);

    Registry registry_;

    std::map<std::string, EntityID, std::less<>> playersByIdentity_;
    std::map<std::string, EntityID, std::less<>> monstersById_;

    std::map<std::string, IdSet> mapPlayers_;
    std::map<std::string, IdSet> mapMonsters_;

    std::map<std::string, std::map<std::string, FloorDrop>> mapDrops_;
};

} // namespace Midgard
