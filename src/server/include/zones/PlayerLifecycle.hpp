#pragma once

#include "ecs/StateStore.hpp"
#include "zones/MapCatalog.hpp"
#include "zones/AreaOfInterest.hpp"
#include "ai/MonsterPopulation.hpp"
#include "sim/Scheduler.hpp"
#include "db/ProfileStore.hpp"
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <string>

// [ZONE_AGENT] Player life-cycle state machines
// Join / reconnect, map transfer, disconnect, death and revive, stat
// allocation, equipment changes, movement and the relay-only actions.

namespace Midgard {

// Decoded player:join
struct JoinRequest {
    std::string identity;
    std::string name;
    std::string classTag;
    int level{1};
    int xp{0};
    std::optional<glm::vec2> position;  // map spawn when absent
    std::string mapId;
};

struct JoinResult {
    EntityID player = entt::null;
    bool created{false};
    std::optional<std::string> error;  // mapError text when rejected
};

// Decoded player:move
struct MoveRequest {
    glm::vec2 position{0.0f, 0.0f};
    std::optional<Facing> facing;
    std::optional<AnimationState> state;
};

class PlayerLifecycle {
public:
    PlayerLifecycle(StateStore& store, const MapCatalog& catalog, AreaOfInterestSystem& aoi,
                    MonsterPopulation& population, Scheduler& scheduler,
                    ProfileStore* profiles = nullptr);

    // First join creates the player; a known identity reconnects onto the
    // existing record. A rejected destination creates and changes nothing.
    JoinResult join(ConnectionID connection, const JoinRequest& request, uint32_t nowMs);

    // Validates the destination first; a rejection changes nothing
    bool changeMap(EntityID player, const std::string& mapId,
                   const std::optional<glm::vec2>& position, uint32_t nowMs);

    // Leaves the map and goes offline. The record is kept for reconnects.
    bool disconnect(EntityID player, uint32_t nowMs);

    // Death entry point; picks the PvP or default machine from the map
    bool handleDeath(EntityID player, uint32_t nowMs);

    // Relocates to the default town, revives there after the delay
    bool handleDefaultDeath(EntityID player, uint32_t nowMs);

    // Stays on the PvP map, revives at its spawn point after the delay
    bool handlePvpDeath(EntityID player, uint32_t nowMs);

    // Revive timer body. No-op if the player is gone or already alive.
    // With spawnMapId set, the player is moved to that map's spawn only if
    // still standing on it.
    bool revive(const std::string& identity, const std::optional<std::string>& spawnMapId);

    bool allocateStat(EntityID player, AttributeKey key, int points);

    // Sets (or with an empty bag clears) one equipment slot
    bool setEquipment(EntityID player, const std::string& slot, const StatBag& bonuses);

    // Throttled to one accepted update per MOVE_THROTTLE_MS, ignored while dead
    bool move(EntityID player, const MoveRequest& request, uint32_t nowMs);

    // Relay-only actions (no server-side validation of the values)
    bool relayAttack(EntityID player, const nlohmann::json& damage);
    bool relaySkill(EntityID player, const nlohmann::json& skillType, const nlohmann::json& data);

    bool pickupDrop(EntityID player, const std::string& dropId);

    // Periodic snapshot: every online player's position to its AOI
    void syncPlayerPositions(uint32_t nowMs);

    // Periodic snapshot: live monster state to every occupied map
    void syncMonsterStates();

private:
    // Shared tail of join and changeMap once the player is registered
    void sendWorldSnapshot(EntityID player, uint32_t nowMs);
    void announceArrival(EntityID player);
    void leaveCurrentMap(EntityID player, bool aoiOnly);

    [[nodiscard]] std::optional<std::string> checkEntry(const std::string& mapId, int level) const;
    [[nodiscard]] bool isAlive(EntityID player) const;

    StateStore& store_;
    const MapCatalog& catalog_;
    AreaOfInterestSystem& aoi_;
    MonsterPopulation& population_;
    Scheduler& scheduler_;
    ProfileStore* profiles_;
};

} // namespace Midgard
