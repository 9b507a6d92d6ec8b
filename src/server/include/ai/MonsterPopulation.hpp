#pragma once

#include "ecs/StateStore.hpp"
#include "zones/MapCatalog.hpp"
#include "zones/AreaOfInterest.hpp"
#include "sim/Scheduler.hpp"
#include "sim/Random.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

// [AI_AGENT] Per-map monster population
// Monsters exist only while their map has occupants: spawned on demand up to
// the map's cap, discarded wholesale when the last player leaves.

namespace Midgard {

class MonsterPopulation {
public:
    MonsterPopulation(StateStore& store, const MapCatalog& catalog,
                      AreaOfInterestSystem& aoi, Scheduler& scheduler,
                      RandomSource& random);

    // Tops the map up to its configured cap. Each new monster is announced
    // map-wide. Returns the number spawned (0 for maps without spawns).
    size_t ensureSpawned(const std::string& mapId, uint32_t nowMs);

    // If mapId has no registered players: drops its monsters, their pending
    // timers and its floor drops. Returns true if anything was cleaned.
    bool cleanupIfEmpty(const std::string& mapId);

    // Arms the respawn timer for a killed monster
    void scheduleRespawn(const std::string& monsterId, uint32_t nowMs);

    // Restores a killed monster at its spawn origin. No-op (false) if the
    // monster no longer exists.
    bool respawn(const std::string& monsterId);

    // Sends a snapshot of every live monster in player's map to player
    size_t sendSnapshot(EntityID player);

    [[nodiscard]] uint64_t spawnedTotal() const { return serial_; }

private:
    StateStore& store_;
    const MapCatalog& catalog_;
    AreaOfInterestSystem& aoi_;
    Scheduler& scheduler_;
    RandomSource& random_;
    uint64_t serial_{0};
};

} // namespace Midgard
