#pragma once

#include "ecs/StateStore.hpp"
#include "zones/MapCatalog.hpp"
#include "zones/AreaOfInterest.hpp"
#include "ai/MonsterPopulation.hpp"
#include "sim/Random.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

// [COMBAT_AGENT] Combat resolution for the Midgard world
// Damage application, death detection, kill credit, loot, XP and PvP.

namespace Midgard {

// ============================================================================
// Combat Configuration
// ============================================================================

struct CombatConfig {
    // monster:hit trusts the client's damage number when true; otherwise the
    // attacker's server-side attack stat is used
    bool trustClientDamage = true;
};

// [COMBAT_AGENT] Outcome of a PvP swing, for callers and tests
struct PvpResult {
    bool accepted{false};
    double damage{0.0};
    bool critical{false};
};

// ============================================================================
// Combat System
// ============================================================================

class CombatSystem {
public:
    using DeathCallback = std::function<void(EntityID victim, uint32_t nowMs)>;

public:
    CombatSystem(StateStore& store, const MapCatalog& catalog, AreaOfInterestSystem& aoi,
                 MonsterPopulation& population, RandomSource& random,
                 const CombatConfig& config = CombatConfig{});

    // Fired once when a player's HP reaches zero
    void setOnPlayerDeath(DeathCallback callback) { onPlayerDeath_ = std::move(callback); }

    // Damage contract shared by every source: clamp HP, tell the victim
    // (hpChanged), tell the victim's AOI (damaged), fire death at zero.
    // Returns false for unknown or already dead victims.
    bool applyPlayerDamage(EntityID victim, double damage,
                           const std::optional<std::string>& attacker, uint32_t nowMs);

    // Monster AI strike: flat monster attack value
    bool monsterAttackPlayer(EntityID monster, EntityID target, uint32_t nowMs);

    // Client-reported hit on a monster. Enforces map locality and liveness,
    // resolves the kill on the last hitter.
    bool handleMonsterHit(EntityID attacker, const std::string& monsterId,
                          double reportedDamage, uint32_t nowMs);

    // Player vs player on a PvP map with per-attacker cooldown and LUCK crits
    PvpResult pvpAttack(EntityID attacker, const std::string& targetIdentity, uint32_t nowMs);

    // Client-reported damage taken. A known player attacker is only allowed
    // on PvP maps; otherwise the victim gets hitDenied.
    bool handleReportedHit(EntityID victim, double damage,
                           const std::optional<std::string>& attackerIdentity, uint32_t nowMs);

    // Adds XP and resolves any number of level-ups. Returns levels gained.
    int giveXp(EntityID player, int amount);

    // Getters
    const CombatConfig& getConfig() const { return config_; }
    void setConfig(const CombatConfig& config) { config_ = config; }

private:
    void levelUp(EntityID player);
    void awardKill(EntityID killer, EntityID monster);
    [[nodiscard]] bool isAlivePlayer(EntityID entity) const;

private:
    StateStore& store_;
    const MapCatalog& catalog_;
    AreaOfInterestSystem& aoi_;
    MonsterPopulation& population_;
    RandomSource& random_;
    CombatConfig config_;
    DeathCallback onPlayerDeath_;
    uint64_t dropSerial_{0};
};

} // namespace Midgard
