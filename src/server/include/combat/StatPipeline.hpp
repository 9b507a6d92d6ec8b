#pragma once

#include "ecs/CoreTypes.hpp"
#include <string>
#include <string_view>

// [COMBAT_AGENT] Player stat derivation
// class/level -> base, + attributes -> derived, + equipment -> final.
// recompute() is the only writer of maxHp/attack/speed/extra on a player.

namespace Midgard {

struct ClassStats {
    double baseHp{0.0};
    double hpPerLevel{0.0};
    double baseAttack{0.0};
    double attackPerLevel{0.0};
};

struct DerivedStats {
    double maxHp{0.0};
    double attack{0.0};
    double speed{1.0};
    StatBag extra;  // equipment stats with no derived counterpart
};

// How current HP follows a change of maxHp
enum class HpPolicy : uint8_t {
    PRESERVE_RATIO,  // rescale by oldHp/oldMaxHp (dead players stay at 0)
    FULL_HEAL        // hp = maxHp
};

namespace StatPipeline {

// Per-class constants; unknown classes fall back to assassin
[[nodiscard]] const ClassStats& classStats(std::string_view classTag);

// Step 1: class + level
[[nodiscard]] DerivedStats baseStats(std::string_view classTag, int level);

// Step 2: attribute bonuses
[[nodiscard]] DerivedStats applyAttributes(DerivedStats stats, const Attributes& attributes);

// Step 3: sum of all equipped bonus bags
[[nodiscard]] DerivedStats applyEquipment(DerivedStats stats, const Equipment& equipment);

// Steps 1-3 in order
[[nodiscard]] DerivedStats derive(std::string_view classTag, int level,
                                  const Attributes& attributes, const Equipment& equipment);

// Step 4: new current HP for the given policy
[[nodiscard]] double reconcileHp(double oldHp, double oldMaxHp, double newMaxHp,
                                 bool isDead, HpPolicy policy);

// Runs the full pipeline on a player entity and writes the result into its
// CombatState. Returns false if the entity is not a player.
bool recompute(Registry& registry, EntityID player, HpPolicy policy);

} // namespace StatPipeline

} // namespace Midgard
