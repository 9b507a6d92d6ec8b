#pragma once

#include "ecs/StateStore.hpp"
#include "zones/AreaOfInterest.hpp"
#include "combat/CombatSystem.hpp"
#include "sim/Scheduler.hpp"
#include "sim/Random.hpp"
#include <glm/glm.hpp>
#include <cstdint>

// [AI_AGENT] Monster AI state machine, run from the 100 ms AI task
//
//   idle      -> chasing    nearest living player enters aggro radius
//   chasing   -> attacking  in attack radius and cooldown elapsed
//   attacking -> idle       400 ms after the strike (if still alive)
//   any       -> idle       no target in aggro radius (may wander)

namespace Midgard {

class MonsterAISystem {
public:
    MonsterAISystem(StateStore& store, AreaOfInterestSystem& aoi, CombatSystem& combat,
                    Scheduler& scheduler, RandomSource& random);

    // One AI tick over every live monster on an occupied map
    void update(uint32_t nowMs);

    // One AI step for a single monster
    void updateMonster(EntityID monster, uint32_t nowMs);

    // Nearest living player strictly inside the monster's aggro radius, or
    // entt::null. Ties keep the first player in map enumeration order.
    [[nodiscard]] EntityID findTarget(EntityID monster) const;

    // Cardinal facing for a movement direction (screen y grows downwards)
    [[nodiscard]] static Facing facingFor(const glm::vec2& direction);

private:
    void chase(EntityID monster, const glm::vec2& targetPos, uint32_t nowMs);
    void strike(EntityID monster, EntityID target, uint32_t nowMs);
    void wander(EntityID monster, uint32_t nowMs);

    StateStore& store_;
    AreaOfInterestSystem& aoi_;
    CombatSystem& combat_;
    Scheduler& scheduler_;
    RandomSource& random_;
};

} // namespace Midgard
