// [COMBAT_AGENT] Stat pipeline implementation

#include "combat/StatPipeline.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace Midgard {
namespace StatPipeline {

namespace {

struct ClassEntry {
    std::string_view tag;
    ClassStats stats;
};

// First entry is the fallback for unknown tags
constexpr std::array<ClassEntry, 1> CLASS_TABLE{{
    {"assassin", ClassStats{120.0, 25.0, 15.0, 4.0}},
}};

} // anonymous namespace

const ClassStats& classStats(std::string_view classTag) {
    auto it = std::find_if(CLASS_TABLE.begin(), CLASS_TABLE.end(),
                           [classTag](const ClassEntry& entry) { return entry.tag == classTag; });
    return it != CLASS_TABLE.end() ? it->stats : CLASS_TABLE.front().stats;
}

DerivedStats baseStats(std::string_view classTag, int level) {
    const ClassStats& cls = classStats(classTag);
    const int levelsGained = std::max(level, 1) - 1;

    DerivedStats stats;
    stats.maxHp = cls.baseHp + cls.hpPerLevel * levelsGained;
    stats.attack = cls.baseAttack + cls.attackPerLevel * levelsGained;
    stats.speed = 1.0;
    return stats;
}

DerivedStats applyAttributes(DerivedStats stats, const Attributes& attributes) {
    stats.maxHp += Constants::HP_PER_VIT * (attributes.vit - 1);
    stats.attack += Constants::ATTACK_PER_STR * (attributes.str - 1);
    stats.speed = 1.0 + Constants::SPEED_PER_AGI * (attributes.agi - 1);
    return stats;
}

DerivedStats applyEquipment(DerivedStats stats, const Equipment& equipment) {
    StatBag bonus;
    for (const auto& [slot, item] : equipment.slots) {
        for (const auto& [key, value] : item) {
            bonus[key] += value;
        }
    }

    for (const auto& [key, value] : bonus) {
        if (key == "maxHp") {
            stats.maxHp += value;
        } else if (key == "attack") {
            stats.attack += value;
        } else if (key == "speed") {
            stats.speed += value;
        } else {
            stats.extra[key] += value;
        }
    }
    return stats;
}

DerivedStats derive(std::string_view classTag, int level,
                    const Attributes& attributes, const Equipment& equipment) {
    return applyEquipment(applyAttributes(baseStats(classTag, level), attributes), equipment);
}

double reconcileHp(double oldHp, double oldMaxHp, double newMaxHp,
                   bool isDead, HpPolicy policy) {
    if (policy == HpPolicy::FULL_HEAL) {
        return std::max(newMaxHp, 0.0);
    }
    if (isDead) {
        return 0.0;
    }
    if (oldMaxHp <= 0.0) {
        return std::max(newMaxHp, 0.0);
    }
    double hp = std::round(newMaxHp * (oldHp / oldMaxHp));
    return std::clamp(hp, 0.0, std::max(newMaxHp, 0.0));
}

bool recompute(Registry& registry, EntityID player, HpPolicy policy) {
    const PlayerInfo* info = registry.try_get<PlayerInfo>(player);
    const Progression* progression = registry.try_get<Progression>(player);
    const Attributes* attributes = registry.try_get<Attributes>(player);
    const Equipment* equipment = registry.try_get<Equipment>(player);
    CombatState* combat = registry.try_get<CombatState>(player);
    if (!info || !progression || !attributes || !equipment || !combat) {
        return false;
    }

    DerivedStats stats = derive(info->classTag, progression->level, *attributes, *equipment);

    combat->hp = reconcileHp(combat->hp, combat->maxHp, stats.maxHp, combat->isDead, policy);
    combat->maxHp = stats.maxHp;
    combat->attack = stats.attack;
    combat->speed = stats.speed;
    combat->extra = std::move(stats.extra);
    return true;
}

} // namespace StatPipeline
} // namespace Midgard
