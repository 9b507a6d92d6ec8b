// [NETWORK_AGENT] Outbound payload builders

#include "netcode/Events.hpp"

namespace Midgard {
namespace Events {

nlohmann::json position(const glm::vec2& p) {
    return {{"x", p.x}, {"y", p.y}};
}

nlohmann::json attributes(const Attributes& attrs) {
    nlohmann::json j = nlohmann::json::object();
    for (AttributeKey key : ALL_ATTRIBUTES) {
        j[toString(key)] = attrs.get(key);
    }
    return j;
}

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json message(const std::string& text) {
    return {{"message", text}};
}

// ============================================================================
// Player payloads
// ============================================================================

nlohmann::json playerJoined(const Registry& registry, EntityID player) {
    const auto& info = registry.get<PlayerInfo>(player);
    const auto& transform = registry.get<Transform>(player);
    const auto& progression = registry.get<Progression>(player);
    return {
        {"email", info.identity},
        {"name", info.name},
        {"character_class", info.classTag},
        {"level", progression.level},
        {"position", position(transform.position)},
        {"direction", toString(transform.facing)},
        {"state", toString(info.animState)}
    };
}

nlohmann::json playerLeft(const std::string& identity) {
    return {{"email", identity}};
}

nlohmann::json playerMoved(const Registry& registry, EntityID player, uint32_t nowMs) {
    const auto& info = registry.get<PlayerInfo>(player);
    const auto& transform = registry.get<Transform>(player);
    return {
        {"email", info.identity},
        {"name", info.name},
        {"character_class", info.classTag},
        {"position", position(transform.position)},
        {"direction", toString(transform.facing)},
        {"state", toString(info.animState)},
        {"timestamp", nowMs}
    };
}

nlohmann::json playerStats(const Registry& registry, EntityID player) {
    const auto& attrs = registry.get<Attributes>(player);
    const auto& progression = registry.get<Progression>(player);
    const auto& combat = registry.get<CombatState>(player);
    nlohmann::json j = {
        {"stats", attributes(attrs)},
        {"statPointsAvailable", progression.statPoints},
        {"hp", combat.hp},
        {"maxHp", combat.maxHp},
        {"attack", combat.attack},
        {"speed", combat.speed}
    };
    for (const auto& [key, value] : combat.extra) {
        j["extra"][key] = value;
    }
    return j;
}

nlohmann::json xpUpdated(const Progression& progression) {
    return {
        {"xp", progression.xp},
        {"level", progression.level},
        {"xpToLevel", progression.xpToLevel()}
    };
}

nlohmann::json levelUp(const Registry& registry, EntityID player) {
    const auto& attrs = registry.get<Attributes>(player);
    const auto& progression = registry.get<Progression>(player);
    const auto& combat = registry.get<CombatState>(player);
    return {
        {"level", progression.level},
        {"hp", combat.hp},
        {"maxHp", combat.maxHp},
        {"attack", combat.attack},
        {"speed", combat.speed},
        {"stats", attributes(attrs)},
        {"statPointsAvailable", progression.statPoints}
    };
}

nlohmann::json hpChanged(const CombatState& combat, double damage,
                         const std::optional<std::string>& attacker) {
    return {
        {"hp", combat.hp},
        {"maxHp", combat.maxHp},
        {"damage", damage},
        {"attacker", optionalString(attacker)}
    };
}

nlohmann::json playerDamaged(const std::string& identity, double damage,
                             const std::optional<std::string>& attacker) {
    return {
        {"email", identity},
        {"damage", damage},
        {"attacker", optionalString(attacker)}
    };
}

nlohmann::json playerDied(const Transform& transform) {
    return {
        {"map", transform.mapId},
        {"x", transform.position.x},
        {"y", transform.position.y}
    };
}

nlohmann::json playerRevived(const CombatState& combat, const Transform& transform) {
    return {
        {"hp", combat.hp},
        {"maxHp", combat.maxHp},
        {"attack", combat.attack},
        {"speed", combat.speed},
        {"map", transform.mapId},
        {"x", transform.position.x},
        {"y", transform.position.y}
    };
}

nlohmann::json playerAttacked(const std::string& identity, const Transform& transform,
                              const nlohmann::json& damage) {
    return {
        {"email", identity},
        {"position", position(transform.position)},
        {"direction", toString(transform.facing)},
        {"damage", damage}
    };
}

nlohmann::json playerSkill(const std::string& identity, const Transform& transform,
                           const nlohmann::json& skillType, const nlohmann::json& data) {
    return {
        {"email", identity},
        {"skillType", skillType},
        {"position", position(transform.position)},
        {"direction", toString(transform.facing)},
        {"data", data}
    };
}

// ============================================================================
// Monster payloads
// ============================================================================

nlohmann::json monsterSpawn(const Registry& registry, EntityID monster, bool snapshot) {
    const auto& brain = registry.get<MonsterBrain>(monster);
    const auto& transform = registry.get<Transform>(monster);
    const auto& combat = registry.get<CombatState>(monster);
    nlohmann::json j = {
        {"id", brain.id},
        {"type", brain.type},
        {"mapId", transform.mapId},
        {"x", transform.position.x},
        {"y", transform.position.y},
        {"hp", combat.hp},
        {"maxHp", combat.maxHp},
        {"direction", toString(transform.facing)},
        {"state", toString(brain.state)}
    };
    if (snapshot) {
        j["spawnX"] = brain.spawnOrigin.x;
        j["spawnY"] = brain.spawnOrigin.y;
        j["target"] = optionalString(brain.target);
    }
    return j;
}

nlohmann::json monsterMove(const Registry& registry, EntityID monster) {
    const auto& brain = registry.get<MonsterBrain>(monster);
    const auto& transform = registry.get<Transform>(monster);
    return {
        {"id", brain.id},
        {"mapId", transform.mapId},
        {"x", transform.position.x},
        {"y", transform.position.y},
        {"direction", toString(transform.facing)},
        {"state", toString(brain.state)}
    };
}

nlohmann::json monsterUpdate(const Registry& registry, EntityID monster) {
    const auto& brain = registry.get<MonsterBrain>(monster);
    const auto& transform = registry.get<Transform>(monster);
    const auto& combat = registry.get<CombatState>(monster);
    return {
        {"id", brain.id},
        {"type", brain.type},
        {"mapId", transform.mapId},
        {"x", transform.position.x},
        {"y", transform.position.y},
        {"direction", toString(transform.facing)},
        {"state", toString(brain.state)},
        {"hp", combat.hp},
        {"maxHp", combat.maxHp},
        {"target", optionalString(brain.target)}
    };
}

nlohmann::json monsterAttack(const Registry& registry, EntityID monster,
                             const std::string& targetIdentity) {
    const auto& brain = registry.get<MonsterBrain>(monster);
    const auto& transform = registry.get<Transform>(monster);
    const auto& combat = registry.get<CombatState>(monster);
    return {
        {"id", brain.id},
        {"mapId", transform.mapId},
        {"targetEmail", targetIdentity},
        {"damage", combat.attack},
        {"x", transform.position.x},
        {"y", transform.position.y},
        {"direction", toString(transform.facing)}
    };
}

nlohmann::json monsterHit(const Registry& registry, EntityID monster, double damage) {
    const auto& brain = registry.get<MonsterBrain>(monster);
    const auto& transform = registry.get<Transform>(monster);
    const auto& combat = registry.get<CombatState>(monster);
    return {
        {"id", brain.id},
        {"mapId", transform.mapId},
        {"hp", combat.hp},
        {"damage", damage}
    };
}

nlohmann::json monsterDespawn(const std::string& monsterId, const std::string& mapId) {
    return {{"id", monsterId}, {"mapId", mapId}};
}

nlohmann::json monsterKilled(const std::string& monsterId, int xpReward,
                             const Progression& killer, int bcoins,
                             const std::string& lootItem) {
    return {
        {"monsterId", monsterId},
        {"xp", xpReward},
        {"currentXp", killer.xp},
        {"level", killer.level},
        {"bcoins", bcoins},
        {"loot", {{"id", lootItem}, {"name", lootItem}}}
    };
}

// ============================================================================
// Drops
// ============================================================================

nlohmann::json dropSpawn(const FloorDrop& drop) {
    return {
        {"id", drop.id},
        {"x", drop.position.x},
        {"y", drop.position.y},
        {"type", toString(drop.kind)},
        {"amount", drop.amount},
        {"itemName", drop.itemName},
        {"mapId", drop.mapId}
    };
}

nlohmann::json dropPickup(const std::string& dropId, const std::string& identity) {
    return {{"dropId", dropId}, {"email", identity}};
}

// ============================================================================
// Chat payloads
// ============================================================================

nlohmann::json chatMessage(const PlayerInfo& sender, const std::string& text,
                           const std::string& channel, uint32_t nowMs) {
    return {
        {"from", sender.name},
        {"message", text},
        {"type", channel},
        {"timestamp", nowMs},
        {"senderEmail", sender.identity}
    };
}

} // namespace Events
} // namespace Midgard
