#pragma once

#include "ecs/CoreTypes.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

// [NETWORK_AGENT] Event names and outbound payload builders.
// One builder per outbound event; each lists the fields clients rely on.
// Extra fields may be added but never removed.

namespace Midgard {
namespace Events {

// ============================================================================
// Inbound (client -> server)
// ============================================================================

inline constexpr const char* PLAYER_JOIN = "player:join";
inline constexpr const char* PLAYER_MOVE = "player:move";
inline constexpr const char* PLAYER_ATTACK = "player:attack";
inline constexpr const char* PLAYER_SKILL = "player:skill";
inline constexpr const char* MONSTER_HIT = "monster:hit";
inline constexpr const char* PLAYER_PVP_ATTACK = "player:pvpAttack";
inline constexpr const char* PLAYER_HIT = "player:hit";
inline constexpr const char* PLAYER_ALLOCATE_STAT = "player:allocateStat";
inline constexpr const char* PLAYER_CHANGE_MAP = "player:changeMap";
inline constexpr const char* PLAYER_SEND_CHAT = "player:sendChat";
inline constexpr const char* DROP_PICKUP = "drop:pickup";
inline constexpr const char* DISCONNECT = "disconnect";

// ============================================================================
// Outbound (server -> client)
// ============================================================================

inline constexpr const char* PLAYER_JOINED = "player:joined";
inline constexpr const char* PLAYER_LEFT = "player:left";
inline constexpr const char* PLAYER_MOVED = "player:moved";
inline constexpr const char* PLAYER_DAMAGED = "player:damaged";
inline constexpr const char* PLAYER_ATTACKED = "player:attacked";
inline constexpr const char* PLAYER_SKILL_CAST = "player:skill";
inline constexpr const char* PLAYER_HP_CHANGED = "player:hpChanged";
inline constexpr const char* PLAYER_DIED = "player:died";
inline constexpr const char* PLAYER_REVIVED = "player:revived";
inline constexpr const char* PLAYER_LEVEL_UP = "player:levelUp";
inline constexpr const char* PLAYER_XP_UPDATED = "player:xpUpdated";
inline constexpr const char* PLAYER_STATS_INITIALIZED = "player:statsInitialized";
inline constexpr const char* PLAYER_STATS_UPDATED = "player:statsUpdated";
inline constexpr const char* PLAYER_ATTACK_RESULT = "player:attackResult";
inline constexpr const char* PLAYER_PVP_HIT = "player:pvpHit";
inline constexpr const char* PLAYER_HIT_DENIED = "player:hitDenied";
inline constexpr const char* PLAYER_MAP_ERROR = "player:mapError";

inline constexpr const char* MONSTER_SPAWN = "monster:spawn";
inline constexpr const char* MONSTER_MOVE = "monster:move";
inline constexpr const char* MONSTER_ATTACK = "monster:attack";
inline constexpr const char* MONSTER_HIT_BROADCAST = "monster:hit";
inline constexpr const char* MONSTER_DESPAWN = "monster:despawn";
inline constexpr const char* MONSTER_UPDATE = "monster:update";
inline constexpr const char* MONSTER_KILLED = "monster:killed";

inline constexpr const char* DROP_SPAWN = "drop:spawn";
inline constexpr const char* DROP_PICKED_UP = "drop:pickup";

inline constexpr const char* CHAT_MESSAGE = "chat:message";
inline constexpr const char* CHAT_SPAM_BLOCKED = "chat:spamBlocked";
inline constexpr const char* CHAT_ERROR = "chat:error";

// ============================================================================
// Payload builders
// ============================================================================

[[nodiscard]] nlohmann::json position(const glm::vec2& p);
[[nodiscard]] nlohmann::json attributes(const Attributes& attrs);
[[nodiscard]] nlohmann::json optionalString(const std::optional<std::string>& value);
[[nodiscard]] nlohmann::json message(const std::string& text);

// player:joined {email, name, character_class, level, position, direction, state}
[[nodiscard]] nlohmann::json playerJoined(const Registry& registry, EntityID player);

// player:left {email}
[[nodiscard]] nlohmann::json playerLeft(const std::string& identity);

// player:moved {email, name, character_class, position, direction, state, timestamp}
[[nodiscard]] nlohmann::json playerMoved(const Registry& registry, EntityID player, uint32_t nowMs);

// player:statsInitialized / player:statsUpdated
// {stats, statPointsAvailable, hp, maxHp, attack, speed}
[[nodiscard]] nlohmann::json playerStats(const Registry& registry, EntityID player);

// player:xpUpdated {xp, level, xpToLevel}
[[nodiscard]] nlohmann::json xpUpdated(const Progression& progression);

// player:levelUp {level, hp, maxHp, attack, speed, stats, statPointsAvailable}
[[nodiscard]] nlohmann::json levelUp(const Registry& registry, EntityID player);

// player:hpChanged {hp, maxHp, damage, attacker}
[[nodiscard]] nlohmann::json hpChanged(const CombatState& combat, double damage,
                                       const std::optional<std::string>& attacker);

// player:damaged {email, damage, attacker}
[[nodiscard]] nlohmann::json playerDamaged(const std::string& identity, double damage,
                                           const std::optional<std::string>& attacker);

// player:died {map, x, y}
[[nodiscard]] nlohmann::json playerDied(const Transform& transform);

// player:revived {hp, maxHp, attack, speed, map, x, y}
[[nodiscard]] nlohmann::json playerRevived(const CombatState& combat, const Transform& transform);

// player:attacked {email, position, direction, damage}
// damage is relayed exactly as the client sent it
[[nodiscard]] nlohmann::json playerAttacked(const std::string& identity, const Transform& transform,
                                            const nlohmann::json& damage);

// player:skill {email, skillType, position, direction, data}
[[nodiscard]] nlohmann::json playerSkill(const std::string& identity, const Transform& transform,
                                         const nlohmann::json& skillType, const nlohmann::json& data);

// monster:spawn {id, type, mapId, x, y, hp, maxHp, direction, state}
// Snapshot form adds {spawnX, spawnY, target}.
[[nodiscard]] nlohmann::json monsterSpawn(const Registry& registry, EntityID monster, bool snapshot);

// monster:move {id, mapId, x, y, direction, state}
[[nodiscard]] nlohmann::json monsterMove(const Registry& registry, EntityID monster);

// monster:update {id, type, mapId, x, y, direction, state, hp, maxHp, target}
[[nodiscard]] nlohmann::json monsterUpdate(const Registry& registry, EntityID monster);

// monster:attack {id, mapId, targetEmail, damage, x, y, direction}
[[nodiscard]] nlohmann::json monsterAttack(const Registry& registry, EntityID monster,
                                           const std::string& targetIdentity);

// monster:hit {id, mapId, hp, damage}
[[nodiscard]] nlohmann::json monsterHit(const Registry& registry, EntityID monster, double damage);

// monster:despawn {id, mapId}
[[nodiscard]] nlohmann::json monsterDespawn(const std::string& monsterId, const std::string& mapId);

// monster:killed {monsterId, xp, currentXp, level, loot{id, name}} (+ bcoins)
[[nodiscard]] nlohmann::json monsterKilled(const std::string& monsterId, int xpReward,
                                           const Progression& killer, int bcoins,
                                           const std::string& lootItem);

// drop:spawn {id, x, y, type, amount, itemName, mapId}
[[nodiscard]] nlohmann::json dropSpawn(const FloorDrop& drop);

// drop:pickup {dropId, email}
[[nodiscard]] nlohmann::json dropPickup(const std::string& dropId, const std::string& identity);

// chat:message {from, message, type, timestamp, senderEmail}
[[nodiscard]] nlohmann::json chatMessage(const PlayerInfo& sender, const std::string& text,
                                         const std::string& channel, uint32_t nowMs);

} // namespace Events
} // namespace Midgard
