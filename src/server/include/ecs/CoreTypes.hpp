#pragma once

#include "Constants.hpp"
#include <cstdint>
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// [ECS_AGENT] Core ECS types and components for the Midgard world
// Components are plain data; systems own the behaviour

namespace Midgard {

using EntityID = entt::entity;
using Registry = entt::registry;
using ConnectionID = uint32_t;  // Session handle issued by the transport

inline constexpr ConnectionID INVALID_CONNECTION = 0;

// Numeric stat bag (equipment bonuses, equipment-only stats)
using StatBag = std::map<std::string, double>;

// ============================================================================
// ENUMS
// ============================================================================

enum class Facing : uint8_t {
    FRONT,
    BACK,
    LEFT,
    RIGHT
};

enum class AnimationState : uint8_t {
    IDLE,
    MOVING,
    ATTACKING,
    DEAD
};

enum class MonsterState : uint8_t {
    IDLE,
    CHASING,
    ATTACKING
};

enum class AttributeKey : uint8_t {
    STR,
    AGI,
    VIT,
    INT,
    DEX,
    LUCK
};

inline constexpr AttributeKey ALL_ATTRIBUTES[] = {
    AttributeKey::STR, AttributeKey::AGI, AttributeKey::VIT,
    AttributeKey::INT, AttributeKey::DEX, AttributeKey::LUCK
};

// String forms used on the wire
[[nodiscard]] const char* toString(Facing facing);
[[nodiscard]] const char* toString(AnimationState state);
[[nodiscard]] const char* toString(MonsterState state);
[[nodiscard]] const char* toString(AttributeKey key);

[[nodiscard]] std::optional<Facing> parseFacing(std::string_view text);
[[nodiscard]] std::optional<AnimationState> parseAnimationState(std::string_view text);
[[nodiscard]] std::optional<AttributeKey> parseAttributeKey(std::string_view text);

// ============================================================================
// SHARED COMPONENTS
// ============================================================================

// [ECS_AGENT] World placement (players and monsters)
struct Transform {
    glm::vec2 position{0.0f, 0.0f};
    Facing facing{Facing::FRONT};
    std::string mapId;
};

// [COMBAT_AGENT] Live combat numbers. For players maxHp/attack/speed/extra are
// written only by the stat pipeline.
struct CombatState {
    double hp{0.0};
    double maxHp{0.0};
    double attack{0.0};
    double speed{1.0};
    bool isDead{false};
    StatBag extra;  // equipment-only stats

    [[nodiscard]] float healthPercent() const {
        return maxHp > 0.0 ? static_cast<float>(hp / maxHp * 100.0) : 0.0f;
    }
};

// ============================================================================
// PLAYER COMPONENTS
// ============================================================================

struct PlayerTag {};

// [ZONE_AGENT] Identity and session binding
struct PlayerInfo {
    std::string identity;       // stable account key (email)
    std::string name;
    std::string classTag;
    ConnectionID connectionId{INVALID_CONNECTION};
    bool online{false};
    AnimationState animState{AnimationState::IDLE};
};

struct Progression {
    int level{1};
    int xp{0};
    int statPoints{Constants::INITIAL_STAT_POINTS};

    [[nodiscard]] int xpToLevel() const { return level * Constants::XP_PER_LEVEL; }
};

// [COMBAT_AGENT] Allocated attribute points, each >= 1
struct Attributes {
    int str{Constants::BASE_ATTRIBUTE_VALUE};
    int agi{Constants::BASE_ATTRIBUTE_VALUE};
    int vit{Constants::BASE_ATTRIBUTE_VALUE};
    int intel{Constants::BASE_ATTRIBUTE_VALUE};
    int dex{Constants::BASE_ATTRIBUTE_VALUE};
    int luck{Constants::BASE_ATTRIBUTE_VALUE};

    [[nodiscard]] int get(AttributeKey key) const;
    int& ref(AttributeKey key);
};

// Slot name -> bonus bag. An empty bag is an empty slot.
struct Equipment {
    std::map<std::string, StatBag> slots;
};

struct Inventory {
    std::vector<std::string> items;
};

// [NETWORK_AGENT] Throttle / cooldown bookkeeping
struct ActionTimers {
    std::optional<uint32_t> lastMoveMs;
    std::optional<uint32_t> lastPvpAttackMs;
    std::map<std::string, uint32_t> lastChatMs;  // per channel
};

// ============================================================================
// MONSTER COMPONENTS
// ============================================================================

struct MonsterTag {};

// [AI_AGENT] Per-instance AI state
struct MonsterBrain {
    std::string id;
    std::string type;
    glm::vec2 spawnOrigin{0.0f, 0.0f};
    MonsterState state{MonsterState::IDLE};
    float aggroRadius{0.0f};
    float attackRadius{0.0f};
    uint32_t attackCooldownMs{0};
    std::optional<uint32_t> lastAttackMs;   // empty = never attacked
    uint32_t lastUpdateMs{0};               // last movement broadcast
    std::optional<std::string> target;
    std::optional<std::string> lastHitBy;
};

// ============================================================================
// FLOOR DROPS
// ============================================================================

enum class DropKind : uint8_t {
    BCOINS,
    ITEM
};

[[nodiscard]] const char* toString(DropKind kind);

struct FloorDrop {
    std::string id;
    std::string mapId;
    glm::vec2 position{0.0f, 0.0f};
    DropKind kind{DropKind::BCOINS};
    int amount{0};
    std::string itemName;
};

} // namespace Midgard
