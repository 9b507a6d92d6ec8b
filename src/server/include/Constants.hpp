#pragma once

#include <cstdint>
#include <cstddef>

// [ALL-AGENTS] Global constants for the Midgard world server
// All magic numbers MUST be defined here, not scattered in code

namespace Midgard {
namespace Constants {

inline constexpr const char* VERSION = "0.4.0";

// ============================================================================
// LOOP / SCHEDULER CONSTANTS
// ============================================================================

// [ZONE_AGENT] Real-time pacing of the cooperative loop
inline constexpr uint32_t LOOP_INTERVAL_MS = 10;
inline constexpr uint32_t OVERRUN_LOG_EVERY_N_LOOPS = 100;

// [ZONE_AGENT] Periodic task intervals
inline constexpr uint32_t MONSTER_AI_INTERVAL_MS = 100;
inline constexpr uint32_t PLAYER_SYNC_INTERVAL_MS = 50;
inline constexpr uint32_t MONSTER_SYNC_INTERVAL_MS = 100;

// ============================================================================
// AREA OF INTEREST
// ============================================================================

// [ZONE_AGENT] Brute-force visibility radius (world units)
inline constexpr float AOI_RADIUS = 800.0f;

// ============================================================================
// MONSTER AI CONSTANTS
// ============================================================================

// [AI_AGENT] Movement broadcast throttle per monster
inline constexpr uint32_t MONSTER_BROADCAST_THROTTLE_MS = 100;

// [AI_AGENT] Idle wander behaviour
inline constexpr uint32_t WANDER_MIN_GAP_MS = 500;
inline constexpr double WANDER_PROBABILITY = 0.01;
inline constexpr float WANDER_STEP = 10.0f;

// [AI_AGENT] Attack animation window before returning to idle
inline constexpr uint32_t ATTACK_STATE_RESET_MS = 400;

// [AI_AGENT] Killed monsters come back after this delay
inline constexpr uint32_t MONSTER_RESPAWN_DELAY_MS = 5000;

// ============================================================================
// PLAYER CONSTANTS
// ============================================================================

// [COMBAT_AGENT] Death and revive
inline constexpr uint32_t PLAYER_REVIVE_DELAY_MS = 3000;

// [NETWORK_AGENT] Inbound move throttle
inline constexpr uint32_t MOVE_THROTTLE_MS = 40;

// [COMBAT_AGENT] PvP
inline constexpr uint32_t PVP_ATTACK_COOLDOWN_MS = 1000;
inline constexpr double CRIT_CHANCE_PER_LUCK = 0.05;
inline constexpr int CRIT_MULTIPLIER = 2;

// [COMBAT_AGENT] Progression
inline constexpr int XP_PER_LEVEL = 100;           // threshold = level * XP_PER_LEVEL
inline constexpr int STAT_POINTS_PER_LEVEL = 5;
inline constexpr int INITIAL_STAT_POINTS = 5;
inline constexpr int BASE_ATTRIBUTE_VALUE = 1;
inline constexpr int MAX_LEVEL = 9999;
inline constexpr int MAX_XP = 100'000'000;        // carried XP never exceeds this

// [COMBAT_AGENT] Attribute scaling
inline constexpr double HP_PER_VIT = 10.0;
inline constexpr double ATTACK_PER_STR = 2.0;
inline constexpr double SPEED_PER_AGI = 0.1;

// [COMBAT_AGENT] Loot
inline constexpr int BCOIN_MIN = 10;
inline constexpr int BCOIN_MAX = 30;
inline constexpr double BCOIN_DROP_CHANCE = 0.7;

// ============================================================================
// CHAT CONSTANTS
// ============================================================================

inline constexpr uint32_t CHAT_COOLDOWN_MS = 5000;
inline constexpr size_t CHAT_MAX_LENGTH = 200;

// ============================================================================
// DATABASE CONSTANTS
// ============================================================================

// [DATABASE_AGENT] Redis profile store
inline constexpr uint16_t REDIS_DEFAULT_PORT = 6379;
inline constexpr uint32_t REDIS_CONNECTION_TIMEOUT_MS = 1000;
inline constexpr size_t REDIS_MAX_PENDING_WRITES = 1024;

} // namespace Constants
} // namespace Midgard
