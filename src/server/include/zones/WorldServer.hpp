#pragma once

#include "ecs/StateStore.hpp"
#include "zones/MapCatalog.hpp"
#include "zones/AreaOfInterest.hpp"
#include "zones/PlayerLifecycle.hpp"
#include "ai/MonsterPopulation.hpp"
#include "ai/MonsterAISystem.hpp"
#include "combat/CombatSystem.hpp"
#include "chat/ChatSystem.hpp"
#include "netcode/SessionChannel.hpp"
#include "netcode/SessionGateway.hpp"
#include "db/ProfileStore.hpp"
#include "sim/Scheduler.hpp"
#include "sim/Random.hpp"
#include "Constants.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>

// [ZONE_AGENT] World server
// Owns every simulation system, wires them together, registers the periodic
// tasks and drives them from one loop on one thread.

namespace Midgard {

class StdioTransport;

struct WorldConfig {
    // Profile persistence
    std::string redisHost{"localhost"};
    uint16_t redisPort{Constants::REDIS_DEFAULT_PORT};
    bool persistProfiles{true};

    // Real time between loop iterations
    uint32_t loopIntervalMs{Constants::LOOP_INTERVAL_MS};

    // 0 = seed from the clock
    uint32_t rngSeed{0};

    // Empty = built-in catalog
    std::string mapsFile;

    // monster:hit takes the client's damage number when true
    bool trustClientDamage{true};
};

class WorldServer {
public:
    // Runs over an externally owned channel (tests, embedding)
    explicit WorldServer(SessionChannel& channel);

    // Runs over its own JSON-lines transport on the given streams
    WorldServer(std::istream& in, std::ostream& out);
    ~WorldServer();

    WorldServer(const WorldServer&) = delete;
    WorldServer& operator=(const WorldServer&) = delete;

    // Loads the catalog, builds the systems, connects persistence.
    // profileStore overrides the Redis store (tests); may be null.
    bool initialize(const WorldConfig& config, ProfileStore* profileStore = nullptr);

    // Initialize with an already-built catalog
    bool initialize(const WorldConfig& config, MapCatalog catalog, ProfileStore* profileStore);

    // Run main loop (blocking)
    void run();

    // Request shutdown (can be called from signal handlers)
    void requestShutdown();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isShutdownRequested() const { return shutdownRequested_; }

    // Single simulation step at nowMs: drain transport, run due timers and
    // periodic tasks, deliver persistence completions
    void tick(uint32_t nowMs);

    // Milliseconds since the server started
    [[nodiscard]] uint32_t getCurrentTimeMs() const;

    // Subsystem access
    [[nodiscard]] StateStore& getStore() { return store_; }
    [[nodiscard]] const MapCatalog& getCatalog() const { return catalog_; }
    [[nodiscard]] Scheduler& getScheduler() { return scheduler_; }
    [[nodiscard]] RandomSource& getRandom() { return random_; }
    [[nodiscard]] AreaOfInterestSystem& getAOI() { return *aoi_; }
    [[nodiscard]] MonsterPopulation& getPopulation() { return *population_; }
    [[nodiscard]] MonsterAISystem& getMonsterAI() { return *monsterAI_; }
    [[nodiscard]] CombatSystem& getCombat() { return *combat_; }
    [[nodiscard]] PlayerLifecycle& getLifecycle() { return *lifecycle_; }
    [[nodiscard]] ChatSystem& getChat() { return *chat_; }
    [[nodiscard]] SessionGateway& getGateway() { return *gateway_; }
    [[nodiscard]] const WorldConfig& getConfig() const { return config_; }

private:
    void buildSystems();
    void registerPeriodicTasks();
    void setupSignalHandlers();
    void shutdown();

    WorldConfig config_;
    MapCatalog catalog_;
    StateStore store_;
    Scheduler scheduler_;
    RandomSource random_;

    std::unique_ptr<StdioTransport> transport_;  // only when self-hosted
    SessionChannel* channel_{nullptr};

    std::unique_ptr<ProfileStore> ownedProfiles_;
    ProfileStore* profiles_{nullptr};

    std::unique_ptr<AreaOfInterestSystem> aoi_;
    std::unique_ptr<MonsterPopulation> population_;
    std::unique_ptr<CombatSystem> combat_;
    std::unique_ptr<MonsterAISystem> monsterAI_;
    std::unique_ptr<PlayerLifecycle> lifecycle_;
    std::unique_ptr<ChatSystem> chat_;
    std::unique_ptr<SessionGateway> gateway_;

    std::chrono::steady_clock::time_point startTime_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};
    bool initialized_{false};
};

} // namespace Midgard
