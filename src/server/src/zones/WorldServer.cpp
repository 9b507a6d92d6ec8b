// [ZONE_AGENT] World server implementation
// Builds and wires the simulation systems and drives the main loop

#include "zones/WorldServer.hpp"
#include "netcode/StdioTransport.hpp"
#include "db/RedisProfileStore.hpp"
#include <csignal>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

namespace Midgard {

WorldServer::WorldServer(SessionChannel& channel)
    : channel_(&channel) {}

WorldServer::WorldServer(std::istream& in, std::ostream& out)
    : transport_(std::make_unique<StdioTransport>(in, out)) {
    channel_ = transport_.get();
}

WorldServer::~WorldServer() = default;

// ============================================================================
// Initialization
// ============================================================================

bool WorldServer::initialize(const WorldConfig& config, ProfileStore* profileStore) {
    if (config.mapsFile.empty()) {
        return initialize(config, MapCatalog::defaults(), profileStore);
    }

    std::optional<MapCatalog> catalog = MapCatalog::loadFromFile(config.mapsFile);
    if (!catalog) {
        std::cerr << "[WORLD] Failed to load map catalog from " << config.mapsFile << std::endl;
        return false;
    }
    return initialize(config, std::move(*catalog), profileStore);
}

bool WorldServer::initialize(const WorldConfig& config, MapCatalog catalog,
                             ProfileStore* profileStore) {
    if (initialized_) {
        std::cerr << "[WORLD] Already initialized" << std::endl;
        return false;
    }

    std::cout << "[WORLD] Initializing..." << std::endl;

    std::string error;
    if (!catalog.validate(error)) {
        std::cerr << "[MAPS] Invalid map catalog: " << error << std::endl;
        return false;
    }
    config_ = config;
    catalog_ = std::move(catalog);
    std::cout << "[WORLD] Map catalog loaded (" << catalog_.mapCount() << " maps, default town "
              << catalog_.defaultTown() << ")" << std::endl;

    uint32_t seed = config_.rngSeed;
    if (seed == 0) {
        seed = static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count())
             ^ std::random_device{}();
    }
    random_.reseed(seed);
    std::cout << "[WORLD] RNG seed " << seed << std::endl;

    // Profile persistence
    if (profileStore) {
        profiles_ = profileStore;
    } else if (config_.persistProfiles) {
        auto redis = std::make_unique<RedisProfileStore>();
        if (redis->initialize(config_.redisHost, config_.redisPort)) {
            ownedProfiles_ = std::move(redis);
            profiles_ = ownedProfiles_.get();
        } else {
            std::cerr << "[WORLD] Failed to connect to Redis!" << std::endl;
            std::cout << "[WORLD] Continuing without profile persistence..." << std::endl;
        }
    }

    if (transport_ && !transport_->initialize()) {
        std::cerr << "[WORLD] Failed to start transport!" << std::endl;
        return false;
    }

    buildSystems();
    registerPeriodicTasks();

    startTime_ = std::chrono::steady_clock::now();
    initialized_ = true;
    std::cout << "[WORLD] Initialization complete" << std::endl;
    return true;
}

void WorldServer::buildSystems() {
    CombatConfig combatConfig;
    combatConfig.trustClientDamage = config_.trustClientDamage;
    if (!combatConfig.trustClientDamage) {
        std::cout << "[WORLD] Monster damage is computed server-side" << std::endl;
    }

    aoi_ = std::make_unique<AreaOfInterestSystem>(store_, *channel_);
    population_ = std::make_unique<MonsterPopulation>(store_, catalog_, *aoi_, scheduler_, random_);
    combat_ = std::make_unique<CombatSystem>(store_, catalog_, *aoi_, *population_, random_, combatConfig);
    monsterAI_ = std::make_unique<MonsterAISystem>(store_, *aoi_, *combat_, scheduler_, random_);
    lifecycle_ = std::make_unique<PlayerLifecycle>(store_, catalog_, *aoi_, *population_,
                                                   scheduler_, profiles_);
    chat_ = std::make_unique<ChatSystem>(store_, catalog_, *aoi_);
    gateway_ = std::make_unique<SessionGateway>(store_, *lifecycle_, *combat_, *chat_, *channel_);

    combat_->setOnPlayerDeath([this](EntityID victim, uint32_t nowMs) {
        lifecycle_->handleDeath(victim, nowMs);
    });
}

void WorldServer::registerPeriodicTasks() {
    scheduler_.addPeriodic("monster_ai", Constants::MONSTER_AI_INTERVAL_MS,
                           [this](uint32_t nowMs) { monsterAI_->update(nowMs); });
    scheduler_.addPeriodic("player_sync", Constants::PLAYER_SYNC_INTERVAL_MS,
                           [this](uint32_t nowMs) { lifecycle_->syncPlayerPositions(nowMs); });
    scheduler_.addPeriodic("monster_sync", Constants::MONSTER_SYNC_INTERVAL_MS,
                           [this](uint32_t) { lifecycle_->syncMonsterStates(); });
}

// ============================================================================
// Main Loop
// ============================================================================

void WorldServer::tick(uint32_t nowMs) {
    if (transport_) {
        for (const InboundMessage& message : transport_->getPendingMessages()) {
            gateway_->handleEvent(message.connection, message.event, message.payload, nowMs);
        }
        if (transport_->isInputClosed() && running_) {
            std::cout << "[WORLD] Input closed" << std::endl;
            requestShutdown();
        }
    }

    scheduler_.advance(nowMs);

    if (profiles_) {
        profiles_->update();
    }
}

void WorldServer::run() {
    if (!initialized_) {
        std::cerr << "[WORLD] run() called before initialize()" << std::endl;
        return;
    }

    std::cout << "[WORLD] Starting main loop..." << std::endl;

    setupSignalHandlers();
    running_ = true;
    shutdownRequested_ = false;

    const auto loopInterval = std::chrono::milliseconds(config_.loopIntervalMs);
    uint64_t loopCount = 0;

    while (running_) {
        auto frameStart = std::chrono::steady_clock::now();

        tick(getCurrentTimeMs());
        loopCount++;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - frameStart);

        if (elapsed < loopInterval) {
            std::this_thread::sleep_for(loopInterval - elapsed);
        } else if (loopCount % Constants::OVERRUN_LOG_EVERY_N_LOOPS == 0) {
            std::cerr << "[WORLD] Loop overrun: " << elapsed.count()
                      << " ms (budget: " << loopInterval.count() << " ms)" << std::endl;
        }
    }

    std::cout << "[WORLD] Main loop ended after " << loopCount << " iterations" << std::endl;
    shutdown();
}

uint32_t WorldServer::getCurrentTimeMs() const {
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_).count());
}

// ============================================================================
// Signals / Shutdown
// ============================================================================

// Global pointer for signal handler access
static WorldServer* g_worldServerInstance = nullptr;

void WorldServer::setupSignalHandlers() {
    g_worldServerInstance = this;

    #ifdef _WIN32
    std::signal(SIGINT, [](int) {
        std::cout << "[SIGNAL] SIGINT received, requesting shutdown..." << std::endl;
        if (g_worldServerInstance) {
            g_worldServerInstance->requestShutdown();
        }
    });
    std::signal(SIGTERM, [](int) {
        std::cout << "[SIGNAL] SIGTERM received, requesting shutdown..." << std::endl;
        if (g_worldServerInstance) {
            g_worldServerInstance->requestShutdown();
        }
    });
    #else
    struct sigaction sa;
    sa.sa_handler = [](int sig) {
        std::cout << "[SIGNAL] Signal " << sig << " received, requesting shutdown..." << std::endl;
        if (g_worldServerInstance) {
            g_worldServerInstance->requestShutdown();
        }
    };
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    #endif
}

void WorldServer::requestShutdown() {
    if (!shutdownRequested_) {
        shutdownRequested_ = true;
        running_ = false;
        std::cout << "[WORLD] Shutdown requested" << std::endl;
    }
}

void WorldServer::shutdown() {
    std::cout << "[WORLD] Shutting down WorldServer..." << std::endl;

    // Disconnect everyone still online so their profiles are written
    const uint32_t nowMs = getCurrentTimeMs();
    std::vector<EntityID> online;
    for (EntityID player : store_.allPlayers()) {
        if (store_.registry().get<PlayerInfo>(player).online) {
            online.push_back(player);
        }
    }
    for (EntityID player : online) {
        lifecycle_->disconnect(player, nowMs);
    }

    if (profiles_) {
        std::cout << "[WORLD] Processing pending profile writes..." << std::endl;
        profiles_->update();
    }
    // Joins the Redis writer after it drains its queue
    ownedProfiles_.reset();
    profiles_ = nullptr;

    if (transport_) {
        transport_->shutdown();
    }

    if (g_worldServerInstance == this) {
        g_worldServerInstance = nullptr;
    }
    std::cout << "[WORLD] WorldServer shutdown complete" << std::endl;
}

} // namespace Midgard
