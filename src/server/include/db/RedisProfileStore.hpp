#pragma once

#include "db/ProfileStore.hpp"
#include "Constants.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

// [DATABASE_AGENT] Redis-backed profile store
// One hash per player, written by a dedicated I/O thread so the tick loop
// never blocks on the network.

struct redisContext;

namespace Midgard {

class RedisProfileStore : public ProfileStore {
public:
    RedisProfileStore() = default;
    ~RedisProfileStore() override;

    RedisProfileStore(const RedisProfileStore&) = delete;
    RedisProfileStore& operator=(const RedisProfileStore&) = delete;

    // Connects, verifies with PING and starts the writer thread
    bool initialize(const std::string& host = "localhost",
                    uint16_t port = Constants::REDIS_DEFAULT_PORT);

    // Flushes queued writes, stops the writer thread and disconnects
    void shutdown();

    [[nodiscard]] bool isConnected() const { return connected_; }

    void saveProfile(const PlayerProfile& profile, SaveCallback callback = nullptr) override;
    void update() override;

    // === Metrics ===
    [[nodiscard]] uint64_t getCommandsSent() const { return commandsSent_; }
    [[nodiscard]] uint64_t getCommandsCompleted() const { return commandsCompleted_; }
    [[nodiscard]] uint64_t getCommandsFailed() const { return commandsFailed_; }

private:
    struct PendingWrite {
        PlayerProfile profile;
        SaveCallback callback;
    };

    void writerLoop();
    bool writeProfile(const PlayerProfile& profile);
    bool ensureConnection();
    void complete(SaveCallback callback, bool success);

    std::string host_;
    uint16_t port_{Constants::REDIS_DEFAULT_PORT};
    redisContext* ctx_{nullptr};  // owned by the writer thread after initialize()

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::thread writer_;

    std::queue<PendingWrite> writeQueue_;
    std::mutex writeMutex_;
    std::condition_variable writeCv_;

    std::queue<std::function<void()>> callbackQueue_;
    std::mutex callbackMutex_;

    std::atomic<uint64_t> commandsSent_{0};
    std::atomic<uint64_t> commandsCompleted_{0};
    std::atomic<uint64_t> commandsFailed_{0};
};

// [DATABASE_AGENT] Key naming conventions
namespace RedisKeys {
    inline std::string profile(const std::string& identity) {
        return "profile:" + identity;
    }
}

} // namespace Midgard
