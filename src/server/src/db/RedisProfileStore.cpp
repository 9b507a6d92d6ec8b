// [DATABASE_AGENT] Redis profile store implementation
// HSET profile:<identity> str agi vit int dex luck stat_points

#include "db/RedisProfileStore.hpp"
#include <iostream>

#include <hiredis.h>

namespace Midgard {

namespace {

redisContext* connectWithTimeout(const std::string& host, uint16_t port) {
    struct timeval timeout;
    timeout.tv_sec = Constants::REDIS_CONNECTION_TIMEOUT_MS / 1000;
    timeout.tv_usec = (Constants::REDIS_CONNECTION_TIMEOUT_MS % 1000) * 1000;

    redisContext* ctx = redisConnectWithTimeout(host.c_str(), port, timeout);
    if (!ctx || ctx->err) {
        if (ctx) {
            std::cerr << "[REDIS] Connection error: " << ctx->errstr << std::endl;
            redisFree(ctx);
        } else {
            std::cerr << "[REDIS] Failed to allocate context" << std::endl;
        }
        return nullptr;
    }

    redisEnableKeepAlive(ctx);
    return ctx;
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

RedisProfileStore::~RedisProfileStore() {
    shutdown();
}

bool RedisProfileStore::initialize(const std::string& host, uint16_t port) {
    host_ = host;
    port_ = port;

    std::cout << "[REDIS] Connecting to " << host << ":" << port << "..." << std::endl;

    ctx_ = connectWithTimeout(host_, port_);
    if (!ctx_) {
        return false;
    }

    redisReply* reply = static_cast<redisReply*>(redisCommand(ctx_, "PING"));
    if (!reply || reply->type != REDIS_REPLY_STATUS || std::string(reply->str) != "PONG") {
        std::cerr << "[REDIS] PING failed" << std::endl;
        if (reply) freeReplyObject(reply);
        redisFree(ctx_);
        ctx_ = nullptr;
        return false;
    }
    freeReplyObject(reply);

    connected_ = true;
    running_ = true;
    writer_ = std::thread(&RedisProfileStore::writerLoop, this);

    std::cout << "[REDIS] Profile store ready" << std::endl;
    return true;
}

void RedisProfileStore::shutdown() {
    if (!running_) return;

    std::cout << "[REDIS] Shutting down..." << std::endl;

    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        running_ = false;
    }
    writeCv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }

    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }
    connected_ = false;

    // Deliver whatever the writer finished before stopping
    update();
    std::cout << "[REDIS] Shutdown complete" << std::endl;
}

// ============================================================================
// Writes
// ============================================================================

void RedisProfileStore::saveProfile(const PlayerProfile& profile, SaveCallback callback) {
    commandsSent_++;

    if (!running_) {
        commandsFailed_++;
        complete(std::move(callback), false);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (writeQueue_.size() >= Constants::REDIS_MAX_PENDING_WRITES) {
            commandsFailed_++;
            std::cerr << "[REDIS] Write queue full, dropping profile of " << profile.identity << std::endl;
            complete(std::move(callback), false);
            return;
        }
        writeQueue_.push({profile, std::move(callback)});
    }
    writeCv_.notify_one();
}

void RedisProfileStore::update() {
    std::queue<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callbacks.swap(callbackQueue_);
    }

    while (!callbacks.empty()) {
        callbacks.front()();
        callbacks.pop();
    }
}

void RedisProfileStore::complete(SaveCallback callback, bool success) {
    if (!callback) return;
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbackQueue_.push([callback = std::move(callback), success]() { callback(success); });
}

// ============================================================================
// Writer thread
// ============================================================================

void RedisProfileStore::writerLoop() {
    while (true) {
        PendingWrite write;
        {
            std::unique_lock<std::mutex> lock(writeMutex_);
            writeCv_.wait(lock, [this]() { return !running_ || !writeQueue_.empty(); });

            // Drain the queue before honouring a stop request
            if (writeQueue_.empty()) {
                return;
            }
            write = std::move(writeQueue_.front());
            writeQueue_.pop();
        }

        const bool success = writeProfile(write.profile);
        if (success) {
            commandsCompleted_++;
        } else {
            commandsFailed_++;
        }
        complete(std::move(write.callback), success);
    }
}

bool RedisProfileStore::ensureConnection() {
    if (ctx_ && !ctx_->err) {
        return true;
    }
    if (ctx_) {
        redisFree(ctx_);
        ctx_ = nullptr;
    }
    ctx_ = connectWithTimeout(host_, port_);
    connected_ = ctx_ != nullptr;
    return connected_;
}

bool RedisProfileStore::writeProfile(const PlayerProfile& profile) {
    if (!ensureConnection()) {
        return false;
    }

    const std::string key = RedisKeys::profile(profile.identity);
    const Attributes& a = profile.attributes;

    redisReply* reply = static_cast<redisReply*>(redisCommand(ctx_,
        "HSET %b str %d agi %d vit %d int %d dex %d luck %d stat_points %d",
        key.data(), key.size(),
        a.str, a.agi, a.vit, a.intel, a.dex, a.luck, profile.statPoints));

    if (!reply) {
        std::cerr << "[REDIS] HSET " << key << " failed: " << ctx_->errstr << std::endl;
        return false;
    }

    const bool success = reply->type == REDIS_REPLY_INTEGER;
    if (!success && reply->type == REDIS_REPLY_ERROR) {
        std::cerr << "[REDIS] HSET " << key << " error: " << reply->str << std::endl;
    }
    freeReplyObject(reply);
    return success;
}

} // namespace Midgard
