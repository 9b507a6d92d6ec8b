#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// [ZONE_AGENT] Simulation clock scheduler
// Periodic tasks: fixed interval, fire at most once per advance() (no
// catch-up bursts after a stall).
// Delayed tasks: one-shot, keyed by (kind, entity id), fire in due order,
// FIFO among equal due times. Callbacks get the entity id only and must look
// the entity up again.

namespace Midgard {

enum class TaskKind : uint8_t {
    MONSTER_RESPAWN,
    MONSTER_ATTACK_RESET,
    PLAYER_REVIVE
};

struct TaskKey {
    TaskKind kind{TaskKind::MONSTER_RESPAWN};
    std::string entityId;

    bool operator<(const TaskKey& other) const {
        return std::tie(kind, entityId) < std::tie(other.kind, other.entityId);
    }
    bool operator==(const TaskKey& other) const {
        return kind == other.kind && entityId == other.entityId;
    }
};

class Scheduler {
public:
    using PeriodicCallback = std::function<void(uint32_t nowMs)>;
    using DelayedCallback = std::function<void(const std::string& entityId, uint32_t nowMs)>;

    // First run happens once intervalMs has elapsed after startMs
    void addPeriodic(std::string name, uint32_t intervalMs, PeriodicCallback callback,
                     uint32_t startMs = 0);

    // Schedules callback at dueMs. A pending task with the same key is replaced.
    void scheduleAt(TaskKey key, uint32_t dueMs, DelayedCallback callback);

    bool cancel(const TaskKey& key);

    // Drops every pending task for entityId. Returns the number removed.
    size_t cancelAllFor(const std::string& entityId);

    [[nodiscard]] bool isPending(const TaskKey& key) const;
    [[nodiscard]] size_t pendingCount() const { return delayed_.size(); }
    [[nodiscard]] size_t periodicCount() const { return periodic_.size(); }

    // Runs due delayed tasks (in due order), then due periodic tasks
    // (in registration order)
    void advance(uint32_t nowMs);

private:
    struct PeriodicTask {
        std::string name;
        uint32_t intervalMs{0};
        uint32_t lastRunMs{0};
        PeriodicCallback callback;
    };

    struct DelayedTask {
        TaskKey key;
        DelayedCallback callback;
    };

    // (dueMs, sequence) keeps equal due times in submission order
    using Slot = std::pair<uint32_t, uint64_t>;

    std::vector<PeriodicTask> periodic_;
    std::map<Slot, DelayedTask> delayed_;
    std::map<TaskKey, Slot> slotsByKey_;
    uint64_t nextSequence_{0};
};

} // namespace Midgard
