// [ZONE_AGENT] Scheduler implementation

#include "sim/Scheduler.hpp"

namespace Midgard {

void Scheduler::addPeriodic(std::string name, uint32_t intervalMs, PeriodicCallback callback,
                            uint32_t startMs) {
    periodic_.push_back(PeriodicTask{std::move(name), intervalMs, startMs, std::move(callback)});
}

void Scheduler::scheduleAt(TaskKey key, uint32_t dueMs, DelayedCallback callback) {
    cancel(key);

    Slot slot{dueMs, nextSequence_++};
    slotsByKey_.emplace(key, slot);
    delayed_.emplace(slot, DelayedTask{std::move(key), std::move(callback)});
}

bool Scheduler::cancel(const TaskKey& key) {
    auto it = slotsByKey_.find(key);
    if (it == slotsByKey_.end()) {
        return false;
    }
    delayed_.erase(it->second);
    slotsByKey_.erase(it);
    return true;
}

size_t Scheduler::cancelAllFor(const std::string& entityId) {
    size_t removed = 0;
    for (auto it = slotsByKey_.begin(); it != slotsByKey_.end();) {
        if (it->first.entityId == entityId) {
            delayed_.erase(it->second);
            it = slotsByKey_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool Scheduler::isPending(const TaskKey& key) const {
    return slotsByKey_.count(key) > 0;
}

void Scheduler::advance(uint32_t nowMs) {
    // Delayed tasks. A callback may schedule or cancel others, so re-read the
    // head of the queue every iteration.
    while (!delayed_.empty()) {
        auto it = delayed_.begin();
        if (it->first.first > nowMs) break;

        DelayedTask task = std::move(it->second);
        slotsByKey_.erase(task.key);
        delayed_.erase(it);

        if (task.callback) {
            task.callback(task.key.entityId, nowMs);
        }
    }

    for (auto& task : periodic_) {
        // Wrap-safe elapsed check
        if (nowMs - task.lastRunMs < task.intervalMs) continue;
        task.lastRunMs = nowMs;
        if (task.callback) {
            task.callback(nowMs);
        }
    }
}

} // namespace Midgard
