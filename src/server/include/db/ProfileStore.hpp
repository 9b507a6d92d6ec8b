#pragma once

#include "ecs/CoreTypes.hpp"
#include <functional>
#include <string>

// [DATABASE_AGENT] External player profile persistence
// Fire-and-forget writes. Completions are delivered on the simulation thread
// from update(), never from inside saveProfile().

namespace Midgard {

// Snapshot of the persisted part of a player
struct PlayerProfile {
    std::string identity;
    Attributes attributes;
    int statPoints{0};
};

class ProfileStore {
public:
    using SaveCallback = std::function<void(bool success)>;

    virtual ~ProfileStore() = default;

    // Queue a write of the profile. callback may be null.
    virtual void saveProfile(const PlayerProfile& profile, SaveCallback callback = nullptr) = 0;

    // Process completed writes - call every tick
    virtual void update() = 0;
};

} // namespace Midgard
