#pragma once

#include "ecs/StateStore.hpp"
#include "zones/MapCatalog.hpp"
#include "zones/AreaOfInterest.hpp"
#include <cstdint>
#include <optional>
#include <string>

// [CHAT_AGENT] Chat routing with per-player, per-channel cooldowns
//   private  target + sender (target must be online)
//   global   every online player
//   town     sender's map, only from a safe zone
//   map      sender's map

namespace Midgard {

enum class ChatOutcome : uint8_t {
    DELIVERED,
    IGNORED,        // empty message, unknown sender, offline private target
    REJECTED,       // chat:error sent
    SPAM_BLOCKED    // chat:spamBlocked sent
};

class ChatSystem {
public:
    ChatSystem(StateStore& store, const MapCatalog& catalog, AreaOfInterestSystem& aoi);

    ChatOutcome send(EntityID sender, const std::string& message, const std::string& channel,
                     const std::optional<std::string>& targetIdentity, uint32_t nowMs);

    // Leading/trailing whitespace removed
    [[nodiscard]] static std::string trim(const std::string& text);

private:
    StateStore& store_;
    const MapCatalog& catalog_;
    AreaOfInterestSystem& aoi_;
};

} // namespace Midgard
