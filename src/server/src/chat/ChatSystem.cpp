// [CHAT_AGENT] Chat routing implementation

#include "chat/ChatSystem.hpp"
#include "netcode/Events.hpp"
#include "Constants.hpp"
#include <iostream>

namespace Midgard {

namespace {

constexpr const char* CHANNEL_PRIVATE = "private";
constexpr const char* CHANNEL_GLOBAL = "global";
constexpr const char* CHANNEL_TOWN = "town";
constexpr const char* CHANNEL_MAP = "map";

bool isKnownChannel(const std::string& channel) {
    return channel == CHANNEL_PRIVATE || channel == CHANNEL_GLOBAL ||
           channel == CHANNEL_TOWN || channel == CHANNEL_MAP;
}

} // anonymous namespace

ChatSystem::ChatSystem(StateStore& store, const MapCatalog& catalog, AreaOfInterestSystem& aoi)
    : store_(store), catalog_(catalog), aoi_(aoi) {}

std::string ChatSystem::trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

ChatOutcome ChatSystem::send(EntityID sender, const std::string& message,
                             const std::string& channel,
                             const std::optional<std::string>& targetIdentity,
                             uint32_t nowMs) {
    Registry& registry = store_.registry();
    if (!registry.valid(sender) || !registry.all_of<PlayerTag>(sender)) {
        return ChatOutcome::IGNORED;
    }

    const std::string text = trim(message);
    if (text.size() > Constants::CHAT_MAX_LENGTH) {
        aoi_.sendTo(sender, Events::CHAT_ERROR,
                    Events::message("Message is too long (max " +
                                    std::to_string(Constants::CHAT_MAX_LENGTH) + " characters)."));
        return ChatOutcome::REJECTED;
    }
    if (text.empty()) {
        return ChatOutcome::IGNORED;
    }

    if (!isKnownChannel(channel)) {
        aoi_.sendTo(sender, Events::CHAT_ERROR, Events::message("Invalid chat type."));
        return ChatOutcome::REJECTED;
    }

    const Transform& transform = registry.get<Transform>(sender);
    if (channel == CHANNEL_TOWN) {
        const MapDefinition* map = catalog_.findMap(transform.mapId);
        if (!map || !map->safeZone) {
            aoi_.sendTo(sender, Events::CHAT_ERROR, Events::message("You are not in a town map."));
            return ChatOutcome::REJECTED;
        }
    }

    EntityID target = entt::null;
    if (channel == CHANNEL_PRIVATE) {
        if (!targetIdentity) {
            return ChatOutcome::IGNORED;
        }
        target = store_.findPlayer(*targetIdentity);
        if (target == entt::null || !registry.get<PlayerInfo>(target).online) {
            return ChatOutcome::IGNORED;
        }
    }

    ActionTimers& timers = registry.get<ActionTimers>(sender);
    auto last = timers.lastChatMs.find(channel);
    if (last != timers.lastChatMs.end() && nowMs - last->second < Constants::CHAT_COOLDOWN_MS) {
        std::cout << "[CHAT] " << registry.get<PlayerInfo>(sender).identity
                  << " blocked on " << channel << " channel" << std::endl;
        aoi_.sendTo(sender, Events::CHAT_SPAM_BLOCKED,
                    Events::message("You are sending " + channel +
                                    " messages too quickly. Please wait a moment."));
        return ChatOutcome::SPAM_BLOCKED;
    }
    timers.lastChatMs[channel] = nowMs;

    const nlohmann::json payload =
        Events::chatMessage(registry.get<PlayerInfo>(sender), text, channel, nowMs);

    if (channel == CHANNEL_PRIVATE) {
        aoi_.sendTo(target, Events::CHAT_MESSAGE, payload);
        if (target != sender) {
            aoi_.sendTo(sender, Events::CHAT_MESSAGE, payload);
        }
    } else if (channel == CHANNEL_GLOBAL) {
        aoi_.broadcastToAll(Events::CHAT_MESSAGE, payload);
    } else {
        aoi_.broadcastToMap(transform.mapId, Events::CHAT_MESSAGE, payload);
    }
    return ChatOutcome::DELIVERED;
}

} // namespace Midgard
