// [ECS_AGENT] Enum string mapping and attribute accessors

#include "ecs/CoreTypes.hpp"

namespace Midgard {

const char* toString(Facing facing) {
    switch (facing) {
        case Facing::FRONT: return "front";
        case Facing::BACK:  return "back";
        case Facing::LEFT:  return "left";
        case Facing::RIGHT: return "right";
    }
    return "front";
}

const char* toString(AnimationState state) {
    switch (state) {
        case AnimationState::IDLE:      return "idle";
        case AnimationState::MOVING:    return "moving";
        case AnimationState::ATTACKING: return "attacking";
        case AnimationState::DEAD:      return "dead";
    }
    return "idle";
}

const char* toString(MonsterState state) {
    switch (state) {
        case MonsterState::IDLE:      return "idle";
        case MonsterState::CHASING:   return "chasing";
        case MonsterState::ATTACKING: return "attacking";
    }
    return "idle";
}

const char* toString(AttributeKey key) {
    switch (key) {
        case AttributeKey::STR:  return "STR";
        case AttributeKey::AGI:  return "AGI";
        case AttributeKey::VIT:  return "VIT";
        case AttributeKey::INT:  return "INT";
        case AttributeKey::DEX:  return "DEX";
        case AttributeKey::LUCK: return "LUCK";
    }
    return "STR";
}

const char* toString(DropKind kind) {
    return kind == DropKind::BCOINS ? "bcoins" : "item";
}

std::optional<Facing> parseFacing(std::string_view text) {
    if (text == "front") return Facing::FRONT;
    if (text == "back")  return Facing::BACK;
    if (text == "left")  return Facing::LEFT;
    if (text == "right") return Facing::RIGHT;
    return std::nullopt;
}

std::optional<AnimationState> parseAnimationState(std::string_view text) {
    if (text == "idle")      return AnimationState::IDLE;
    if (text == "moving")    return AnimationState::MOVING;
    if (text == "attacking") return AnimationState::ATTACKING;
    if (text == "dead")      return AnimationState::DEAD;
    return std::nullopt;
}

std::optional<AttributeKey> parseAttributeKey(std::string_view text) {
    for (AttributeKey key : ALL_ATTRIBUTES) {
        if (text == toString(key)) return key;
    }
    return std::nullopt;
}

int Attributes::get(AttributeKey key) const {
    switch (key) {
        case AttributeKey::STR:  return str;
        case AttributeKey::AGI:  return agi;
        case AttributeKey::VIT:  return vit;
        case AttributeKey::INT:  return intel;
        case AttributeKey::DEX:  return dex;
        case AttributeKey::LUCK: return luck;
    }
    return str;
}

int& Attributes::ref(AttributeKey key) {
    switch (key) {
        case AttributeKey::STR:  return str;
        case AttributeKey::AGI:  return agi;
        case AttributeKey::VIT:  return vit;
        case AttributeKey::INT:  return intel;
        case AttributeKey::DEX:  return dex;
        case AttributeKey::LUCK: return luck;
    }
    return str;
}

} // namespace Midgard
