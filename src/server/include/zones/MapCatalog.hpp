#pragma once

#include <nlohmann/json.hpp>
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// [ZONE_AGENT] Static world configuration: maps, monster spawns and
// monster type table. Read-only once the server is running.

namespace Midgard {

// Definition of a single map
struct MapDefinition {
    std::string id;
    glm::vec2 spawn{0.0f, 0.0f};
    bool safeZone{false};
    std::optional<int> minLevel;  // entry gate
    bool pvpEnabled{false};
};

struct SpawnBounds {
    float minX{0.0f};
    float maxX{0.0f};
    float minY{0.0f};
    float maxY{0.0f};

    [[nodiscard]] bool contains(const glm::vec2& p) const {
        return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
    }
};

// Per-map monster population cap and candidate types
struct MonsterSpawnConfig {
    std::string mapId;
    size_t count{0};
    std::vector<std::string> types;
    SpawnBounds bounds;
};

// Static stats for one monster type
struct MonsterTypeDef {
    std::string type;
    double hp{0.0};
    double attack{0.0};
    float speed{0.0f};          // world units per AI tick
    float aggroRadius{0.0f};
    float attackRadius{0.0f};
    uint32_t attackCooldownMs{0};
    int xpReward{0};
    std::vector<std::string> lootTable;
};

// [ZONE_AGENT] Lookup table for all static world configuration
class MapCatalog {
public:
    // The stock world: town_1, monster_field_1, pvp_arena
    static MapCatalog defaults();

    // Parses a catalog document. Returns nullopt (and logs) on malformed input.
    static std::optional<MapCatalog> fromJson(const nlohmann::json& doc);

    // Reads and parses a JSON file
    static std::optional<MapCatalog> loadFromFile(const std::string& path);

    void addMap(MapDefinition map);
    void addMonsterType(MonsterTypeDef def);
    void addSpawn(MonsterSpawnConfig spawn);
    void setDefaultTown(std::string mapId) { defaultTown_ = std::move(mapId); }

    [[nodiscard]] const MapDefinition* findMap(std::string_view mapId) const;
    [[nodiscard]] const MonsterSpawnConfig* findSpawn(std::string_view mapId) const;
    [[nodiscard]] const MonsterTypeDef* findMonsterType(std::string_view type) const;

    [[nodiscard]] const std::string& defaultTown() const { return defaultTown_; }
    [[nodiscard]] size_t mapCount() const { return maps_.size(); }

    // Cross-reference check: default town exists, spawns name known maps/types
    [[nodiscard]] bool validate(std::string& error) const;

private:
    std::map<std::string, MapDefinition, std::less<>> maps_;
    std::map<std::string, MonsterTypeDef, std::less<>> monsterTypes_;
    std::map<std::string, MonsterSpawnConfig, std::less<>> spawns_;
    std::string defaultTown_;
};

} // namespace Midgard
