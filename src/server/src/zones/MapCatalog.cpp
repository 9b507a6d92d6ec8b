// [ZONE_AGENT] Map catalog: stock world and JSON loading

#include "zones/MapCatalog.hpp"
#include <fstream>
#include <iostream>

namespace Midgard {

namespace {

glm::vec2 readPoint(const nlohmann::json& j) {
    return glm::vec2(j.at("x").get<float>(), j.at("y").get<float>());
}

} // anonymous namespace

// ============================================================================
// Stock world
// ============================================================================

MapCatalog MapCatalog::defaults() {
    MapCatalog catalog;

    catalog.addMap({"town_1", glm::vec2(1200.0f, 900.0f), true, std::nullopt, false});
    catalog.addMap({"monster_field_1", glm::vec2(400.0f, 400.0f), false, std::nullopt, false});
    catalog.addMap({"pvp_arena", glm::vec2(500.0f, 500.0f), false, 10, true});
    catalog.setDefaultTown("town_1");

    catalog.addMonsterType({"poring",   50.0, 5.0, 1.5f, 150.0f, 40.0f, 1500, 5,  {"potion"}});
    catalog.addMonsterType({"lunatic",  60.0, 8.0, 2.0f, 180.0f, 50.0f, 1300, 8,  {"potion", "coin"}});
    catalog.addMonsterType({"fabre",    45.0, 6.0, 1.8f, 160.0f, 45.0f, 1400, 6,  {"coin"}});
    catalog.addMonsterType({"chonchon", 55.0, 7.0, 2.2f, 200.0f, 60.0f, 1200, 10, {"potion", "coin", "gem"}});

    catalog.addSpawn({"monster_field_1", 20,
                      {"poring", "lunatic", "fabre", "chonchon"},
                      SpawnBounds{100.0f, 2300.0f, 100.0f, 1800.0f}});
    return catalog;
}

// ============================================================================
// JSON loading
// ============================================================================

std::optional<MapCatalog> MapCatalog::fromJson(const nlohmann::json& doc) {
    MapCatalog catalog;
    try {
        for (const auto& m : doc.at("maps")) {
            MapDefinition map;
            map.id = m.at("id").get<std::string>();
            map.spawn = readPoint(m.at("spawn"));
            map.safeZone = m.value("safeZone", false);
            map.pvpEnabled = m.value("pvp", false);
            if (m.contains("minLevel") && !m.at("minLevel").is_null()) {
                map.minLevel = m.at("minLevel").get<int>();
            }
            catalog.addMap(std::move(map));
        }

        if (doc.contains("monsterTypes")) {
            for (const auto& t : doc.at("monsterTypes")) {
                MonsterTypeDef def;
                def.type = t.at("type").get<std::string>();
                def.hp = t.at("hp").get<double>();
                def.attack = t.at("attack").get<double>();
                def.speed = t.at("speed").get<float>();
                def.aggroRadius = t.at("aggro").get<float>();
                def.attackRadius = t.at("attackRange").get<float>();
                def.attackCooldownMs = t.at("cooldown").get<uint32_t>();
                def.xpReward = t.at("xp").get<int>();
                def.lootTable = t.at("loot").get<std::vector<std::string>>();
                catalog.addMonsterType(std::move(def));
            }
        }

        if (doc.contains("spawns")) {
            for (const auto& s : doc.at("spawns")) {
                MonsterSpawnConfig spawn;
                spawn.mapId = s.at("map").get<std::string>();
                spawn.count = s.at("count").get<size_t>();
                spawn.types = s.at("types").get<std::vector<std::string>>();
                const auto& b = s.at("bounds");
                spawn.bounds.minX = b.at("minX").get<float>();
                spawn.bounds.maxX = b.at("maxX").get<float>();
                spawn.bounds.minY = b.at("minY").get<float>();
                spawn.bounds.maxY = b.at("maxY").get<float>();
                catalog.addSpawn(std::move(spawn));
            }
        }

        catalog.setDefaultTown(doc.at("defaultTown").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[MAPS] Malformed map catalog: " << e.what() << std::endl;
        return std::nullopt;
    }

    std::string error;
    if (!catalog.validate(error)) {
        std::cerr << "[MAPS] Invalid map catalog: " << error << std::endl;
        return std::nullopt;
    }
    return catalog;
}

std::optional<MapCatalog> MapCatalog::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[MAPS] Cannot open " << path << std::endl;
        return std::nullopt;
    }

    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        std::cerr << "[MAPS] " << path << " is not valid JSON" << std::endl;
        return std::nullopt;
    }

    auto catalog = fromJson(doc);
    if (catalog) {
        std::cout << "[MAPS] Loaded " << catalog->mapCount() << " maps from " << path << std::endl;
    }
    return catalog;
}

// ============================================================================
// Mutation / lookup
// ============================================================================

void MapCatalog::addMap(MapDefinition map) {
    std::string id = map.id;
    maps_.insert_or_assign(std::move(id), std::move(map));
}

void MapCatalog::addMonsterType(MonsterTypeDef def) {
    std::string type = def.type;
    monsterTypes_.insert_or_assign(std::move(type), std::move(def));
}

void MapCatalog::addSpawn(MonsterSpawnConfig spawn) {
    std::string mapId = spawn.mapId;
    spawns_.insert_or_assign(std::move(mapId), std::move(spawn));
}

const MapDefinition* MapCatalog::findMap(std::string_view mapId) const {
    auto it = maps_.find(mapId);
    return it != maps_.end() ? &it->second : nullptr;
}

const MonsterSpawnConfig* MapCatalog::findSpawn(std::string_view mapId) const {
    auto it = spawns_.find(mapId);
    return it != spawns_.end() ? &it->second : nullptr;
}

const MonsterTypeDef* MapCatalog::findMonsterType(std::string_view type) const {
    auto it = monsterTypes_.find(type);
    return it != monsterTypes_.end() ? &it->second : nullptr;
}

bool MapCatalog::validate(std::string& error) const {
    if (!findMap(defaultTown_)) {
        error = "default town '" + defaultTown_ + "' is not a known map";
        return false;
    }
    for (const auto& [mapId, spawn] : spawns_) {
        if (!findMap(mapId)) {
            error = "spawn references unknown map '" + mapId + "'";
            return false;
        }
        if (spawn.types.empty()) {
            error = "spawn for '" + mapId + "' has no monster types";
            return false;
        }
        for (const auto& type : spawn.types) {
            const MonsterTypeDef* def = findMonsterType(type);
            if (!def) {
                error = "spawn for '" + mapId + "' references unknown type '" + type + "'";
                return false;
            }
            if (def->lootTable.empty()) {
                error = "monster type '" + type + "' has an empty loot table";
                return false;
            }
        }
        if (spawn.bounds.minX > spawn.bounds.maxX || spawn.bounds.minY > spawn.bounds.maxY) {
            error = "spawn bounds for '" + mapId + "' are inverted";
            return false;
        }
    }
    return true;
}

} // namespace Midgard
