// [ZONE_AGENT] Map catalog unit tests

#include <catch2/catch_test_macros.hpp>
#include "zones/MapCatalog.hpp"
#include <nlohmann/json.hpp>
#include <string>

using namespace Midgard;

namespace {

nlohmann::json sampleCatalog() {
    return nlohmann::json::parse(R"({
        "defaultTown": "hub",
        "maps": [
            {"id": "hub", "spawn": {"x": 10, "y": 20}, "safeZone": true},
            {"id": "woods", "spawn": {"x": 0, "y": 0}},
            {"id": "ring", "spawn": {"x": 5, "y": 5}, "pvp": true, "minLevel": 15}
        ],
        "monsterTypes": [
            {"type": "wolf", "hp": 80, "attack": 9, "speed": 2.5, "aggro": 170,
             "attackRange": 45, "cooldown": 1100, "xp": 12, "loot": ["pelt"]}
        ],
        "spawns": [
            {"map": "woods", "count": 4, "types": ["wolf"],
             "bounds": {"minX": 0, "maxX": 100, "minY": 0, "maxY": 100}}
        ]
    })");
}

} // anonymous namespace

TEST_CASE("Stock catalog", "[maps]") {
    MapCatalog catalog = MapCatalog::defaults();
    std::string error;

    REQUIRE(catalog.validate(error));
    REQUIRE(catalog.defaultTown() == "town_1");
    REQUIRE(catalog.mapCount() == 3);

    const MapDefinition* town = catalog.findMap("town_1");
    REQUIRE(town != nullptr);
    REQUIRE(town->safeZone);
    REQUIRE_FALSE(town->pvpEnabled);

    const MapDefinition* arena = catalog.findMap("pvp_arena");
    REQUIRE(arena != nullptr);
    REQUIRE(arena->pvpEnabled);
    REQUIRE(arena->minLevel.has_value());
    REQUIRE(*arena->minLevel == 10);

    const MonsterSpawnConfig* spawn = catalog.findSpawn("monster_field_1");
    REQUIRE(spawn != nullptr);
    REQUIRE(spawn->count == 20);
    REQUIRE(spawn->types.size() == 4);

    REQUIRE(catalog.findMonsterType("poring") != nullptr);
    REQUIRE(catalog.findMap("nowhere") == nullptr);
}

TEST_CASE("Catalog from JSON", "[maps]") {
    SECTION("Well-formed document") {
        auto catalog = MapCatalog::fromJson(sampleCatalog());

        REQUIRE(catalog.has_value());
        REQUIRE(catalog->defaultTown() == "hub");
        REQUIRE(catalog->findMap("hub")->spawn.y == 20.0f);
        REQUIRE(*catalog->findMap("ring")->minLevel == 15);
        REQUIRE_FALSE(catalog->findMap("woods")->minLevel.has_value());
        REQUIRE(catalog->findMonsterType("wolf")->attackCooldownMs == 1100);
        REQUIRE(catalog->findSpawn("woods")->bounds.contains({50.0f, 50.0f}));
    }

    SECTION("Missing required field") {
        nlohmann::json doc = sampleCatalog();
        doc.erase("defaultTown");
        REQUIRE_FALSE(MapCatalog::fromJson(doc).has_value());
    }

    SECTION("Wrong field type") {
        nlohmann::json doc = sampleCatalog();
        doc["maps"][0]["spawn"]["x"] = "ten";
        REQUIRE_FALSE(MapCatalog::fromJson(doc).has_value());
    }

    SECTION("Spawn naming an unknown monster type") {
        nlohmann::json doc = sampleCatalog();
        doc["spawns"][0]["types"] = nlohmann::json::array({"dragon"});
        REQUIRE_FALSE(MapCatalog::fromJson(doc).has_value());
    }

    SECTION("Default town that is not a map") {
        nlohmann::json doc = sampleCatalog();
        doc["defaultTown"] = "atlantis";
        REQUIRE_FALSE(MapCatalog::fromJson(doc).has_value());
    }
}

TEST_CASE("Catalog validation", "[maps]") {
    MapCatalog catalog;
    catalog.addMap({"town", glm::vec2(0.0f, 0.0f), true, std::nullopt, false});
    catalog.setDefaultTown("town");
    std::string error;

    SECTION("Minimal catalog is valid") {
        REQUIRE(catalog.validate(error));
    }

    SECTION("Inverted spawn bounds") {
        catalog.addMonsterType({"bat", 10.0, 1.0, 1.0f, 100.0f, 20.0f, 1000, 1, {"wing"}});
        catalog.addSpawn({"town", 2, {"bat"}, SpawnBounds{50.0f, 10.0f, 0.0f, 10.0f}});

        REQUIRE_FALSE(catalog.validate(error));
        REQUIRE(error.find("inverted") != std::string::npos);
    }

    SECTION("Empty loot table") {
        catalog.addMonsterType({"bat", 10.0, 1.0, 1.0f, 100.0f, 20.0f, 1000, 1, {}});
        catalog.addSpawn({"town", 2, {"bat"}, SpawnBounds{0.0f, 10.0f, 0.0f, 10.0f}});

        REQUIRE_FALSE(catalog.validate(error));
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(MapCatalog::loadFromFile("/nonexistent/maps.json").has_value());
    }
}
