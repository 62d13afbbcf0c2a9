#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config_loader.hpp"
#include "test_helpers.hpp"

using Catch::Approx;
using json = nlohmann::json;

TEST_CASE("Empty config keeps the defaults", "[ConfigLoader]") {
    auto config = configFromJson(json::object());
    HealthScoringConfig defaults;

    REQUIRE(config.scoring.baseline == Approx(defaults.baseline));
    REQUIRE(config.scoring.ciBonus == Approx(defaults.ciBonus));
    REQUIRE(config.scoring.commitAgePenalties == defaults.commitAgePenalties);
    REQUIRE(config.quality.readmeFiles == QualityConfig().readmeFiles);
}

TEST_CASE("Scoring overrides replace individual fields", "[ConfigLoader]") {
    auto config = configFromJson(json::parse(R"({
        "scoring": {
            "ciBonus": 1.0,
            "recentActivityDays": 14,
            "commitAgePenalties": [[365, -5.0], [30, -1.0]],
            "unknownKey": "ignored"
        }
    })"));

    REQUIRE(config.scoring.ciBonus == Approx(1.0));
    REQUIRE(config.scoring.recentActivityDays == 14);
    REQUIRE(config.scoring.commitAgePenalties.size() == 2);
    REQUIRE(config.scoring.commitAgePenalties[0].first == 365);
    REQUIRE(config.scoring.commitAgePenalties[0].second == Approx(-5.0));
    REQUIRE(config.scoring.commitAgePenalties[1].first == 30);
    REQUIRE(config.scoring.testsBonus == Approx(HealthScoringConfig().testsBonus));
}

TEST_CASE("Quality overrides replace marker lists", "[ConfigLoader]") {
    auto config = configFromJson(json::parse(R"({
        "quality": {
            "readmeFiles": ["README.adoc"],
            "ciMarkers": [[".woodpecker.yml", "Woodpecker"]],
            "maxStructureScore": 3
        }
    })"));

    REQUIRE(config.quality.readmeFiles == std::vector<std::string>{"README.adoc"});
    REQUIRE(config.quality.ciMarkers.size() == 1);
    REQUIRE(config.quality.ciMarkers[0].second == "Woodpecker");
    REQUIRE(config.quality.maxStructureScore == 3);
    REQUIRE(config.quality.testDirectories == QualityConfig().testDirectories);
}

TEST_CASE("Invalid config values are rejected", "[ConfigLoader]") {
    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(configFromJson(json::parse(R"({"scoring": {"ciBonus": "high"}})")),
                          json::exception);
    }

    SECTION("Section is not an object") {
        REQUIRE_THROWS_AS(configFromJson(json::parse(R"({"scoring": [1, 2]})")), std::runtime_error);
    }

    SECTION("Document is not an object") {
        REQUIRE_THROWS_AS(configFromJson(json::parse("[]")), std::runtime_error);
    }

    SECTION("Inverted score bounds") {
        REQUIRE_THROWS_AS(configFromJson(json::parse(R"({"scoring": {"minScore": 8, "maxScore": 2}})")),
                          std::runtime_error);
    }
}

TEST_CASE("Config files are loaded from disk", "[ConfigLoader]") {
    TempDir temp;

    SECTION("Valid file") {
        createTestFile(temp.path() / "repohealth.json", R"({"scoring": {"healthyThreshold": 9}})");
        auto config = loadConfigFile(temp.path() / "repohealth.json");
        REQUIRE(config.scoring.healthyThreshold == Approx(9.0));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(loadConfigFile(temp.path() / "missing.json"), std::runtime_error);
    }

    SECTION("Malformed file") {
        createTestFile(temp.path() / "broken.json", "{ \"scoring\": ");
        REQUIRE_THROWS_AS(loadConfigFile(temp.path() / "broken.json"), json::parse_error);
    }
}
