#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "health_scorer.hpp"
#include "quality_checker.hpp"

namespace fs = std::filesystem;

// Tunable constants of the scanner, read from an optional JSON file:
//
//   { "scoring": { "ciBonus": 0.8, "commitAgePenalties": [[365, -4.0], [30, -1.0]] },
//     "quality": { "readmeFiles": ["README.md", "README.adoc"] } }
//
// Keys mirror the member names of HealthScoringConfig and QualityConfig.
struct ScannerConfig {
    HealthScoringConfig scoring;
    QualityConfig quality;
};

// Overwrite the fields present in `overrides`; unknown keys are ignored.
// Throws nlohmann::json::exception when a value has the wrong type.
void applyScoringOverrides(const nlohmann::json& overrides, HealthScoringConfig& config);
void applyQualityOverrides(const nlohmann::json& overrides, QualityConfig& config);

// Defaults merged with the "scoring" and "quality" sections of `document`
ScannerConfig configFromJson(const nlohmann::json& document);

// Load and merge a JSON config file. Throws std::runtime_error when the file
// cannot be read and nlohmann::json::exception when it is malformed.
ScannerConfig loadConfigFile(const fs::path& configPath);
