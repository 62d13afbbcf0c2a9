#include "config_loader.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json& overrides, const char* key, T& target) {
    auto it = overrides.find(key);
    if (it != overrides.end()) {
        target = it->get<T>();
    }
}

} // namespace

void applyScoringOverrides(const json& overrides, HealthScoringConfig& config) {
    if (!overrides.is_object()) {
        throw std::runtime_error("\"scoring\" must be an object");
    }

    readField(overrides, "baseline", config.baseline);
    readField(overrides, "minScore", config.minScore);
    readField(overrides, "maxScore", config.maxScore);

    readField(overrides, "uncommittedPenalties", config.uncommittedPenalties);
    readField(overrides, "perChangePenalty", config.perChangePenalty);
    readField(overrides, "maxPerChangePenalty", config.maxPerChangePenalty);
    readField(overrides, "commitAgePenalties", config.commitAgePenalties);
    readField(overrides, "unknownRemoteSyncPenalty", config.unknownRemoteSyncPenalty);

    readField(overrides, "hasDependenciesBonus", config.hasDependenciesBonus);
    readField(overrides, "reasonableDependenciesMin", config.reasonableDependenciesMin);
    readField(overrides, "reasonableDependenciesMax", config.reasonableDependenciesMax);
    readField(overrides, "reasonableDependenciesBonus", config.reasonableDependenciesBonus);
    readField(overrides, "excessiveDependencies", config.excessiveDependencies);
    readField(overrides, "excessiveDependenciesPenalty", config.excessiveDependenciesPenalty);
    readField(overrides, "multiEcosystemBonus", config.multiEcosystemBonus);

    readField(overrides, "openIssuePenalties", config.openIssuePenalties);
    readField(overrides, "activePullRequestsMin", config.activePullRequestsMin);
    readField(overrides, "activePullRequestsMax", config.activePullRequestsMax);
    readField(overrides, "activePullRequestsBonus", config.activePullRequestsBonus);
    readField(overrides, "pullRequestBacklog", config.pullRequestBacklog);
    readField(overrides, "pullRequestBacklogPenalty", config.pullRequestBacklogPenalty);
    readField(overrides, "starBonuses", config.starBonuses);
    readField(overrides, "recentActivityDays", config.recentActivityDays);
    readField(overrides, "recentActivityBonus", config.recentActivityBonus);

    readField(overrides, "readmeBonus", config.readmeBonus);
    readField(overrides, "readmeTierBonus", config.readmeTierBonus);
    readField(overrides, "documentationBonus", config.documentationBonus);
    readField(overrides, "testsBonus", config.testsBonus);
    readField(overrides, "testTierBonus", config.testTierBonus);
    readField(overrides, "ciBonus", config.ciBonus);
    readField(overrides, "qualityToolBonus", config.qualityToolBonus);
    readField(overrides, "maxQualityToolBonus", config.maxQualityToolBonus);
    readField(overrides, "structureBonus", config.structureBonus);

    readField(overrides, "healthyThreshold", config.healthyThreshold);
    readField(overrides, "warningThreshold", config.warningThreshold);

    if (config.minScore > config.maxScore) {
        throw std::runtime_error("scoring.minScore must not exceed scoring.maxScore");
    }
}

void applyQualityOverrides(const json& overrides, QualityConfig& config) {
    if (!overrides.is_object()) {
        throw std::runtime_error("\"quality\" must be an object");
    }

    readField(overrides, "readmeFiles", config.readmeFiles);
    readField(overrides, "readmeTiers", config.readmeTiers);
    readField(overrides, "testDirectories", config.testDirectories);
    readField(overrides, "testFilePatterns", config.testFilePatterns);
    readField(overrides, "maxTestCoverage", config.maxTestCoverage);
    readField(overrides, "ciMarkers", config.ciMarkers);
    readField(overrides, "documentationMarkers", config.documentationMarkers);
    readField(overrides, "qualityToolFiles", config.qualityToolFiles);
    readField(overrides, "structureDirectories", config.structureDirectories);
    readField(overrides, "structureBonusManifests", config.structureBonusManifests);
    readField(overrides, "maxStructureScore", config.maxStructureScore);
}

ScannerConfig configFromJson(const json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Config document must be a JSON object");
    }

    ScannerConfig config;
    auto scoring = document.find("scoring");
    if (scoring != document.end()) {
        applyScoringOverrides(*scoring, config.scoring);
    }
    auto quality = document.find("quality");
    if (quality != document.end()) {
        applyQualityOverrides(*quality, config.quality);
    }
    return config;
}

ScannerConfig loadConfigFile(const fs::path& configPath) {
    std::ifstream file(configPath);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + configPath.string());
    }
    return configFromJson(json::parse(file));
}
