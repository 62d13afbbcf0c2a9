#include "quality_checker.hpp"
#include "file_walker.hpp"
#include "pattern_matcher.hpp"
#include <algorithm>
#include <system_error>

QualityChecker::QualityChecker(const QualityConfig& config)
    : config_(config) {
}

bool QualityChecker::pathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

QualityInfo QualityChecker::check(const fs::path& projectPath) const {
    QualityInfo info;

    try {
        checkReadme(projectPath, info);
        checkTests(projectPath, info);
        checkCi(projectPath, info);
        checkDocumentation(projectPath, info);
        checkQualityTools(projectPath, info);
        checkStructure(projectPath, info);
    } catch (const std::exception&) {
        // Keep whatever was established before the failure
    }

    return info;
}

int QualityChecker::readmeTier(std::uintmax_t size) const {
    for (const auto& [threshold, tier] : config_.readmeTiers) {
        if (size > threshold) {
            return tier;
        }
    }
    return 1;
}

int QualityChecker::coverageTier(int testMatches) const {
    if (testMatches <= 0) {
        return 0;
    }
    return std::min(config_.maxTestCoverage, std::max(1, testMatches / 2));
}

void QualityChecker::checkReadme(const fs::path& projectPath, QualityInfo& info) const {
    for (const auto& readmeFile : config_.readmeFiles) {
        const fs::path readmePath = projectPath / readmeFile;
        if (!pathExists(readmePath)) {
            continue;
        }

        info.hasReadme = true;
        std::error_code ec;
        std::uintmax_t size = fs::file_size(readmePath, ec);
        info.readmeQuality = ec ? 1 : readmeTier(size);
        break;
    }
}

int QualityChecker::countTestMatches(const fs::path& projectPath) const {
    int count = 0;

    for (const auto& dir : config_.testDirectories) {
        if (pathExists(projectPath / dir)) {
            count++;
        }
    }

    const PatternMatcher matcher(config_.testFilePatterns);
    walkProjectFiles(projectPath, matcher, [&](const fs::path& relativePath) {
        count += static_cast<int>(matcher.countIncludeMatches(relativePath));
        return true;
    });

    return count;
}

void QualityChecker::checkTests(const fs::path& projectPath, QualityInfo& info) const {
    int testMatches = countTestMatches(projectPath);
    if (testMatches > 0) {
        info.hasTests = true;
        info.testCoverage = coverageTier(testMatches);
    }
}

void QualityChecker::checkCi(const fs::path& projectPath, QualityInfo& info) const {
    for (const auto& [marker, ciType] : config_.ciMarkers) {
        if (pathExists(projectPath / marker)) {
            info.hasCi = true;
            info.ciType = ciType;
            return;
        }
    }
}

void QualityChecker::checkDocumentation(const fs::path& projectPath, QualityInfo& info) const {
    info.hasDocumentation = std::any_of(
        config_.documentationMarkers.begin(), config_.documentationMarkers.end(),
        [&](const std::string& marker) { return pathExists(projectPath / marker); });
}

void QualityChecker::checkQualityTools(const fs::path& projectPath, QualityInfo& info) const {
    info.qualityTools = static_cast<int>(std::count_if(
        config_.qualityToolFiles.begin(), config_.qualityToolFiles.end(),
        [&](const std::string& file) { return pathExists(projectPath / file); }));
}

void QualityChecker::checkStructure(const fs::path& projectPath, QualityInfo& info) const {
    int score = static_cast<int>(std::count_if(
        config_.structureDirectories.begin(), config_.structureDirectories.end(),
        [&](const std::string& dir) { return pathExists(projectPath / dir); }));

    bool hasManifest = std::any_of(
        config_.structureBonusManifests.begin(), config_.structureBonusManifests.end(),
        [&](const std::string& file) { return pathExists(projectPath / file); });
    if (hasManifest) {
        score++;
    }

    info.structureScore = std::clamp(score, 0, config_.maxStructureScore);
}
