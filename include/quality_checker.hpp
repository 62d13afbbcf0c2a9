#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <filesystem>
#include "project_record.hpp"

namespace fs = std::filesystem;

// Marker lists and thresholds for the project quality heuristics
struct QualityConfig {
    // README candidates, first existing file wins
    std::vector<std::string> readmeFiles = {
        "README.md", "README.rst", "README.txt", "readme.md"
    };

    // (minimum size exceeded in bytes, tier), checked in order; smaller READMEs get tier 1
    std::vector<std::pair<std::uintmax_t, int>> readmeTiers = {
        {2000, 5}, {1000, 4}, {500, 3}, {200, 2}
    };

    // Each existing directory counts as one test match
    std::vector<std::string> testDirectories = {
        "test", "tests", "__tests__", "spec"
    };

    // Matched against file names anywhere in the project; every pattern hit counts
    std::vector<std::string> testFilePatterns = {
        "*_test.py", "*.test.js", "*_test.js", "*_spec.py", "*.spec.js", "test_*.py", "test*.py"
    };

    int maxTestCoverage = 5;

    // (marker path, CI system) in priority order; the first existing marker wins
    std::vector<std::pair<std::string, std::string>> ciMarkers = {
        {".github/workflows", "GitHub Actions"},
        {".gitlab-ci.yml", "GitLab CI"},
        {".travis.yml", "Travis CI"},
        {"azure-pipelines.yml", "Azure Pipelines"},
        {"Jenkinsfile", "Other CI"},
        {"circle.yml", "Other CI"},
        {".circleci", "Other CI"}
    };

    std::vector<std::string> documentationMarkers = {
        "docs", "doc", "documentation", "wiki", "sphinx", "mkdocs.yml", "docusaurus.config.js"
    };

    std::vector<std::string> qualityToolFiles = {
        ".eslintrc", ".eslintrc.js", ".eslintrc.json",
        ".flake8", "setup.cfg", ".pylintrc",
        ".prettierrc", ".prettierrc.js", ".prettierrc.json",
        ".pre-commit-config.yaml",
        "mypy.ini", "pyproject.toml",
        ".editorconfig"
    };

    std::vector<std::string> structureDirectories = {
        "src", "lib", "app", "components", "utils", "config"
    };

    // One bonus structure point when any of these manifests exists
    std::vector<std::string> structureBonusManifests = {
        "package.json", "pyproject.toml"
    };

    int maxStructureScore = 5;
};

// Best-effort checks for documentation, tests, CI, tooling and layout.
// Nothing here throws: unreadable files and directories count as absent.
class QualityChecker {
public:
    explicit QualityChecker(const QualityConfig& config = QualityConfig());

    QualityInfo check(const fs::path& projectPath) const;

    // README tier for a file of `size` bytes (1-5)
    int readmeTier(std::uintmax_t size) const;

    // Coverage estimate from the number of test matches (0 when none, else 1-5)
    int coverageTier(int testMatches) const;

    // Directory markers plus file pattern hits
    int countTestMatches(const fs::path& projectPath) const;

    const QualityConfig& getConfig() const { return config_; }

private:
    QualityConfig config_;

    void checkReadme(const fs::path& projectPath, QualityInfo& info) const;
    void checkTests(const fs::path& projectPath, QualityInfo& info) const;
    void checkCi(const fs::path& projectPath, QualityInfo& info) const;
    void checkDocumentation(const fs::path& projectPath, QualityInfo& info) const;
    void checkQualityTools(const fs::path& projectPath, QualityInfo& info) const;
    void checkStructure(const fs::path& projectPath, QualityInfo& info) const;

    static bool pathExists(const fs::path& path);
};
