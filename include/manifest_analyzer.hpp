#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include "project_record.hpp"

namespace fs = std::filesystem;

// Dependency count extracted from one manifest file
struct ManifestCount {
    std::string ecosystem;   // Key in DependencyInfo::counts ("npm", "pip", "poetry", "go")
    std::string language;    // Toolchain language reported for the ecosystem
    int count = 0;
    std::string detail;      // Human-readable "npm: 3 deps, 1 dev deps"
};

// Detects dependency manifests in a project root. Every detector runs independently,
// so a project can report several ecosystems at once.
class ManifestAnalyzer {
public:
    using Parser = std::function<std::optional<ManifestCount>(const std::string&)>;

    struct Detector {
        std::string fileName;
        Parser parse;
    };

    ManifestAnalyzer();

    // Run every detector against `projectPath`. A manifest that cannot be read or
    // parsed is left out of the result; this never throws.
    DependencyInfo analyze(const fs::path& projectPath) const;

    // package.json: entries under "dependencies" plus "devDependencies"
    static std::optional<ManifestCount> parsePackageJson(const std::string& content);

    // requirements.txt: non-empty lines that are not comments
    static std::optional<ManifestCount> parseRequirementsTxt(const std::string& content);

    // pyproject.toml: Poetry dependency sections, or an inline PEP 621 list
    static std::optional<ManifestCount> parsePyprojectToml(const std::string& content);

    // go.mod: lines other than blanks and the module/go directives
    static std::optional<ManifestCount> parseGoMod(const std::string& content);

    const std::vector<Detector>& detectors() const { return detectors_; }

private:
    std::vector<Detector> detectors_;

    static std::string readFile(const fs::path& filePath);
};
