#include "manifest_analyzer.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string();
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

int objectSize(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_object()) {
        return 0;
    }
    return static_cast<int>(it->size());
}

} // namespace

ManifestAnalyzer::ManifestAnalyzer()
    : detectors_{
        {"package.json", &ManifestAnalyzer::parsePackageJson},
        {"requirements.txt", &ManifestAnalyzer::parseRequirementsTxt},
        {"pyproject.toml", &ManifestAnalyzer::parsePyprojectToml},
        {"go.mod", &ManifestAnalyzer::parseGoMod},
    } {
}

DependencyInfo ManifestAnalyzer::analyze(const fs::path& projectPath) const {
    DependencyInfo info;

    for (const auto& detector : detectors_) {
        const fs::path manifestPath = projectPath / detector.fileName;

        std::optional<ManifestCount> result;
        try {
            if (!fs::exists(manifestPath)) {
                continue;
            }
            result = detector.parse(readFile(manifestPath));
        } catch (const std::exception&) {
            // Broken manifests only drop their own ecosystem
            continue;
        }

        if (!result) {
            continue;
        }

        info.hasDependencies = true;
        info.ecosystemLanguages.push_back(result->language);
        info.counts[result->ecosystem] = result->count;
        info.details.push_back(result->detail);
    }

    return info;
}

std::string ManifestAnalyzer::readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<ManifestCount> ManifestAnalyzer::parsePackageJson(const std::string& content) {
    json data = json::parse(content);
    if (!data.is_object()) {
        return std::nullopt;
    }

    int deps = objectSize(data, "dependencies");
    int devDeps = objectSize(data, "devDependencies");

    ManifestCount result;
    result.ecosystem = "npm";
    result.language = "Node.js";
    result.count = deps + devDeps;
    result.detail = "npm: " + std::to_string(deps) + " deps, " + std::to_string(devDeps) + " dev deps";
    return result;
}

std::optional<ManifestCount> ManifestAnalyzer::parseRequirementsTxt(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    int count = 0;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty() && line[0] != '#') {
            ++count;
        }
    }

    ManifestCount result;
    result.ecosystem = "pip";
    result.language = "Python";
    result.count = count;
    result.detail = "pip: " + std::to_string(count) + " requirements";
    return result;
}

std::optional<ManifestCount> ManifestAnalyzer::parsePyprojectToml(const std::string& content) {
    static const std::string mainSection = "[tool.poetry.dependencies]";
    static const std::string groupPrefix = "[tool.poetry.group.";
    static const std::string inlineMarker = "dependencies = [";

    bool inMainDeps = false;
    bool inGroupDeps = false;
    int deps = 0;
    int devDeps = 0;

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);

        if (line == mainSection) {
            inMainDeps = true;
            inGroupDeps = false;
        } else if (startsWith(line, groupPrefix) && line.find("dependencies]") != std::string::npos) {
            inGroupDeps = true;
            inMainDeps = false;
        } else if (startsWith(line, "[")) {
            inMainDeps = false;
            inGroupDeps = false;
        } else if (line.empty() || line[0] == '#' || line.find('=') == std::string::npos) {
            continue;
        } else if (inMainDeps) {
            // The interpreter pin is not a dependency
            if (!startsWith(line, "python")) {
                ++deps;
            }
        } else if (inGroupDeps) {
            ++devDeps;
        }
    }

    // PEP 621 style: dependencies = ["a>=1", "b"]; estimate by counting quotes
    if (deps == 0) {
        auto start = content.find(inlineMarker);
        if (start != std::string::npos) {
            auto end = content.find(']', start);
            std::string list = content.substr(start, end == std::string::npos ? std::string::npos : end - start);
            deps = static_cast<int>(std::count(list.begin(), list.end(), '"')) / 2;
        }
    }

    if (deps == 0 && devDeps == 0) {
        return std::nullopt;
    }

    ManifestCount result;
    result.ecosystem = "poetry";
    result.language = "Python";
    result.count = deps + devDeps;
    result.detail = "poetry: " + std::to_string(deps) + " deps";
    if (devDeps > 0) {
        result.detail += ", " + std::to_string(devDeps) + " dev deps";
    }
    return result;
}

std::optional<ManifestCount> ManifestAnalyzer::parseGoMod(const std::string& content) {
    std::istringstream stream(content);
    std::string line;
    int count = 0;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || startsWith(line, "module") || startsWith(line, "go")) {
            continue;
        }
        ++count;
    }

    ManifestCount result;
    result.ecosystem = "go";
    result.language = "Go";
    result.count = count;
    result.detail = "go: " + std::to_string(count) + " modules";
    return result;
}
