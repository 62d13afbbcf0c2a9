#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// Guesses the languages of a project from source file extensions
class LanguageDetector {
public:
    explicit LanguageDetector(size_t maxLanguages = 5);

    // Walk the project and return distinct language names in discovery order.
    // The walk stops as soon as `maxLanguages` languages are known.
    std::vector<std::string> detect(const fs::path& projectPath) const;

    // Language for a file extension such as ".py", or an empty string
    std::string languageForExtension(const std::string& extension) const;

private:
    size_t maxLanguages_;
    PatternMatcher matcher_;
    std::map<std::string, std::string> extensionLanguages_;
};
