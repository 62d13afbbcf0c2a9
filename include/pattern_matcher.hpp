#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Glob matching for project-relative paths.
// Patterns without a '/' are matched against the file name only, patterns with one
// against the whole relative path ("**/" spans any number of directories).
class PatternMatcher {
public:
    // Default constructor ignores version control and vendored package directories
    PatternMatcher();

    // Constructor with include patterns
    explicit PatternMatcher(const std::vector<std::string>& includePatterns);

    // Add a new ignore pattern
    void addIgnorePattern(const std::string& pattern);

    // Add an include pattern
    void addIncludePattern(const std::string& pattern);

    // Check if a relative path matches any ignore pattern
    bool isIgnored(const fs::path& relativePath) const;

    // Check if a relative directory path is ignored (so its contents can be pruned)
    bool isIgnoredDirectory(const fs::path& relativePath) const;

    // Check if a relative path matches any include pattern
    bool isIncluded(const fs::path& relativePath) const;

    // Number of include patterns the path matches
    size_t countIncludeMatches(const fs::path& relativePath) const;

    const std::vector<std::string>& includePatterns() const { return includePatterns_; }

private:
    std::vector<std::string> ignorePatterns_;
    std::vector<std::regex> ignoreRegexes_;
    std::vector<std::string> includePatterns_;
    std::vector<std::regex> includeRegexes_;

    // Helper methods
    std::regex patternToRegex(const std::string& pattern) const;
    static bool matchesPattern(const std::string& pattern, const std::regex& regex,
                               const fs::path& relativePath);
};
