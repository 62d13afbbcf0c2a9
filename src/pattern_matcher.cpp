#include "pattern_matcher.hpp"

PatternMatcher::PatternMatcher() {
    addIgnorePattern(".git/**");
    addIgnorePattern("**/node_modules/**");
}

PatternMatcher::PatternMatcher(const std::vector<std::string>& includePatterns)
    : PatternMatcher() {

    for (const auto& pattern : includePatterns) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    ignorePatterns_.push_back(pattern);
    ignoreRegexes_.push_back(patternToRegex(pattern));
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    includePatterns_.push_back(pattern);
    includeRegexes_.push_back(patternToRegex(pattern));
}

bool PatternMatcher::matchesPattern(const std::string& pattern, const std::regex& regex,
                                    const fs::path& relativePath) {
    // Bare patterns such as "test_*.py" apply to the file name at any depth
    if (pattern.find('/') == std::string::npos) {
        return std::regex_match(relativePath.filename().string(), regex);
    }
    return std::regex_match(relativePath.generic_string(), regex);
}

bool PatternMatcher::isIgnored(const fs::path& relativePath) const {
    for (size_t i = 0; i < ignorePatterns_.size(); ++i) {
        if (matchesPattern(ignorePatterns_[i], ignoreRegexes_[i], relativePath)) {
            return true;
        }
    }
    return false;
}

bool PatternMatcher::isIgnoredDirectory(const fs::path& relativePath) const {
    // "dir/**" patterns match everything below the directory, including "dir/"
    const std::string dirStr = relativePath.generic_string() + "/";
    for (size_t i = 0; i < ignorePatterns_.size(); ++i) {
        const auto& pattern = ignorePatterns_[i];
        if (pattern.find('/') == std::string::npos) {
            if (std::regex_match(relativePath.filename().string(), ignoreRegexes_[i])) {
                return true;
            }
        } else if (std::regex_match(dirStr, ignoreRegexes_[i])) {
            return true;
        }
    }
    return false;
}

bool PatternMatcher::isIncluded(const fs::path& relativePath) const {
    return countIncludeMatches(relativePath) > 0;
}

size_t PatternMatcher::countIncludeMatches(const fs::path& relativePath) const {
    size_t count = 0;
    for (size_t i = 0; i < includePatterns_.size(); ++i) {
        if (matchesPattern(includePatterns_[i], includeRegexes_[i], relativePath)) {
            ++count;
        }
    }
    return count;
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern) const {
    std::string regexStr;

    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];

        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    // **/ matches any directory depth, including none
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    // Trailing ** matches anything
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (c == '.' || c == '(' || c == ')' || c == '[' || c == ']' || c == '{' ||
                   c == '}' || c == '+' || c == '^' || c == '$' || c == '|' || c == '\\') {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }

    return std::regex(regexStr);
}
