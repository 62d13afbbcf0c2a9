#include "language_detector.hpp"
#include "file_walker.hpp"
#include <algorithm>

LanguageDetector::LanguageDetector(size_t maxLanguages)
    : maxLanguages_(maxLanguages),
      extensionLanguages_{
          {".py", "Python"},
          {".js", "JavaScript"},
          {".ts", "TypeScript"},
          {".go", "Go"},
          {".rs", "Rust"},
          {".java", "Java"},
          {".cpp", "C++"},
          {".c", "C"},
          {".html", "HTML"},
          {".css", "CSS"},
          {".vue", "Vue"},
          {".php", "PHP"},
          {".rb", "Ruby"},
          {".swift", "Swift"},
          {".kt", "Kotlin"},
      } {
}

std::string LanguageDetector::languageForExtension(const std::string& extension) const {
    auto it = extensionLanguages_.find(extension);
    return it == extensionLanguages_.end() ? std::string() : it->second;
}

std::vector<std::string> LanguageDetector::detect(const fs::path& projectPath) const {
    std::vector<std::string> languages;
    if (maxLanguages_ == 0) {
        return languages;
    }

    walkProjectFiles(projectPath, matcher_, [&](const fs::path& relativePath) {
        std::string language = languageForExtension(relativePath.extension().string());
        if (!language.empty() &&
            std::find(languages.begin(), languages.end(), language) == languages.end()) {
            languages.push_back(language);
        }
        return languages.size() < maxLanguages_;
    });

    return languages;
}
