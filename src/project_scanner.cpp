#include "project_scanner.hpp"
#include "report_writer.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace {

fs::path normalizeRoot(const fs::path& root) {
    fs::path normalized = fs::absolute(root).lexically_normal();
    if (!normalized.has_filename() && normalized.has_parent_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

} // namespace

ProjectAnalyzer::ProjectAnalyzer(const CommandRunner& runner,
                                 const GitHubClient* github,
                                 const ScannerConfig& config)
    : vcsInspector_(runner),
      qualityChecker_(config.quality),
      scorer_(config.scoring),
      github_(github),
      clock_([] { return std::chrono::system_clock::now(); }) {
}

bool ProjectAnalyzer::isRepository(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path / ".git", ec);
}

std::optional<ProjectRecord> ProjectAnalyzer::analyze(const fs::path& projectPath) const {
    if (!isRepository(projectPath)) {
        return std::nullopt;
    }

    auto vcs = vcsInspector_.inspect(projectPath);
    if (!vcs) {
        if (verbose_) {
            std::cerr << "Warning: could not read git state of " << projectPath << std::endl;
        }
        return std::nullopt;
    }

    ProjectRecord record;
    record.name = projectPath.filename().string();
    record.path = projectPath.string();
    record.vcs = *vcs;
    record.languages = languageDetector_.detect(projectPath);
    record.dependencies = manifestAnalyzer_.analyze(projectPath);
    record.remote = fetchRemote(record.vcs);
    record.quality = qualityChecker_.check(projectPath);

    ScoreInputs inputs{record.vcs, record.dependencies, record.remote, record.quality, clock_()};
    auto result = scorer_.score(inputs);
    record.healthScore = result.score;
    record.status = result.status;
    record.scoreBreakdown = std::move(result.components);

    return record;
}

std::optional<RemoteInfo> ProjectAnalyzer::fetchRemote(const VcsInfo& vcs) const {
    if (!github_ || !vcs.originUrl) {
        return std::nullopt;
    }

    auto repository = GitHubClient::parseRepository(*vcs.originUrl);
    if (!repository) {
        return std::nullopt;
    }

    if (verbose_) {
        std::cout << "    Fetching GitHub metadata for " << *repository << std::endl;
    }
    return github_->fetch(*repository);
}

ProjectWalker::ProjectWalker(const fs::path& root, const ProjectAnalyzer& analyzer)
    : root_(normalizeRoot(root)), analyzer_(analyzer) {

    if (!fs::is_directory(root_)) {
        throw std::runtime_error("Scan root is not a directory: " + root_.string());
    }

    if (ProjectAnalyzer::isRepository(root_)) {
        candidates_.push_back(root_);
    }

    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(root_)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        std::error_code ec;
        if (entry.is_directory(ec)) {
            children.push_back(entry.path());
        }
    }
    std::sort(children.begin(), children.end());
    candidates_.insert(candidates_.end(), children.begin(), children.end());
}

std::optional<WalkEntry> ProjectWalker::next() {
    if (position_ >= candidates_.size()) {
        return std::nullopt;
    }

    WalkEntry entry = analyzeCandidate(candidates_[position_++]);
    logEntry(entry);
    return entry;
}

WalkEntry ProjectWalker::analyzeCandidate(const fs::path& path) const {
    WalkEntry entry;
    entry.path = path;

    try {
        entry.record = analyzer_.analyze(path);
        entry.outcome = entry.record ? WalkEntry::Outcome::Analyzed : WalkEntry::Outcome::Skipped;
    } catch (const std::exception& e) {
        entry.outcome = WalkEntry::Outcome::Failed;
        entry.error = e.what();
    }

    return entry;
}

void ProjectWalker::logEntry(const WalkEntry& entry) {
    const std::string name = entry.path.filename().string();
    switch (entry.outcome) {
        case WalkEntry::Outcome::Analyzed:
            std::cout << "  ✅ " << entry.record->name << " (Score: "
                      << formatScore(entry.record->healthScore) << "/10)" << std::endl;
            break;
        case WalkEntry::Outcome::Skipped:
            std::cout << "  ⏭️  Skipped " << name << std::endl;
            break;
        case WalkEntry::Outcome::Failed:
            std::cerr << "  ❌ Error analyzing " << name << ": " << entry.error << std::endl;
            break;
    }
}

std::vector<ProjectRecord> ProjectWalker::scanAll() {
    std::cout << "🔍 Scanning projects in " << root_.string() << std::endl;

    std::vector<ProjectRecord> records;
    while (auto entry = next()) {
        if (entry->outcome == WalkEntry::Outcome::Analyzed) {
            records.push_back(std::move(*entry->record));
        }
    }
    return records;
}
