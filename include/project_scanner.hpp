#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <utility>
#include <filesystem>
#include "command_runner.hpp"
#include "config_loader.hpp"
#include "github_client.hpp"
#include "health_scorer.hpp"
#include "language_detector.hpp"
#include "manifest_analyzer.hpp"
#include "project_record.hpp"
#include "quality_checker.hpp"
#include "vcs_inspector.hpp"

namespace fs = std::filesystem;

struct ScanOptions {
    fs::path rootDir;
    std::string githubToken;         // Optional bearer credential for the GitHub API
    bool fetchRemote = true;         // Query GitHub for repositories with a github.com origin
    bool verbose = false;
    ScannerConfig config;
};

// Runs the per-project pipeline: VCS -> languages -> manifests -> remote -> quality -> score
class ProjectAnalyzer {
public:
    using Clock = std::function<TimePoint()>;

    // `github` may be null to disable remote enrichment
    ProjectAnalyzer(const CommandRunner& runner,
                    const GitHubClient* github,
                    const ScannerConfig& config = ScannerConfig());

    // A directory counts as a project when it has `.git` metadata
    static bool isRepository(const fs::path& path);

    // Build the record for `projectPath`, or std::nullopt when the directory is not a
    // repository or git could not be inspected. Unexpected errors propagate.
    std::optional<ProjectRecord> analyze(const fs::path& projectPath) const;

    // Time source for age-based rules; defaults to the system clock
    void setClock(Clock clock) { clock_ = std::move(clock); }

    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    VcsInspector vcsInspector_;
    LanguageDetector languageDetector_;
    ManifestAnalyzer manifestAnalyzer_;
    QualityChecker qualityChecker_;
    HealthScorer scorer_;
    const GitHubClient* github_;
    Clock clock_;
    bool verbose_ = false;

    std::optional<RemoteInfo> fetchRemote(const VcsInfo& vcs) const;
};

// One step of a walk
struct WalkEntry {
    enum class Outcome {
        Analyzed,   // `record` holds the project
        Skipped,    // Not a repository, or git inspection failed
        Failed      // Analysis threw; `error` holds the message
    };

    fs::path path;
    Outcome outcome = Outcome::Skipped;
    std::optional<ProjectRecord> record;
    std::string error;
};

// Single-pass walk over a root directory and its immediate, non-hidden child
// directories. Each call to next() analyzes exactly one candidate.
class ProjectWalker {
public:
    // Throws std::runtime_error if `root` is not a directory and lets
    // std::filesystem::filesystem_error escape if its children cannot be listed
    ProjectWalker(const fs::path& root, const ProjectAnalyzer& analyzer);

    // Next candidate, or std::nullopt once the walk is exhausted.
    // Failures inside one candidate are contained in its entry.
    std::optional<WalkEntry> next();

    // Drain the walk and return the analyzed projects in visit order
    std::vector<ProjectRecord> scanAll();

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    const ProjectAnalyzer& analyzer_;
    std::vector<fs::path> candidates_;
    size_t position_ = 0;

    WalkEntry analyzeCandidate(const fs::path& path) const;
    static void logEntry(const WalkEntry& entry);
};
