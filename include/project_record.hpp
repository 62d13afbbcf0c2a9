#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>

using TimePoint = std::chrono::system_clock::time_point;

enum class VcsStatus {
    Clean,
    Dirty
};

enum class RemoteSyncStatus {
    Clean,      // Upstream configured and neither ahead nor behind
    Dirty,      // Ahead of or behind upstream
    Unknown     // No upstream or the check failed
};

enum class HealthStatus {
    Healthy,
    Warning,
    Unhealthy
};

std::string toString(VcsStatus status);
std::string toString(RemoteSyncStatus status);
std::string toString(HealthStatus status);

// Local working-copy state reported by git
struct VcsInfo {
    std::string branch = "main";
    std::optional<TimePoint> lastCommit;
    int uncommittedChanges = 0;
    VcsStatus status = VcsStatus::Clean;
    RemoteSyncStatus remoteSync = RemoteSyncStatus::Unknown;
    std::optional<std::string> originUrl;
};

// Declared dependencies across every detected manifest
struct DependencyInfo {
    bool hasDependencies = false;
    std::vector<std::string> ecosystemLanguages;  // "Node.js", "Python", "Go"
    std::map<std::string, int> counts;            // ecosystem -> declared dependency count
    std::vector<std::string> details;             // "npm: 3 deps, 1 dev deps"

    int totalCount() const;
    std::string summary() const;
};

struct QualityInfo {
    bool hasReadme = false;
    int readmeQuality = 0;      // 0-5
    bool hasTests = false;
    int testCoverage = 0;       // 0-5 estimate
    bool hasCi = false;
    std::string ciType = "none";
    bool hasDocumentation = false;
    int qualityTools = 0;       // Number of lint/format config files found
    int structureScore = 0;     // 0-5
};

// Metadata from the remote hosting service
struct RemoteInfo {
    std::string repository;     // owner/repo
    int stars = 0;
    int openIssues = 0;         // Pull requests already subtracted
    int openPullRequests = 0;
    std::optional<TimePoint> lastActivity;
    std::string workflowStatus = "unknown";
};

struct ProjectRecord {
    std::string name;
    std::string path;
    VcsInfo vcs;
    std::vector<std::string> languages;
    DependencyInfo dependencies;
    QualityInfo quality;
    std::optional<RemoteInfo> remote;
    double healthScore = 0.0;
    HealthStatus status = HealthStatus::Unhealthy;
    std::map<std::string, double> scoreBreakdown;  // rule name -> applied delta
};
