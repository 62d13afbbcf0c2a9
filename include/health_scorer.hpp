#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <utility>
#include "project_record.hpp"

// Thresholds and deltas for the health score. Tiered rules are lists of
// (exclusive lower bound, delta) pairs checked in order; the first match applies.
struct HealthScoringConfig {
    double baseline = 10.0;
    double minScore = 0.0;
    double maxScore = 10.0;

    // Working tree
    std::vector<std::pair<int, double>> uncommittedPenalties = {{50, -3.0}, {10, -2.0}};
    double perChangePenalty = 0.1;           // Below the tiers: -min(cap, n * perChangePenalty)
    double maxPerChangePenalty = 1.0;

    // Commit age in days
    std::vector<std::pair<long, double>> commitAgePenalties = {
        {365, -4.0}, {180, -2.5}, {60, -1.5}, {14, -0.5}
    };

    double unknownRemoteSyncPenalty = -0.5;

    // Dependencies
    double hasDependenciesBonus = 0.5;
    int reasonableDependenciesMin = 5;
    int reasonableDependenciesMax = 50;
    double reasonableDependenciesBonus = 0.3;
    int excessiveDependencies = 100;
    double excessiveDependenciesPenalty = -0.5;
    double multiEcosystemBonus = 0.2;

    // Remote repository
    std::vector<std::pair<int, double>> openIssuePenalties = {{50, -1.5}, {20, -1.0}, {10, -0.5}};
    int activePullRequestsMin = 1;
    int activePullRequestsMax = 5;
    double activePullRequestsBonus = 0.3;
    int pullRequestBacklog = 10;
    double pullRequestBacklogPenalty = -0.3;
    std::vector<std::pair<int, double>> starBonuses = {{1000, 0.5}, {100, 0.3}, {10, 0.1}};
    long recentActivityDays = 7;
    double recentActivityBonus = 0.2;

    // Quality
    double readmeBonus = 0.3;
    double readmeTierBonus = 0.1;
    double documentationBonus = 0.4;
    double testsBonus = 0.5;
    double testTierBonus = 0.1;
    double ciBonus = 0.6;
    double qualityToolBonus = 0.1;
    double maxQualityToolBonus = 0.5;
    double structureBonus = 0.1;

    // Status bands
    double healthyThreshold = 8.0;
    double warningThreshold = 5.0;
};

// Everything a rule may look at
struct ScoreInputs {
    const VcsInfo& vcs;
    const DependencyInfo& dependencies;
    const std::optional<RemoteInfo>& remote;
    const QualityInfo& quality;
    TimePoint now;
};

struct ScoreRule {
    std::string name;
    std::function<double(const ScoreInputs&, const HealthScoringConfig&)> delta;
};

// Combines the signal sources into a score in [minScore, maxScore].
// Every rule is evaluated independently and the deltas are summed onto the baseline.
class HealthScorer {
public:
    struct Result {
        double score = 0.0;
        HealthStatus status = HealthStatus::Unhealthy;
        std::map<std::string, double> components;   // Non-zero rule deltas
    };

    explicit HealthScorer(const HealthScoringConfig& config = HealthScoringConfig());

    Result score(const ScoreInputs& inputs) const;

    // Delta of the rule called `name`; throws std::out_of_range for unknown names
    double evaluateRule(const std::string& name, const ScoreInputs& inputs) const;

    HealthStatus statusFor(double score) const;

    const std::vector<ScoreRule>& rules() const { return rules_; }
    const HealthScoringConfig& getConfig() const { return config_; }

private:
    HealthScoringConfig config_;
    std::vector<ScoreRule> rules_;

    static std::vector<ScoreRule> defaultRules();
};
