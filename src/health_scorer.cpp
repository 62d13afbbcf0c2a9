#include "health_scorer.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace {

// First tier whose bound `value` exceeds, or 0
template <typename T>
double tieredDelta(T value, const std::vector<std::pair<T, double>>& tiers) {
    for (const auto& [bound, delta] : tiers) {
        if (value > bound) {
            return delta;
        }
    }
    return 0.0;
}

} // namespace

HealthScorer::HealthScorer(const HealthScoringConfig& config)
    : config_(config), rules_(defaultRules()) {
}

std::vector<ScoreRule> HealthScorer::defaultRules() {
    using Config = HealthScoringConfig;

    return {
        {"uncommitted", [](const ScoreInputs& in, const Config& c) {
            int changes = in.vcs.uncommittedChanges;
            if (changes <= 0) {
                return 0.0;
            }
            double tiered = tieredDelta(changes, c.uncommittedPenalties);
            if (tiered != 0.0) {
                return tiered;
            }
            return -std::min(c.maxPerChangePenalty, changes * c.perChangePenalty);
        }},

        {"commit_age", [](const ScoreInputs& in, const Config& c) {
            if (!in.vcs.lastCommit) {
                return 0.0;
            }
            return tieredDelta(daysBetween(*in.vcs.lastCommit, in.now), c.commitAgePenalties);
        }},

        {"remote_sync", [](const ScoreInputs& in, const Config& c) {
            return in.vcs.remoteSync == RemoteSyncStatus::Unknown ? c.unknownRemoteSyncPenalty : 0.0;
        }},

        {"has_dependencies", [](const ScoreInputs& in, const Config& c) {
            return in.dependencies.hasDependencies ? c.hasDependenciesBonus : 0.0;
        }},

        {"dependency_count", [](const ScoreInputs& in, const Config& c) {
            if (!in.dependencies.hasDependencies) {
                return 0.0;
            }
            int total = in.dependencies.totalCount();
            if (total >= c.reasonableDependenciesMin && total <= c.reasonableDependenciesMax) {
                return c.reasonableDependenciesBonus;
            }
            if (total > c.excessiveDependencies) {
                return c.excessiveDependenciesPenalty;
            }
            return 0.0;
        }},

        {"multi_ecosystem", [](const ScoreInputs& in, const Config& c) {
            return in.dependencies.ecosystemLanguages.size() > 1 ? c.multiEcosystemBonus : 0.0;
        }},

        {"open_issues", [](const ScoreInputs& in, const Config& c) {
            return in.remote ? tieredDelta(in.remote->openIssues, c.openIssuePenalties) : 0.0;
        }},

        {"open_prs", [](const ScoreInputs& in, const Config& c) {
            if (!in.remote) {
                return 0.0;
            }
            int prs = in.remote->openPullRequests;
            if (prs >= c.activePullRequestsMin && prs <= c.activePullRequestsMax) {
                return c.activePullRequestsBonus;
            }
            if (prs > c.pullRequestBacklog) {
                return c.pullRequestBacklogPenalty;
            }
            return 0.0;
        }},

        {"stars", [](const ScoreInputs& in, const Config& c) {
            return in.remote ? tieredDelta(in.remote->stars, c.starBonuses) : 0.0;
        }},

        // Only meaningful next to a local commit date
        {"remote_activity", [](const ScoreInputs& in, const Config& c) {
            if (!in.remote || !in.remote->lastActivity || !in.vcs.lastCommit) {
                return 0.0;
            }
            long days = daysBetween(*in.remote->lastActivity, in.now);
            return days <= c.recentActivityDays ? c.recentActivityBonus : 0.0;
        }},

        {"readme", [](const ScoreInputs& in, const Config& c) {
            if (!in.quality.hasReadme) {
                return 0.0;
            }
            return c.readmeBonus + in.quality.readmeQuality * c.readmeTierBonus;
        }},

        {"documentation", [](const ScoreInputs& in, const Config& c) {
            return in.quality.hasDocumentation ? c.documentationBonus : 0.0;
        }},

        {"tests", [](const ScoreInputs& in, const Config& c) {
            if (!in.quality.hasTests) {
                return 0.0;
            }
            return c.testsBonus + in.quality.testCoverage * c.testTierBonus;
        }},

        {"ci", [](const ScoreInputs& in, const Config& c) {
            return in.quality.hasCi ? c.ciBonus : 0.0;
        }},

        {"quality_tools", [](const ScoreInputs& in, const Config& c) {
            return std::min(c.maxQualityToolBonus, in.quality.qualityTools * c.qualityToolBonus);
        }},

        {"structure", [](const ScoreInputs& in, const Config& c) {
            return in.quality.structureScore * c.structureBonus;
        }},
    };
}

HealthScorer::Result HealthScorer::score(const ScoreInputs& inputs) const {
    Result result;
    double total = config_.baseline;

    for (const auto& rule : rules_) {
        double delta = rule.delta(inputs, config_);
        if (delta != 0.0) {
            result.components[rule.name] = delta;
            total += delta;
        }
    }

    result.score = std::clamp(total, config_.minScore, config_.maxScore);
    result.status = statusFor(result.score);
    return result;
}

double HealthScorer::evaluateRule(const std::string& name, const ScoreInputs& inputs) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
        [&](const ScoreRule& rule) { return rule.name == name; });
    if (it == rules_.end()) {
        throw std::out_of_range("Unknown score rule: " + name);
    }
    return it->delta(inputs, config_);
}

HealthStatus HealthScorer::statusFor(double score) const {
    if (score >= config_.healthyThreshold) {
        return HealthStatus::Healthy;
    }
    if (score >= config_.warningThreshold) {
        return HealthStatus::Warning;
    }
    return HealthStatus::Unhealthy;
}
