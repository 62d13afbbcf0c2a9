#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "health_scorer.hpp"

using Catch::Approx;
using namespace std::chrono;

namespace {

const TimePoint NOW = system_clock::from_time_t(1717243200);  // 2024-06-01T12:00:00Z

TimePoint daysAgo(int days) {
    return NOW - hours(24 * days);
}

// Inputs the rules can reference; defaults are a clean repository with a known
// upstream and no other signals
struct Fixture {
    VcsInfo vcs;
    DependencyInfo dependencies;
    std::optional<RemoteInfo> remote;
    QualityInfo quality;

    Fixture() {
        vcs.remoteSync = RemoteSyncStatus::Clean;
    }

    ScoreInputs inputs() const {
        return ScoreInputs{vcs, dependencies, remote, quality, NOW};
    }
};

} // namespace

TEST_CASE("A repository without signals keeps the baseline", "[HealthScorer]") {
    Fixture f;
    HealthScorer scorer;

    auto result = scorer.score(f.inputs());
    REQUIRE(result.score == Approx(10.0));
    REQUIRE(result.status == HealthStatus::Healthy);
    REQUIRE(result.components.empty());
}

TEST_CASE("Uncommitted changes are penalized by tier", "[HealthScorer]") {
    Fixture f;
    HealthScorer scorer;

    auto penalty = [&](int changes) {
        f.vcs.uncommittedChanges = changes;
        return scorer.evaluateRule("uncommitted", f.inputs());
    };

    REQUIRE(penalty(0) == Approx(0.0));
    REQUIRE(penalty(3) == Approx(-0.3));
    REQUIRE(penalty(10) == Approx(-1.0));
    REQUIRE(penalty(11) == Approx(-2.0));
    REQUIRE(penalty(50) == Approx(-2.0));
    REQUIRE(penalty(51) == Approx(-3.0));
}

TEST_CASE("Commit age is penalized by tier", "[HealthScorer]") {
    Fixture f;
    HealthScorer scorer;

    auto penalty = [&](int days) {
        f.vcs.lastCommit = daysAgo(days);
        return scorer.evaluateRule("commit_age", f.inputs());
    };

    REQUIRE(penalty(3) == Approx(0.0));
    REQUIRE(penalty(14) == Approx(0.0));
    REQUIRE(penalty(15) == Approx(-0.5));
    REQUIRE(penalty(61) == Approx(-1.5));
    REQUIRE(penalty(181) == Approx(-2.5));
    REQUIRE(penalty(400) == Approx(-4.0));

    SECTION("Unknown commit date is not penalized") {
        f.vcs.lastCommit.reset();
        REQUIRE(scorer.evaluateRule("commit_age", f.inputs()) == Approx(0.0));
    }
}

TEST_CASE("Unknown upstream state is penalized", "[HealthScorer]") {
    Fixture f;
    HealthScorer scorer;

    REQUIRE(scorer.evaluateRule("remote_sync", f.inputs()) == Approx(0.0));
    f.vcs.remoteSync = RemoteSyncStatus::Dirty;
    REQUIRE(scorer.evaluateRule("remote_sync", f.inputs()) == Approx(0.0));
    f.vcs.remoteSync = RemoteSyncStatus::Unknown;
    REQUIRE(scorer.evaluateRule("remote_sync", f.inputs()) == Approx(-0.5));
}

TEST_CASE("Dependency rules", "[HealthScorer]") {
    Fixture f;
    HealthScorer scorer;
    f.dependencies.hasDependencies = true;
    f.dependencies.ecosystemLanguages = {"Python"};

    SECTION("Reasonable count") {
        f.dependencies.counts["pip"] = 12;
        REQUIRE(scorer.evaluateRule("has_dependencies", f.inputs()) == Approx(0.5));
        REQUIRE(scorer.evaluateRule("dependency_count", f.inputs()) == Approx(0.3));
        REQUIRE(scorer.evaluateRule("multi_ecosystem", f.inputs()) == Approx(0.0));
    }

    SECTION("Few dependencies") {
        f.dependencies.counts["pip"] = 4;
        REQUIRE(scorer.evaluateRule("dependency_count", f.inputs()) == Approx(0.0));
    }

    SECTION("Between reasonable and excessive") {
        f.dependencies.counts["npm"] = 80;
        REQUIRE(scorer.evaluateRule("dependency_count", f.inputs()) == Approx(0.0));
    }

    SECTION("Excessive count") {
        f.dependencies.counts["npm"] = 90;
        f.dependencies.counts["go"] = 20;
        REQUIRE(scorer.evaluateRule("dependency_count", f.inputs()) == Approx(-0.5));
    }

    SECTION("Several ecosystems") {
        f.dependencies.ecosystemLanguages = {"Node.js", "Go"};
        REQUIRE(scorer.evaluateRule("multi_ecosystem", f.inputs()) == Approx(0.2));
    }
}

TEST_CASE("Remote rules", "[HealthScorer]") {
    Fixture f;
    HealthScorer scorer;
    f.vcs.lastCommit = daysAgo(1);

    SECTION("No remote data means no remote deltas") {
        for (const auto& name : {"open_issues", "open_prs", "stars", "remote_activity"}) {
            REQUIRE(scorer.evaluateRule(name, f.inputs()) == Approx(0.0));
        }
    }

    f.remote = RemoteInfo();
    f.remote->repository = "octo/widgets";

    SECTION("Open issues") {
        f.remote->openIssues = 10;
        REQUIRE(scorer.evaluateRule("open_issues", f.inputs()) == Approx(0.0));
        f.remote->openIssues = 20;
        REQUIRE(scorer.evaluateRule("open_issues", f.inputs()) == Approx(-0.5));
        f.remote->openIssues = 21;
        REQUIRE(scorer.evaluateRule("open_issues", f.inputs()) == Approx(-1.0));
        f.remote->openIssues = 51;
        REQUIRE(scorer.evaluateRule("open_issues", f.inputs()) == Approx(-1.5));
    }

    SECTION("Open pull requests") {
        f.remote->openPullRequests = 0;
        REQUIRE(scorer.evaluateRule("open_prs", f.inputs()) == Approx(0.0));
        f.remote->openPullRequests = 3;
        REQUIRE(scorer.evaluateRule("open_prs", f.inputs()) == Approx(0.3));
        f.remote->openPullRequests = 10;
        REQUIRE(scorer.evaluateRule("open_prs", f.inputs()) == Approx(0.0));
        f.remote->openPullRequests = 11;
        REQUIRE(scorer.evaluateRule("open_prs", f.inputs()) == Approx(-0.3));
    }

    SECTION("Stars") {
        f.remote->stars = 10;
        REQUIRE(scorer.evaluateRule("stars", f.inputs()) == Approx(0.0));
        f.remote->stars = 11;
        REQUIRE(scorer.evaluateRule("stars", f.inputs()) == Approx(0.1));
        f.remote->stars = 500;
        REQUIRE(scorer.evaluateRule("stars", f.inputs()) == Approx(0.3));
        f.remote->stars = 5000;
        REQUIRE(scorer.evaluateRule("stars", f.inputs()) == Approx(0.5));
    }

    SECTION("Recent remote activity") {
        f.remote->lastActivity = daysAgo(3);
        REQUIRE(scorer.evaluateRule("remote_activity", f.inputs()) == Approx(0.2));
        f.remote->lastActivity = daysAgo(30);
        REQUIRE(scorer.evaluateRule("remote_activity", f.inputs()) == Approx(0.0));

        f.remote->lastActivity = daysAgo(3);
        f.vcs.lastCommit.reset();
        REQUIRE(scorer.evaluateRule("remote_activity", f.inputs()) == Approx(0.0));
    }
}

TEST_CASE("Quality rules", "[HealthScorer]") {
    Fixture f;
    HealthScorer scorer;

    f.quality.hasReadme = true;
    f.quality.readmeQuality = 5;
    REQUIRE(scorer.evaluateRule("readme", f.inputs()) == Approx(0.8));

    f.quality.hasTests = true;
    f.quality.testCoverage = 2;
    REQUIRE(scorer.evaluateRule("tests", f.inputs()) == Approx(0.7));

    f.quality.hasCi = true;
    REQUIRE(scorer.evaluateRule("ci", f.inputs()) == Approx(0.6));

    f.quality.hasDocumentation = true;
    REQUIRE(scorer.evaluateRule("documentation", f.inputs()) == Approx(0.4));

    f.quality.qualityTools = 3;
    REQUIRE(scorer.evaluateRule("quality_tools", f.inputs()) == Approx(0.3));
    f.quality.qualityTools = 9;
    REQUIRE(scorer.evaluateRule("quality_tools", f.inputs()) == Approx(0.5));

    f.quality.structureScore = 4;
    REQUIRE(scorer.evaluateRule("structure", f.inputs()) == Approx(0.4));
}

TEST_CASE("Unknown rule names are rejected", "[HealthScorer]") {
    Fixture f;
    REQUIRE_THROWS_AS(HealthScorer().evaluateRule("coverage", f.inputs()), std::out_of_range);
}

TEST_CASE("Score stays within bounds", "[HealthScorer]") {
    HealthScorer scorer;

    SECTION("Everything wrong") {
        Fixture f;
        f.vcs.uncommittedChanges = 500;
        f.vcs.lastCommit = daysAgo(3000);
        f.vcs.remoteSync = RemoteSyncStatus::Unknown;
        f.dependencies.hasDependencies = true;
        f.dependencies.counts["npm"] = 900;
        f.remote = RemoteInfo();
        f.remote->openIssues = 1000;
        f.remote->openPullRequests = 300;

        auto result = scorer.score(f.inputs());
        REQUIRE(result.score >= 0.0);
        REQUIRE(result.score <= 10.0);
        REQUIRE(result.status == HealthStatus::Unhealthy);
    }

    SECTION("Everything right") {
        Fixture f;
        f.vcs.lastCommit = daysAgo(0);
        f.dependencies.hasDependencies = true;
        f.dependencies.ecosystemLanguages = {"Node.js", "Python"};
        f.dependencies.counts["npm"] = 20;
        f.remote = RemoteInfo();
        f.remote->stars = 50000;
        f.remote->openPullRequests = 2;
        f.remote->lastActivity = daysAgo(0);
        f.quality = QualityInfo{true, 5, true, 5, true, "GitHub Actions", true, 10, 5};

        auto result = scorer.score(f.inputs());
        REQUIRE(result.score == Approx(10.0));
        REQUIRE(result.status == HealthStatus::Healthy);
    }

    SECTION("Configured bounds") {
        HealthScoringConfig config;
        config.baseline = 3.0;
        config.minScore = 1.0;
        Fixture f;
        f.vcs.uncommittedChanges = 75;
        f.vcs.lastCommit = daysAgo(400);

        REQUIRE(HealthScorer(config).score(f.inputs()).score == Approx(1.0));
    }
}

TEST_CASE("Status bands", "[HealthScorer]") {
    HealthScorer scorer;
    REQUIRE(scorer.statusFor(10.0) == HealthStatus::Healthy);
    REQUIRE(scorer.statusFor(8.0) == HealthStatus::Healthy);
    REQUIRE(scorer.statusFor(7.99) == HealthStatus::Warning);
    REQUIRE(scorer.statusFor(5.0) == HealthStatus::Warning);
    REQUIRE(scorer.statusFor(4.99) == HealthStatus::Unhealthy);
    REQUIRE(scorer.statusFor(0.0) == HealthStatus::Unhealthy);
}

TEST_CASE("Neglected repository scores 3.0", "[HealthScorer][scenario]") {
    Fixture f;
    f.vcs.uncommittedChanges = 75;
    f.vcs.status = VcsStatus::Dirty;
    f.vcs.lastCommit = daysAgo(400);

    auto result = HealthScorer().score(f.inputs());
    REQUIRE(result.score == Approx(3.0));
    REQUIRE(result.status == HealthStatus::Unhealthy);
    REQUIRE(result.components.size() == 2);
    REQUIRE(result.components.at("uncommitted") == Approx(-3.0));
    REQUIRE(result.components.at("commit_age") == Approx(-4.0));
}

TEST_CASE("Busy remote repository deltas", "[HealthScorer][scenario]") {
    Fixture f;
    f.vcs.lastCommit = daysAgo(1);
    f.remote = RemoteInfo();
    f.remote->openIssues = 20;
    f.remote->openPullRequests = 10;

    auto result = HealthScorer().score(f.inputs());
    REQUIRE(result.components.at("open_issues") == Approx(-0.5));
    REQUIRE(result.components.count("open_prs") == 0);
    REQUIRE(result.score == Approx(9.5));
}
