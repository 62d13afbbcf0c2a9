#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "project_scanner.hpp"
#include "report_writer.hpp"
#include "time_utils.hpp"
#include "fakes.hpp"
#include "test_helpers.hpp"
#include <algorithm>

using Catch::Approx;
using namespace std::chrono;

namespace {

const TimePoint NOW = system_clock::from_time_t(1717243200);  // 2024-06-01T12:00:00Z
const std::string THREE_DAYS_AGO = "2024-05-29 12:00:00 +0000";

std::vector<std::string> names(const std::vector<ProjectRecord>& records) {
    std::vector<std::string> result;
    for (const auto& record : records) {
        result.push_back(record.name);
    }
    return result;
}

} // namespace

TEST_CASE("Only directories with git metadata are projects", "[ProjectScanner]") {
    TempDir temp;
    temp.makeRepository("api");
    fs::create_directories(temp.path() / "notes");
    createTestFile(temp.path() / "todo.txt", "nothing here");

    REQUIRE(ProjectAnalyzer::isRepository(temp.path() / "api"));
    REQUIRE_FALSE(ProjectAnalyzer::isRepository(temp.path() / "notes"));

    FakeCommandRunner runner;
    runner.respondCleanRepository("main", THREE_DAYS_AGO);
    ProjectAnalyzer analyzer(runner, nullptr);

    REQUIRE_FALSE(analyzer.analyze(temp.path() / "notes").has_value());
    REQUIRE(runner.calls.empty());

    ProjectWalker walker(temp.path(), analyzer);
    auto records = walker.scanAll();
    REQUIRE(names(records) == std::vector<std::string>{"api"});
}

TEST_CASE("The walk visits the root and its children in order", "[ProjectScanner]") {
    TempDir temp;
    fs::create_directories(temp.path() / ".git");
    temp.makeRepository("zeta");
    temp.makeRepository("alpha");
    temp.makeRepository(".hidden");
    fs::create_directories(temp.path() / "plain");

    FakeCommandRunner runner;
    runner.respondCleanRepository("main", THREE_DAYS_AGO);
    ProjectAnalyzer analyzer(runner, nullptr);
    ProjectWalker walker(temp.path(), analyzer);

    std::vector<WalkEntry> entries;
    while (auto entry = walker.next()) {
        entries.push_back(*entry);
    }

    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0].path.string() == walker.root().string());
    REQUIRE(entries[0].outcome == WalkEntry::Outcome::Analyzed);
    REQUIRE(entries[1].path.filename().string() == "alpha");
    REQUIRE(entries[2].path.filename().string() == "plain");
    REQUIRE(entries[2].outcome == WalkEntry::Outcome::Skipped);
    REQUIRE(entries[3].path.filename().string() == "zeta");

    REQUIRE_FALSE(walker.next().has_value());
}

TEST_CASE("A failing project does not stop the walk", "[ProjectScanner]") {
    TempDir temp;
    temp.makeRepository("alpha");
    temp.makeRepository("broken");
    temp.makeRepository("crashing");
    temp.makeRepository("omega");

    FakeCommandRunner runner;
    runner.respondCleanRepository("main", THREE_DAYS_AGO);
    runner.throwFor("broken");
    runner.breakFor("crashing");
    ProjectAnalyzer analyzer(runner, nullptr);
    ProjectWalker walker(temp.path(), analyzer);

    std::vector<WalkEntry> entries;
    while (auto entry = walker.next()) {
        entries.push_back(*entry);
    }

    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0].outcome == WalkEntry::Outcome::Analyzed);
    REQUIRE(entries[1].outcome == WalkEntry::Outcome::Skipped);
    REQUIRE(entries[2].outcome == WalkEntry::Outcome::Failed);
    REQUIRE(entries[2].error == "unexpected state");
    REQUIRE(entries[3].outcome == WalkEntry::Outcome::Analyzed);
}

TEST_CASE("Git failures skip the project", "[ProjectScanner]") {
    TempDir temp;
    temp.makeRepository("stale");

    FakeCommandRunner runner;
    runner.respondCleanRepository("main", THREE_DAYS_AGO);
    runner.timeOut("status --porcelain");
    ProjectAnalyzer analyzer(runner, nullptr);

    REQUIRE_FALSE(analyzer.analyze(temp.path() / "stale").has_value());
    REQUIRE(ProjectWalker(temp.path(), analyzer).scanAll().empty());
}

TEST_CASE("Scan root errors are reported", "[ProjectScanner]") {
    TempDir temp;
    createTestFile(temp.path() / "file.txt", "x");

    FakeCommandRunner runner;
    ProjectAnalyzer analyzer(runner, nullptr);

    REQUIRE_THROWS_AS(ProjectWalker(temp.path() / "missing", analyzer), std::runtime_error);
    REQUIRE_THROWS_AS(ProjectWalker(temp.path() / "file.txt", analyzer), std::runtime_error);
}

TEST_CASE("Well-kept project scores at least 9", "[ProjectScanner][scenario]") {
    TempDir temp;
    const fs::path project = temp.makeRepository("tidy");
    createTestFile(project / "README.md", std::string(2500, '#'));
    for (const auto& file : {"test_api.py", "test_models.py", "test_views.py", "test_utils.py"}) {
        createTestFile(project / "tests" / file, "def test_ok():\n    assert True\n");
    }
    fs::create_directories(project / ".github" / "workflows");
    std::string requirements;
    for (int i = 0; i < 12; ++i) {
        requirements += "package" + std::to_string(i) + "==1.0\n";
    }
    createTestFile(project / "requirements.txt", requirements);

    FakeCommandRunner runner;
    runner.respondCleanRepository("main", THREE_DAYS_AGO);
    ProjectAnalyzer analyzer(runner, nullptr);
    analyzer.setClock([] { return NOW; });

    auto record = analyzer.analyze(project);
    REQUIRE(record.has_value());
    REQUIRE(record->name == "tidy");
    REQUIRE(record->path == project.string());
    REQUIRE(record->vcs.status == VcsStatus::Clean);
    REQUIRE(record->languages == std::vector<std::string>{"Python"});
    REQUIRE(record->dependencies.counts.at("pip") == 12);
    REQUIRE(record->quality.readmeQuality == 5);
    REQUIRE(record->quality.hasTests);
    REQUIRE(record->quality.ciType == "GitHub Actions");
    REQUIRE_FALSE(record->remote.has_value());
    REQUIRE(record->healthScore >= 9.0);
    REQUIRE(record->status == HealthStatus::Healthy);
    REQUIRE(record->scoreBreakdown.count("commit_age") == 0);
}

TEST_CASE("Neglected project scores 3.0", "[ProjectScanner][scenario]") {
    TempDir temp;
    const fs::path project = temp.makeRepository("legacy");

    std::string porcelain;
    for (int i = 0; i < 75; ++i) {
        porcelain += " M file" + std::to_string(i) + ".txt\n";
    }

    FakeCommandRunner runner;
    runner.respondCleanRepository("master", "2023-04-28 12:00:00 +0000");
    runner.respond("status --porcelain", porcelain);
    ProjectAnalyzer analyzer(runner, nullptr);
    analyzer.setClock([] { return NOW; });

    auto record = analyzer.analyze(project);
    REQUIRE(record.has_value());
    REQUIRE(record->vcs.branch == "master");
    REQUIRE(record->vcs.uncommittedChanges == 75);
    REQUIRE(record->vcs.status == VcsStatus::Dirty);
    REQUIRE(record->healthScore == Approx(3.0));
    REQUIRE(record->status == HealthStatus::Unhealthy);
}

TEST_CASE("Remote metadata enrichment", "[ProjectScanner]") {
    TempDir temp;
    const fs::path project = temp.makeRepository("widgets");

    FakeCommandRunner runner;
    runner.respondCleanRepository("main", THREE_DAYS_AGO);
    runner.respond("remote get-url origin", "git@github.com:octo/widgets.git\n");

    FakeHttpClient http;
    GitHubClient github(http);
    ProjectAnalyzer analyzer(runner, &github);
    analyzer.setClock([] { return NOW; });

    SECTION("Remote failure keeps the project with default remote fields") {
        auto record = analyzer.analyze(project);
        REQUIRE(record.has_value());
        REQUIRE(record->remote.has_value());
        REQUIRE(record->remote->repository == "octo/widgets");
        REQUIRE(record->remote->stars == 0);
        REQUIRE(record->remote->openIssues == 0);
        REQUIRE(record->remote->openPullRequests == 0);
    }

    SECTION("Successful lookup") {
        http.respond("https://api.github.com/repos/octo/widgets", 200,
                     R"({"stargazers_count": 250, "open_issues_count": 30, "updated_at": "2024-05-31T08:00:00Z"})");
        http.respond("https://api.github.com/repos/octo/widgets/pulls?state=open&per_page=100", 200,
                     R"([{"number": 1}, {"number": 2}])");

        auto record = analyzer.analyze(project);
        REQUIRE(record.has_value());
        REQUIRE(record->remote->stars == 250);
        REQUIRE(record->remote->openIssues == 28);
        REQUIRE(record->remote->openPullRequests == 2);
        REQUIRE(record->scoreBreakdown.at("stars") == Approx(0.3));
        REQUIRE(record->scoreBreakdown.at("open_prs") == Approx(0.3));
        REQUIRE(record->scoreBreakdown.at("open_issues") == Approx(-1.0));
        REQUIRE(record->scoreBreakdown.at("remote_activity") == Approx(0.2));
    }

    SECTION("Non-GitHub origins are not queried") {
        runner.respond("remote get-url origin", "https://gitlab.com/octo/widgets.git\n");
        auto record = analyzer.analyze(project);
        REQUIRE(record.has_value());
        REQUIRE_FALSE(record->remote.has_value());
        REQUIRE(http.requests.empty());
    }
}

TEST_CASE("Scanning twice gives the same report", "[ProjectScanner]") {
    TempDir temp;
    const fs::path web = temp.makeRepository("web");
    createTestFile(web / "package.json", R"({"dependencies": {"vue": "^3"}})");
    createTestFile(web / "src" / "main.js", "");
    const fs::path svc = temp.makeRepository("svc");
    createTestFile(svc / "go.mod", "module x\n\ngo 1.22\n\nrequire a v1\n");

    FakeCommandRunner runner;
    runner.respondCleanRepository("main", THREE_DAYS_AGO);
    ProjectAnalyzer analyzer(runner, nullptr);
    analyzer.setClock([] { return NOW; });

    auto first = ProjectWalker(temp.path(), analyzer).scanAll();
    auto second = ProjectWalker(temp.path(), analyzer).scanAll();

    REQUIRE(first.size() == 2);
    REQUIRE(reportToJson(first, temp.path(), NOW) == reportToJson(second, temp.path(), NOW));
}
