#include "vcs_inspector.hpp"
#include "time_utils.hpp"
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace {

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string();
}

} // namespace

VcsInspector::VcsInspector(const CommandRunner& runner, std::chrono::seconds timeout)
    : runner_(runner), timeout_(timeout) {
}

CommandResult VcsInspector::git(const fs::path& repoPath, const std::vector<std::string>& args) const {
    std::vector<std::string> command = {"git", "-C", repoPath.string()};
    command.insert(command.end(), args.begin(), args.end());
    return runner_.run(command, timeout_);
}

std::optional<VcsInfo> VcsInspector::inspect(const fs::path& repoPath) const {
    try {
        return inspectWorkingCopy(repoPath);
    } catch (const std::runtime_error& e) {
        std::cerr << "Warning: git inspection failed for " << repoPath << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<VcsInfo> VcsInspector::inspectWorkingCopy(const fs::path& repoPath) const {
    VcsInfo info;

    auto branchResult = git(repoPath, {"branch", "--show-current"});
    if (!branchResult.succeeded()) {
        return std::nullopt;
    }
    std::string branch = trim(branchResult.output);
    info.branch = branch.empty() ? "main" : branch;

    auto logResult = git(repoPath, {"log", "-1", "--format=%ci"});
    if (!logResult.succeeded()) {
        return std::nullopt;
    }
    // An unparseable date leaves lastCommit empty instead of failing the inspection
    std::string commitDate = trim(logResult.output);
    if (!commitDate.empty()) {
        info.lastCommit = parseCommitTimestamp(commitDate);
    }

    auto statusResult = git(repoPath, {"status", "--porcelain"});
    if (!statusResult.succeeded()) {
        return std::nullopt;
    }
    info.uncommittedChanges = countStatusLines(statusResult.output);
    info.status = info.uncommittedChanges == 0 ? VcsStatus::Clean : VcsStatus::Dirty;

    info.remoteSync = remoteSyncStatus(repoPath);
    info.originUrl = originUrl(repoPath);

    return info;
}

int VcsInspector::countStatusLines(const std::string& porcelain) {
    std::istringstream stream(porcelain);
    std::string line;
    int count = 0;
    while (std::getline(stream, line)) {
        if (!trim(line).empty()) {
            ++count;
        }
    }
    return count;
}

RemoteSyncStatus VcsInspector::parseSyncCounts(const std::string& output) {
    std::istringstream stream(output);
    long behind = -1;
    long ahead = -1;
    if (!(stream >> behind >> ahead) || behind < 0 || ahead < 0) {
        return RemoteSyncStatus::Unknown;
    }
    return (behind == 0 && ahead == 0) ? RemoteSyncStatus::Clean : RemoteSyncStatus::Dirty;
}

RemoteSyncStatus VcsInspector::remoteSyncStatus(const fs::path& repoPath) const {
    try {
        auto result = git(repoPath, {"rev-list", "--left-right", "--count", "@{upstream}...HEAD"});
        if (!result.succeeded()) {
            return RemoteSyncStatus::Unknown;
        }
        return parseSyncCounts(result.output);
    } catch (const std::runtime_error&) {
        return RemoteSyncStatus::Unknown;
    }
}

std::optional<std::string> VcsInspector::originUrl(const fs::path& repoPath) const {
    CommandResult result;
    try {
        result = git(repoPath, {"remote", "get-url", "origin"});
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    if (!result.succeeded()) {
        return std::nullopt;
    }
    std::string url = trim(result.output);
    if (url.empty()) {
        return std::nullopt;
    }
    return url;
}
