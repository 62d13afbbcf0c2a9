#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <chrono>
#include "command_runner.hpp"
#include "project_record.hpp"

namespace fs = std::filesystem;

// Reads branch, last commit, working-tree and upstream state of a git working copy.
class VcsInspector {
public:
    explicit VcsInspector(const CommandRunner& runner,
                          std::chrono::seconds timeout = std::chrono::seconds(5));

    // Inspect a directory that contains `.git`.
    // Returns std::nullopt when any of the branch, log or status calls times out or
    // exits non-zero; the upstream and origin lookups only degrade their own fields.
    std::optional<VcsInfo> inspect(const fs::path& repoPath) const;

    // Number of non-empty lines in `git status --porcelain` output
    static int countStatusLines(const std::string& porcelain);

    // Interpret `git rev-list --left-right --count` output ("<behind>\t<ahead>")
    static RemoteSyncStatus parseSyncCounts(const std::string& output);

private:
    const CommandRunner& runner_;
    std::chrono::seconds timeout_;

    std::optional<VcsInfo> inspectWorkingCopy(const fs::path& repoPath) const;
    CommandResult git(const fs::path& repoPath, const std::vector<std::string>& args) const;
    RemoteSyncStatus remoteSyncStatus(const fs::path& repoPath) const;
    std::optional<std::string> originUrl(const fs::path& repoPath) const;
};
