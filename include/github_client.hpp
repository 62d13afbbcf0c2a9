#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include "http_client.hpp"
#include "project_record.hpp"

// Optional enrichment from the GitHub REST API.
// Failures are never reported to the caller: they leave RemoteInfo at its defaults.
class GitHubClient {
public:
    explicit GitHubClient(const HttpClient& http,
                          std::string token = "",
                          std::string apiBaseUrl = "https://api.github.com");

    // Extract "owner/repo" from an SSH (git@github.com:owner/repo.git) or
    // HTTPS (https://github.com/owner/repo.git) remote URL
    static std::optional<std::string> parseRepository(const std::string& remoteUrl);

    // Stars, open issues, open pull requests and last update for `repository`
    RemoteInfo fetch(const std::string& repository) const;

    // The repository endpoint's open issue count includes pull requests on GitHub;
    // turn this off for a provider that reports them separately
    void setIssuesIncludePullRequests(bool value) { issuesIncludePullRequests_ = value; }

    void setVerbose(bool verbose) { verbose_ = verbose; }

    std::vector<std::string> requestHeaders() const;

    static constexpr std::chrono::seconds REPOSITORY_TIMEOUT{10};
    static constexpr std::chrono::seconds PULLS_TIMEOUT{5};

private:
    const HttpClient& http_;
    std::string token_;
    std::string apiBaseUrl_;
    bool issuesIncludePullRequests_ = true;
    bool verbose_ = false;

    // Returns the open PR count, or std::nullopt when it cannot be determined
    std::optional<int> fetchOpenPullRequests(const std::string& repository) const;
};
