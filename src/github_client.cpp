#include "github_client.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(),
        [](unsigned char ch) { return std::isspace(ch); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string();
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int intField(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<int>();
}

} // namespace

GitHubClient::GitHubClient(const HttpClient& http, std::string token, std::string apiBaseUrl)
    : http_(http), token_(std::move(token)), apiBaseUrl_(std::move(apiBaseUrl)) {
}

std::optional<std::string> GitHubClient::parseRepository(const std::string& remoteUrl) {
    static const std::vector<std::string> prefixes = {
        "git@github.com:",
        "https://github.com/"
    };

    const std::string url = trim(remoteUrl);
    std::string repoPart;
    bool matched = false;
    for (const auto& prefix : prefixes) {
        if (url.compare(0, prefix.size(), prefix) == 0) {
            repoPart = url.substr(prefix.size());
            matched = true;
            break;
        }
    }
    if (!matched) {
        return std::nullopt;
    }

    while (endsWith(repoPart, "/")) {
        repoPart.pop_back();
    }
    if (endsWith(repoPart, ".git")) {
        repoPart.resize(repoPart.size() - 4);
    }

    // Must be exactly owner/repo
    auto slash = repoPart.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == repoPart.size() ||
        repoPart.find('/', slash + 1) != std::string::npos) {
        return std::nullopt;
    }

    return repoPart;
}

std::vector<std::string> GitHubClient::requestHeaders() const {
    std::vector<std::string> headers = {
        "User-Agent: ProjectHealthScanner/1.0",
        "Accept: application/vnd.github.v3+json"
    };
    if (!token_.empty()) {
        headers.push_back("Authorization: Bearer " + token_);
    }
    return headers;
}

RemoteInfo GitHubClient::fetch(const std::string& repository) const {
    RemoteInfo info;
    info.repository = repository;

    int rawOpenIssues = 0;
    try {
        auto response = http_.get(apiBaseUrl_ + "/repos/" + repository, requestHeaders(), REPOSITORY_TIMEOUT);
        if (response.status != 200) {
            if (verbose_) {
                std::cerr << "Warning: GitHub returned HTTP " << response.status
                          << " for " << repository << std::endl;
            }
            return info;
        }

        json data = json::parse(response.body);
        if (!data.is_object()) {
            return info;
        }

        info.stars = intField(data, "stargazers_count");
        rawOpenIssues = intField(data, "open_issues_count");

        auto updated = data.find("updated_at");
        if (updated != data.end() && updated->is_string()) {
            info.lastActivity = parseIsoTimestamp(updated->get<std::string>());
        }
    } catch (const std::exception& e) {
        if (verbose_) {
            std::cerr << "Warning: GitHub metadata unavailable for " << repository << ": " << e.what() << std::endl;
        }
        RemoteInfo defaults;
        defaults.repository = repository;
        return defaults;
    }

    auto openPullRequests = fetchOpenPullRequests(repository);
    if (openPullRequests) {
        info.openPullRequests = *openPullRequests;
        info.openIssues = issuesIncludePullRequests_
            ? std::max(0, rawOpenIssues - *openPullRequests)
            : rawOpenIssues;
    } else {
        info.openPullRequests = 0;
        info.openIssues = rawOpenIssues;
    }

    return info;
}

std::optional<int> GitHubClient::fetchOpenPullRequests(const std::string& repository) const {
    try {
        auto response = http_.get(apiBaseUrl_ + "/repos/" + repository + "/pulls?state=open&per_page=100",
                                  requestHeaders(), PULLS_TIMEOUT);
        if (response.status != 200) {
            return std::nullopt;
        }

        json data = json::parse(response.body);
        if (!data.is_array()) {
            return std::nullopt;
        }
        return static_cast<int>(data.size());
    } catch (const std::exception& e) {
        if (verbose_) {
            std::cerr << "Warning: open pull requests unavailable for " << repository << ": " << e.what() << std::endl;
        }
        return std::nullopt;
    }
}
