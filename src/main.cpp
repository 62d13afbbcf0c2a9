#include <iostream>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <CLI/CLI.hpp>
#include <curl/curl.h>
#include "command_runner.hpp"
#include "config_loader.hpp"
#include "dashboard_server.hpp"
#include "github_client.hpp"
#include "http_client.hpp"
#include "project_scanner.hpp"
#include "report_writer.hpp"

namespace {

// Expand a leading "~" to $HOME
fs::path expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return fs::path(home + path.substr(1));
}

// Keeps libcurl's global state alive for the duration of main
struct CurlGlobal {
    CurlGlobal() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace

int main(int argc, char** argv) {
    try {
        CLI::App app{"repohealth - Scan a directory of git repositories and score their health"};

        ScanOptions options;
        std::string scanDir = "~/Programming";
        std::string configPath;
        std::string jsonOutput;
        std::string htmlOutput;
        bool noRemote = false;
        bool analyzeOnly = false;
        DashboardOptions dashboard;

        app.add_option("-s,--scan", scanDir, "Directory whose child repositories are scanned (default: ~/Programming)");

        app.add_option("--github-token", options.githubToken, "GitHub token for API requests")
            ->envname("GITHUB_TOKEN");

        app.add_flag("--no-remote", noRemote, "Skip GitHub metadata");

        app.add_flag("--analyze-only", analyzeOnly, "Print the detailed report and exit");

        app.add_option("--output-json", jsonOutput, "Write the JSON report to this file");
        app.add_option("--output-html", htmlOutput, "Write a static HTML report to this file");

        app.add_option("--config", configPath, "JSON file overriding scoring and quality constants")
            ->check(CLI::ExistingFile);

        // Dashboard options
        auto serverGroup = app.add_option_group("Dashboard Options");
        serverGroup->add_option("--port", dashboard.port, "Dashboard port (default: 8042)")
            ->check(CLI::Range(1, 65535));
        serverGroup->add_option("--host", dashboard.host, "Dashboard bind address (default: 127.0.0.1)");
        serverGroup->add_option("--threads", dashboard.threads, "Dashboard worker threads (default: 1)")
            ->check(CLI::Range(size_t(1), size_t(32)));
        serverGroup->add_option("--log-path", dashboard.logPath, "Directory for dashboard logs (default: stdout)");

        app.add_flag("-v,--verbose", options.verbose, "Enable verbose output");

        CLI11_PARSE(app, argc, argv);

        options.rootDir = expandHome(scanDir);
        options.fetchRemote = !noRemote;
        dashboard.verbose = options.verbose;
        if (!configPath.empty()) {
            options.config = loadConfigFile(configPath);
            if (options.verbose) {
                std::cout << "Loaded configuration from " << configPath << std::endl;
            }
        }

        std::cout << "🏥 Project Health Scanner" << std::endl;
        std::cout << std::string(50, '=') << std::endl;

        CurlGlobal curl;
        ShellCommandRunner runner;
        CurlHttpClient http;
        std::unique_ptr<GitHubClient> github;
        if (options.fetchRemote) {
            github = std::make_unique<GitHubClient>(http, options.githubToken);
            github->setVerbose(options.verbose);
            if (options.verbose && options.githubToken.empty()) {
                std::cout << "No GitHub token set; unauthenticated API rate limits apply" << std::endl;
            }
        }

        ProjectAnalyzer analyzer(runner, github.get(), options.config);
        analyzer.setVerbose(options.verbose);

        ProjectWalker walker(options.rootDir, analyzer);
        auto projects = walker.scanAll();
        auto generatedAt = std::chrono::system_clock::now();

        if (projects.empty()) {
            std::cout << "No projects found!" << std::endl;
            return 1;
        }

        std::cout << std::endl << formatSummary(summarize(projects));

        if (!jsonOutput.empty()) {
            writeTextFile(jsonOutput, reportToJson(projects, walker.root(), generatedAt).dump(2));
            std::cout << "💾 JSON report written to " << jsonOutput << std::endl;
        }

        if (!htmlOutput.empty()) {
            writeTextFile(htmlOutput, renderHtmlReport(projects, walker.root(), generatedAt));
            std::cout << "💾 HTML report written to " << htmlOutput << std::endl;
        }

        if (analyzeOnly) {
            std::cout << std::endl << formatTextReport(projects, generatedAt);
            return 0;
        }

        if (!jsonOutput.empty() || !htmlOutput.empty()) {
            return 0;
        }

        std::cout << std::endl;
        DashboardServer server(projects, walker.root(), generatedAt, dashboard);
        server.run();

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
