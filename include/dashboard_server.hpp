#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "project_record.hpp"

namespace fs = std::filesystem;

struct DashboardOptions {
    std::string host = "127.0.0.1";
    int port = 8042;
    size_t threads = 1;
    std::string logPath;        // Drogon log directory; empty logs to stdout
    bool verbose = false;
};

// Serves a finished scan over HTTP:
//   GET /              HTML dashboard
//   GET /api/projects  JSON report
//   GET /api/health    liveness probe
// The records are rendered once at construction and never change afterwards.
class DashboardServer {
public:
    DashboardServer(const std::vector<ProjectRecord>& records,
                    const fs::path& root,
                    const TimePoint& generatedAt,
                    DashboardOptions options = DashboardOptions());

    // Blocks until the process receives SIGINT/SIGTERM
    void run();

    const std::string& indexHtml() const { return indexHtml_; }
    const std::string& projectsJson() const { return projectsJson_; }
    size_t projectCount() const { return projectCount_; }

private:
    DashboardOptions options_;
    std::string indexHtml_;
    std::string projectsJson_;
    size_t projectCount_;

    void registerRoutes();
};
