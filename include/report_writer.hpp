#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "project_record.hpp"

namespace fs = std::filesystem;

struct ScanSummary {
    size_t total = 0;
    size_t healthy = 0;
    size_t warning = 0;
    size_t unhealthy = 0;
};

ScanSummary summarize(const std::vector<ProjectRecord>& records);

// Score with one decimal, e.g. "8.4"
std::string formatScore(double score);

// Serialized record; optional fields become null and timestamps ISO-8601 UTC strings
nlohmann::json toJson(const ProjectRecord& record);

// Full report document: generation time, root, projects and summary counts
nlohmann::json reportToJson(const std::vector<ProjectRecord>& records,
                            const fs::path& root,
                            const TimePoint& generatedAt);

// Summary block printed after a scan
std::string formatSummary(const ScanSummary& summary);

// Per-project details, highest score first
std::string formatTextReport(const std::vector<ProjectRecord>& records, const TimePoint& now);

// Self-contained HTML page with the project table and the JSON data embedded
std::string renderHtmlReport(const std::vector<ProjectRecord>& records,
                             const fs::path& root,
                             const TimePoint& generatedAt);

// Write `content` to `outputPath`; throws std::runtime_error on failure
void writeTextFile(const fs::path& outputPath, const std::string& content);
