#include "report_writer.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

json optionalTime(const std::optional<TimePoint>& time) {
    return time ? json(formatIsoTimestamp(*time)) : json(nullptr);
}

std::string escapeHtml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string statusEmoji(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:
            return "✅";
        case HealthStatus::Warning:
            return "⚠️";
        case HealthStatus::Unhealthy:
            break;
    }
    return "❌";
}

std::string joinStrings(const std::vector<std::string>& values, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += values[i];
    }
    return joined;
}

std::vector<ProjectRecord> sortedByScore(const std::vector<ProjectRecord>& records) {
    std::vector<ProjectRecord> sorted = records;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const ProjectRecord& a, const ProjectRecord& b) {
            return a.healthScore > b.healthScore;
        });
    return sorted;
}

} // namespace

ScanSummary summarize(const std::vector<ProjectRecord>& records) {
    ScanSummary summary;
    summary.total = records.size();
    for (const auto& record : records) {
        switch (record.status) {
            case HealthStatus::Healthy:
                summary.healthy++;
                break;
            case HealthStatus::Warning:
                summary.warning++;
                break;
            case HealthStatus::Unhealthy:
                summary.unhealthy++;
                break;
        }
    }
    return summary;
}

std::string formatScore(double score) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << score;
    return ss.str();
}

json toJson(const ProjectRecord& record) {
    json result;
    result["name"] = record.name;
    result["path"] = record.path;

    result["vcs"] = {
        {"status", toString(record.vcs.status)},
        {"last_commit", optionalTime(record.vcs.lastCommit)},
        {"uncommitted_changes", record.vcs.uncommittedChanges},
        {"branch", record.vcs.branch},
        {"remote_sync", toString(record.vcs.remoteSync)},
        {"origin_url", record.vcs.originUrl ? json(*record.vcs.originUrl) : json(nullptr)}
    };

    result["languages"] = record.languages;

    json counts = json::object();
    for (const auto& [ecosystem, count] : record.dependencies.counts) {
        counts[ecosystem] = count;
    }
    result["dependencies"] = {
        {"has_dependencies", record.dependencies.hasDependencies},
        {"ecosystem_languages", record.dependencies.ecosystemLanguages},
        {"counts", counts},
        {"details", record.dependencies.details},
        {"summary", record.dependencies.summary()}
    };

    const auto& quality = record.quality;
    result["quality"] = {
        {"has_readme", quality.hasReadme},
        {"readme_quality", quality.readmeQuality},
        {"has_tests", quality.hasTests},
        {"test_coverage", quality.testCoverage},
        {"has_ci", quality.hasCi},
        {"ci_type", quality.ciType},
        {"has_documentation", quality.hasDocumentation},
        {"quality_tools", quality.qualityTools},
        {"structure_score", quality.structureScore}
    };

    if (record.remote) {
        const auto& remote = *record.remote;
        result["remote"] = {
            {"repository", remote.repository},
            {"stars", remote.stars},
            {"open_issues", remote.openIssues},
            {"open_prs", remote.openPullRequests},
            {"last_activity", optionalTime(remote.lastActivity)},
            {"workflow_status", remote.workflowStatus}
        };
    } else {
        result["remote"] = nullptr;
    }

    result["health_score"] = record.healthScore;
    result["status"] = toString(record.status);

    json breakdown = json::object();
    for (const auto& [rule, delta] : record.scoreBreakdown) {
        breakdown[rule] = delta;
    }
    result["score_breakdown"] = breakdown;

    return result;
}

json reportToJson(const std::vector<ProjectRecord>& records,
                  const fs::path& root,
                  const TimePoint& generatedAt) {
    json report;
    report["generated_at"] = formatIsoTimestamp(generatedAt);
    report["root"] = root.string();

    json projects = json::array();
    for (const auto& record : records) {
        projects.push_back(toJson(record));
    }
    report["projects"] = projects;

    auto summary = summarize(records);
    report["summary"] = {
        {"total", summary.total},
        {"healthy", summary.healthy},
        {"warning", summary.warning},
        {"unhealthy", summary.unhealthy}
    };

    return report;
}

std::string formatSummary(const ScanSummary& summary) {
    std::stringstream ss;
    ss << "📊 Analysis Complete!" << std::endl;
    ss << "   Total projects: " << summary.total << std::endl;
    ss << "   Healthy (8-10): " << summary.healthy << std::endl;
    ss << "   Warning (5-8):  " << summary.warning << std::endl;
    ss << "   Unhealthy (0-5): " << summary.unhealthy << std::endl;
    return ss.str();
}

std::string formatTextReport(const std::vector<ProjectRecord>& records, const TimePoint& now) {
    std::stringstream ss;
    ss << "📋 Project Details:" << std::endl;
    ss << std::string(80, '=') << std::endl;

    for (const auto& project : sortedByScore(records)) {
        ss << statusEmoji(project.status) << " " << project.name
           << " (" << formatScore(project.healthScore) << "/10)" << std::endl;
        ss << "   📂 " << project.path << std::endl;
        ss << "   🌿 Branch: " << project.vcs.branch << std::endl;
        if (project.vcs.lastCommit) {
            ss << "   📅 Last commit: " << formatDate(*project.vcs.lastCommit)
               << " (" << daysBetween(*project.vcs.lastCommit, now) << " days ago)" << std::endl;
        }
        ss << "   📝 Uncommitted changes: " << project.vcs.uncommittedChanges << std::endl;
        ss << "   💻 Languages: "
           << (project.languages.empty() ? "None detected" : joinStrings(project.languages, ", ")) << std::endl;
        ss << "   📦 Dependencies: " << project.dependencies.summary() << std::endl;

        if (project.remote) {
            const auto& remote = *project.remote;
            ss << "   🐙 GitHub: " << remote.repository << std::endl;
            if (remote.stars > 0) {
                ss << "   ⭐ Stars: " << remote.stars << std::endl;
            }
            if (remote.openIssues > 0 || remote.openPullRequests > 0) {
                ss << "   🐛 Issues: " << remote.openIssues << " | 🔄 PRs: " << remote.openPullRequests << std::endl;
            }
            if (remote.lastActivity) {
                ss << "   📡 GitHub activity: " << formatDate(*remote.lastActivity)
                   << " (" << daysBetween(*remote.lastActivity, now) << " days ago)" << std::endl;
            }
        }

        ss << std::endl;
    }

    return ss.str();
}

std::string renderHtmlReport(const std::vector<ProjectRecord>& records,
                             const fs::path& root,
                             const TimePoint& generatedAt) {
    auto summary = summarize(records);

    // Keep "</script>" sequences in string values from closing the data block
    std::string data = reportToJson(records, root, generatedAt).dump();
    std::string safeData;
    safeData.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        if (data[i] == '<' && i + 1 < data.size() && data[i + 1] == '/') {
            safeData += "<\\";
        } else {
            safeData += data[i];
        }
    }

    std::stringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n";
    html << "<meta charset=\"utf-8\">\n<title>Project Health Scanner</title>\n";
    html << "<style>\n"
         << "body { font-family: -apple-system, BlinkMacSystemFont, sans-serif; margin: 0; padding: 20px; background: #f5f5f7; }\n"
         << ".cards { display: flex; gap: 16px; margin-bottom: 20px; }\n"
         << ".card { background: #fff; border-radius: 8px; padding: 16px 24px; box-shadow: 0 1px 3px rgba(0,0,0,0.1); }\n"
         << "table { width: 100%; border-collapse: collapse; background: #fff; }\n"
         << "th, td { padding: 8px 12px; border-bottom: 1px solid #eee; text-align: left; }\n"
         << ".healthy { color: #1a7f37; } .warning { color: #9a6700; } .unhealthy { color: #cf222e; }\n"
         << "</style>\n</head>\n<body>\n";

    html << "<h1>🏥 Project Health Scanner</h1>\n";
    html << "<p>" << escapeHtml(root.string()) << " &middot; generated "
         << formatIsoTimestamp(generatedAt) << "</p>\n";

    html << "<div class=\"cards\">\n";
    html << "<div class=\"card\"><h3>Total</h3><p>" << summary.total << "</p></div>\n";
    html << "<div class=\"card healthy\"><h3>Healthy</h3><p>" << summary.healthy << "</p></div>\n";
    html << "<div class=\"card warning\"><h3>Warning</h3><p>" << summary.warning << "</p></div>\n";
    html << "<div class=\"card unhealthy\"><h3>Unhealthy</h3><p>" << summary.unhealthy << "</p></div>\n";
    html << "</div>\n";

    html << "<table>\n<thead><tr>"
         << "<th>Project</th><th>Score</th><th>Branch</th><th>Last commit</th>"
         << "<th>Changes</th><th>Languages</th><th>Dependencies</th><th>GitHub</th>"
         << "</tr></thead>\n<tbody>\n";

    for (const auto& project : sortedByScore(records)) {
        const std::string statusClass = toString(project.status);
        html << "<tr>";
        html << "<td title=\"" << escapeHtml(project.path) << "\">" << escapeHtml(project.name) << "</td>";
        html << "<td class=\"" << statusClass << "\">" << formatScore(project.healthScore) << "</td>";
        html << "<td>" << escapeHtml(project.vcs.branch) << "</td>";
        html << "<td>" << (project.vcs.lastCommit ? formatDate(*project.vcs.lastCommit) : "-") << "</td>";
        html << "<td>" << project.vcs.uncommittedChanges << "</td>";
        html << "<td>" << escapeHtml(joinStrings(project.languages, ", ")) << "</td>";
        html << "<td>" << escapeHtml(project.dependencies.summary()) << "</td>";
        if (project.remote) {
            html << "<td>" << escapeHtml(project.remote->repository)
                 << " ⭐ " << project.remote->stars
                 << " 🐛 " << project.remote->openIssues
                 << " 🔄 " << project.remote->openPullRequests << "</td>";
        } else {
            html << "<td>-</td>";
        }
        html << "</tr>\n";
    }

    html << "</tbody>\n</table>\n";
    html << "<script type=\"application/json\" id=\"project-data\">" << safeData << "</script>\n";
    html << "</body>\n</html>\n";

    return html.str();
}

void writeTextFile(const fs::path& outputPath, const std::string& content) {
    std::ofstream outFile(outputPath);
    if (!outFile) {
        throw std::runtime_error("Could not open output file: " + outputPath.string());
    }
    outFile << content;
    if (!outFile) {
        throw std::runtime_error("Failed to write output file: " + outputPath.string());
    }
}
