#include "dashboard_server.hpp"
#include "report_writer.hpp"
#include <drogon/drogon.h>
#include <iostream>
#include <ctime>
#include <stdexcept>
#include <utility>

DashboardServer::DashboardServer(const std::vector<ProjectRecord>& records,
                                 const fs::path& root,
                                 const TimePoint& generatedAt,
                                 DashboardOptions options)
    : options_(std::move(options)),
      indexHtml_(renderHtmlReport(records, root, generatedAt)),
      projectsJson_(reportToJson(records, root, generatedAt).dump()),
      projectCount_(records.size()) {
    if (options_.port <= 0 || options_.port > 65535) {
        throw std::invalid_argument("Invalid dashboard port: " + std::to_string(options_.port));
    }
    if (options_.threads == 0) {
        options_.threads = 1;
    }
}

void DashboardServer::registerRoutes() {
    auto& app = drogon::app();

    const std::string& html = indexHtml_;
    app.registerHandler(
        "/",
        [&html](const drogon::HttpRequestPtr&,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            auto resp = drogon::HttpResponse::newHttpResponse();
            resp->setStatusCode(drogon::k200OK);
            resp->setContentTypeCode(drogon::CT_TEXT_HTML);
            resp->setBody(html);
            callback(resp);
        },
        {drogon::Get}
    );

    // The report is already serialized with nlohmann::json; send it as-is
    const std::string& projects = projectsJson_;
    app.registerHandler(
        "/api/projects",
        [&projects](const drogon::HttpRequestPtr&,
                    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            auto resp = drogon::HttpResponse::newHttpResponse();
            resp->setStatusCode(drogon::k200OK);
            resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
            resp->setBody(projects);
            callback(resp);
        },
        {drogon::Get}
    );

    const size_t count = projectCount_;
    app.registerHandler(
        "/api/health",
        [count](const drogon::HttpRequestPtr&,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            Json::Value result;
            result["status"] = "ok";
            result["projects"] = static_cast<Json::UInt64>(count);
            result["timestamp"] = static_cast<Json::Int64>(time(nullptr));
            auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
            callback(resp);
        },
        {drogon::Get}
    );
}

void DashboardServer::run() {
    registerRoutes();

    auto& app = drogon::app()
        .setLogLevel(options_.verbose ? trantor::Logger::kDebug : trantor::Logger::kWarn)
        .addListener(options_.host, static_cast<uint16_t>(options_.port))
        .setThreadNum(options_.threads)
        .setIdleConnectionTimeout(60);

    if (!options_.logPath.empty()) {
        if (!fs::exists(options_.logPath)) {
            fs::create_directories(options_.logPath);
        }
        app.setLogPath(options_.logPath);
    }

    std::cout << "🌐 Dashboard available at http://" << options_.host << ":" << options_.port << std::endl;
    std::cout << "   Press Ctrl+C to stop" << std::endl;
    app.run();
}
