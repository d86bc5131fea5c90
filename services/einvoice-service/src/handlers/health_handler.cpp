/** @file health_handler.cpp
 *  @brief HealthHandler implementation
 */

#include "health_handler.h"
#include <spdlog/spdlog.h>

namespace handlers {

HealthHandler::HealthHandler(
    std::function<Json::Value()> checkDatabase,
    std::function<std::string()> getCurrentTimestamp)
    : checkDatabase_(std::move(checkDatabase)),
      getCurrentTimestamp_(std::move(getCurrentTimestamp)) {

    if (!checkDatabase_ || !getCurrentTimestamp_) {
        throw std::invalid_argument("HealthHandler: health check functions cannot be nullptr");
    }

    spdlog::info("[HealthHandler] Initialized");
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /api/einvoice/health
    app.registerHandler(
        "/api/einvoice/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /api/einvoice/health/database
    app.registerHandler(
        "/api/einvoice/health/database",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleDatabaseHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[HealthHandler] Routes registered");
}

void HealthHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value result;
    result["service"] = "einvoice-service";
    result["status"] = "UP";
    result["version"] = "1.0.0";
    result["timestamp"] = getCurrentTimestamp_();

    callback(drogon::HttpResponse::newHttpJsonResponse(result));
}

void HealthHandler::handleDatabaseHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    spdlog::debug("GET /api/einvoice/health/database");
    auto result = checkDatabase_();
    auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
    if (result["status"].asString() != "UP") {
        resp->setStatusCode(drogon::k503ServiceUnavailable);
    }
    callback(resp);
}

} // namespace handlers
