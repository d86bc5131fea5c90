#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>

namespace handlers {

/**
 * @brief Health check endpoints handler
 *
 * - GET /api/einvoice/health - Application health check
 * - GET /api/einvoice/health/database - Database connectivity check
 */
class HealthHandler {
public:
    /**
     * @param checkDatabase Function that returns database health as Json::Value
     * @param getCurrentTimestamp Function that returns current timestamp string
     */
    HealthHandler(
        std::function<Json::Value()> checkDatabase,
        std::function<std::string()> getCurrentTimestamp);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    std::function<Json::Value()> checkDatabase_;
    std::function<std::string()> getCurrentTimestamp_;

    /**
     * @brief GET /api/einvoice/health
     *
     * Response:
     * {
     *   "service": "einvoice-service",
     *   "status": "UP",
     *   "version": "1.0.0",
     *   "timestamp": "2026-02-17T10:00:00Z"
     * }
     */
    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief GET /api/einvoice/health/database
     *
     * 503 when the pool has no healthy connection.
     */
    void handleDatabaseHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
