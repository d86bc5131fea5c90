/**
 * @file drogon_http_transport.cpp
 * @brief Drogon-backed HTTP transport
 */

#include "drogon_http_transport.h"

#include <drogon/HttpClient.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <memory>
#include <regex>

namespace infrastructure {

using zatca::api::HttpMethod;
using zatca::api::TransportResult;

namespace {

drogon::HttpMethod toDrogonMethod(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return drogon::Get;
        case HttpMethod::PATCH: return drogon::Patch;
        case HttpMethod::POST: break;
    }
    return drogon::Post;
}

const char* reqResultName(drogon::ReqResult result) {
    switch (result) {
        case drogon::ReqResult::Ok: return "ok";
        case drogon::ReqResult::BadResponse: return "bad response";
        case drogon::ReqResult::NetworkFailure: return "network failure";
        case drogon::ReqResult::BadServerAddress: return "bad server address";
        case drogon::ReqResult::Timeout: return "timeout";
        case drogon::ReqResult::HandshakeError: return "TLS handshake error";
        case drogon::ReqResult::InvalidCertificate: return "invalid server certificate";
        default: break;
    }
    return "request failed";
}

} // anonymous namespace

TransportResult DrogonHttpTransport::send(const zatca::api::HttpRequest& request) {
    TransportResult result;

    std::string host = extractHost(request.url);
    std::string path = extractPath(request.url);
    if (host.empty()) {
        result.error = "invalid URL: " + request.url;
        spdlog::error("[DrogonHttpTransport] {}", result.error);
        return result;
    }

    spdlog::debug("[DrogonHttpTransport] {} {}{}", zatca::api::httpMethodToString(request.method), host, path);

    auto client = drogon::HttpClient::newHttpClient(host);

    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(toDrogonMethod(request.method));
    req->setPath(path);
    for (const auto& [name, value] : request.headers) {
        if (name == "Content-Type") {
            req->setContentTypeString(value);
        } else {
            req->addHeader(name, value);
        }
    }
    if (!request.body.empty()) {
        req->setBody(request.body);
    }

    // Shared so a late callback after our timeout still has a live promise
    auto promise = std::make_shared<std::promise<TransportResult>>();
    auto future = promise->get_future();

    client->sendRequest(
        req,
        [promise](drogon::ReqResult reqResult, const drogon::HttpResponsePtr& response) {
            TransportResult r;
            if (reqResult == drogon::ReqResult::Ok && response) {
                r.ok = true;
                r.response.statusCode = static_cast<int>(response->getStatusCode());
                r.response.body = std::string(response->getBody());
            } else {
                r.timedOut = (reqResult == drogon::ReqResult::Timeout);
                r.error = reqResultName(reqResult);
            }
            promise->set_value(std::move(r));
        },
        static_cast<double>(request.timeoutSeconds));

    // Grace period on top of the client timeout
    if (future.wait_for(std::chrono::seconds(request.timeoutSeconds + 5)) == std::future_status::timeout) {
        spdlog::error("[DrogonHttpTransport] Request timed out after {} seconds", request.timeoutSeconds);
        result.timedOut = true;
        result.error = "request timed out";
        return result;
    }

    result = future.get();
    if (result.ok) {
        spdlog::debug("[DrogonHttpTransport] HTTP {} ({} bytes)", result.response.statusCode, result.response.body.size());
    } else {
        spdlog::warn("[DrogonHttpTransport] Request failed: {}", result.error);
    }
    return result;
}

std::string DrogonHttpTransport::extractHost(const std::string& url) {
    // http://host, https://host, http://host:port, https://host:port
    std::regex hostRegex(R"(^(https?)://([^/:]+(?::\d+)?))");
    std::smatch match;

    if (std::regex_search(url, match, hostRegex)) {
        return match.str(1) + "://" + match.str(2);
    }
    return "";
}

std::string DrogonHttpTransport::extractPath(const std::string& url) {
    std::regex pathRegex(R"(^https?://[^/]+(/.*)?)");
    std::smatch match;

    if (std::regex_search(url, match, pathRegex)) {
        std::string path = match.str(1);
        return path.empty() ? "/" : path;
    }
    return "/";
}

} // namespace infrastructure
