/**
 * @file http_transport.h
 * @brief HTTP transport seam for the regulator clients
 *
 * Implementations must not throw for network failures; they report them
 * through TransportResult so the clients can map them to NETWORK /
 * FETCH_ERROR messages.
 */

#pragma once

#include <map>
#include <string>

namespace zatca::api {

enum class HttpMethod {
    GET,
    POST,
    PATCH
};

const char* httpMethodToString(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::POST;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutSeconds = 30;

    /// @return header value, or empty string
    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }
};

struct HttpResponse {
    int statusCode = 0;
    std::string body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

struct TransportResult {
    bool ok = false;         ///< An HTTP response was received (any status)
    bool timedOut = false;
    HttpResponse response;
    std::string error;       ///< Transport failure description when !ok
};

/**
 * @brief Synchronous HTTP transport interface
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual TransportResult send(const HttpRequest& request) = 0;
};

} // namespace zatca::api
