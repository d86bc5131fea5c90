#pragma once

/**
 * @file drogon_http_transport.h
 * @brief IHttpTransport on drogon's HttpClient
 *
 * Blocks the calling thread on a future until the response arrives or the
 * request timeout expires. Must not be called from the event loop that
 * runs the HTTP client.
 */

#include <string>

#include "zatca/api/http_transport.h"

namespace infrastructure {

class DrogonHttpTransport : public zatca::api::IHttpTransport {
public:
    zatca::api::TransportResult send(const zatca::api::HttpRequest& request) override;

    /// @brief "https://host[:port]" of an absolute URL, or empty
    static std::string extractHost(const std::string& url);

    /// @brief Path and query of an absolute URL ("/" when absent)
    static std::string extractPath(const std::string& url);
};

} // namespace infrastructure
