/**
 * @file csid_client.cpp
 * @brief CSID issuance client
 */

#include "zatca/api/csid_client.h"
#include "zatca/api/response_mapper.h"
#include "zatca/api/wire_types.h"
#include "zatca/common/time_utils.h"
#include "zatca/crypto/certificate_utils.h"
#include "zatca/common/exceptions.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace zatca::api {

namespace {

/// tokenExpiry when present, otherwise the issued certificate's notAfter
std::optional<std::chrono::system_clock::time_point> resolveExpiry(const CsidResponse& response) {
    if (response.tokenExpiry) {
        if (auto tp = common::parseIso8601(*response.tokenExpiry)) {
            return tp;
        }
        spdlog::warn("[CsidClient] Unparseable tokenExpiry '{}', using certificate notAfter",
                     *response.tokenExpiry);
    }

    try {
        auto cert = crypto::parseBinarySecurityToken(response.binarySecurityToken);
        return crypto::certificateNotAfter(cert.get());
    } catch (const common::ParsingException& e) {
        spdlog::warn("[CsidClient] Cannot read certificate from binarySecurityToken: {}", e.what());
        return std::nullopt;
    }
}

} // namespace

CsidClient::CsidClient(IHttpTransport* transport, common::ApiEndpoints endpoints, int timeoutSeconds)
    : transport_(transport), endpoints_(std::move(endpoints)), timeoutSeconds_(timeoutSeconds) {
    if (!transport_) {
        throw std::invalid_argument("CsidClient: transport cannot be nullptr");
    }
}

HttpRequest CsidClient::baseRequest(HttpMethod method, const std::string& url) const {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.timeoutSeconds = timeoutSeconds_;
    request.headers["Accept"] = "application/json";
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept-Version"] = "V2";
    return request;
}

CsidResult CsidClient::requestComplianceCsid(const std::string& csr, const std::string& otp) {
    HttpRequest request = baseRequest(HttpMethod::POST, endpoints_.complianceApiUrl);
    request.headers["OTP"] = otp;
    request.body = toJsonString(ComplianceCsidRequest{csr}.toJson());
    return execute(request, "compliance CSID");
}

CsidResult CsidClient::requestProductionCsid(const std::string& csid,
                                             const std::string& secret,
                                             const std::string& complianceRequestId) {
    Credential compliance;
    compliance.csid = csid;
    compliance.secret = secret;

    HttpRequest request = baseRequest(HttpMethod::POST, endpoints_.productionCsidApiUrl);
    request.headers["Authorization"] = compliance.basicAuthorization();
    request.body = toJsonString(ProductionCsidRequest{complianceRequestId}.toJson());
    return execute(request, "production CSID");
}

CsidResult CsidClient::renewProductionCsid(const std::string& csid,
                                           const std::string& secret,
                                           const std::string& csr,
                                           const std::string& otp) {
    Credential current;
    current.csid = csid;
    current.secret = secret;

    HttpRequest request = baseRequest(HttpMethod::PATCH, endpoints_.productionCsidApiUrl);
    request.headers["Authorization"] = current.basicAuthorization();
    request.headers["OTP"] = otp;
    request.body = toJsonString(CsidRenewalRequest{csr}.toJson());
    return execute(request, "production CSID renewal");
}

bool CsidClient::needsRenewal(const Credential& credential,
                              std::chrono::system_clock::time_point now,
                              int thresholdDays) {
    if (!credential.expiresAt) return false;
    return *credential.expiresAt <= now + std::chrono::hours(24 * thresholdDays);
}

CsidResult CsidClient::execute(const HttpRequest& request, const char* operation) {
    spdlog::info("[CsidClient] Requesting {} ({} {})", operation,
                 httpMethodToString(request.method), request.url);

    CsidResult result;
    TransportResult transport = transport_->send(request);

    if (!transport.ok) {
        spdlog::error("[CsidClient] {} request failed: {}", operation, transport.error);
        result.errors.push_back(transportFailureMessage(transport));
        return result;
    }

    result.httpStatus = transport.response.statusCode;
    if (!transport.response.isSuccess()) {
        result.errors = httpErrorMessages(transport.response);
        spdlog::warn("[CsidClient] {} rejected: HTTP {} ({} errors)", operation,
                     result.httpStatus, result.errors.size());
        return result;
    }

    std::string parseError;
    auto json = parseJson(transport.response.body, &parseError);
    if (!json) {
        result.errors.push_back(invalidResponseMessage("Malformed JSON: " + parseError));
        return result;
    }

    auto response = CsidResponse::fromJson(*json, &parseError);
    if (!response) {
        result.errors.push_back(invalidResponseMessage(parseError));
        return result;
    }

    if (response->validationResults) {
        result.warnings = response->validationResults->warningMessages;
    }
    result.dispositionMessage = response->dispositionMessage;
    result.credential.requestId = response->requestId;
    result.credential.csid = response->binarySecurityToken;
    result.credential.secret = response->secret;
    result.credential.expiresAt = resolveExpiry(*response);
    result.success = true;

    spdlog::info("[CsidClient] {} issued (requestId={}, expiresAt={})", operation,
                 result.credential.requestId,
                 result.credential.expiresAt ? common::formatIso8601(*result.credential.expiresAt) : "unknown");
    return result;
}

} // namespace zatca::api
