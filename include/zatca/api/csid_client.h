/**
 * @file csid_client.h
 * @brief CSID issuance: compliance (OTP-gated), production, renewal
 *
 * Two-step lifecycle: a compliance CSID is requested with a CSR and a
 * one-time code; a production CSID is then requested with the compliance
 * credential (Basic auth) and the compliance request id. Callers sequence
 * the steps and hold the issued credentials.
 */

#pragma once

#include <chrono>
#include <string>

#include "zatca/api/api_types.h"
#include "zatca/api/http_transport.h"
#include "zatca/common/engine_config.h"

namespace zatca::api {

class CsidClient {
public:
    /**
     * @param transport HTTP transport (non-owning, must outlive the client)
     * @param endpoints Regulator endpoint set
     * @param timeoutSeconds Per-request timeout
     */
    CsidClient(IHttpTransport* transport, common::ApiEndpoints endpoints, int timeoutSeconds = 30);

    /**
     * @brief POST {csr} to the compliance endpoint with an OTP header
     */
    CsidResult requestComplianceCsid(const std::string& csr, const std::string& otp);

    /**
     * @brief POST {complianceRequestId} to the production CSID endpoint
     *
     * Authenticates with the compliance credential.
     */
    CsidResult requestProductionCsid(const std::string& csid,
                                     const std::string& secret,
                                     const std::string& complianceRequestId);

    /**
     * @brief PATCH {csr} to the production CSID endpoint (OTP + Basic auth)
     */
    CsidResult renewProductionCsid(const std::string& csid,
                                   const std::string& secret,
                                   const std::string& csr,
                                   const std::string& otp);

    /**
     * @brief True when the credential expires within thresholdDays of now
     *
     * A credential without a known expiry never needs renewal.
     */
    static bool needsRenewal(const Credential& credential,
                             std::chrono::system_clock::time_point now,
                             int thresholdDays);

private:
    CsidResult execute(const HttpRequest& request, const char* operation);
    HttpRequest baseRequest(HttpMethod method, const std::string& url) const;

    IHttpTransport* transport_;
    common::ApiEndpoints endpoints_;
    int timeoutSeconds_;
};

} // namespace zatca::api
