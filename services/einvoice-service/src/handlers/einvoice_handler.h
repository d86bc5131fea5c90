#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>

#include "zatca/common/engine_config.h"

// Forward declarations
namespace zatca::api {
    class CsidClient;
}
namespace zatca::chain {
    class ChainSequencer;
}
namespace zatca::engine {
    class InvoiceProcessor;
}

namespace handlers {

/**
 * @brief E-invoicing endpoints handler
 *
 * - POST /api/einvoice/csr - Build a CSR signed with the service key
 * - POST /api/einvoice/csid/compliance - Request a compliance CSID (OTP)
 * - POST /api/einvoice/csid/production - Exchange a compliance CSID for a production CSID
 * - POST /api/einvoice/csid/renew - Renew a production CSID
 * - POST /api/einvoice/invoices/{mode} - Process an invoice (clearance | reporting | compliance)
 * - GET /api/einvoice/chain/{organizationId}/verify - Verify the ICV/PIH chain
 *
 * Credentials are supplied per request; the service never stores them.
 */
class EInvoiceHandler {
public:
    /**
     * @param invoiceProcessor Invoice processor (non-owning pointer)
     * @param csidClient CSID client (non-owning pointer)
     * @param chainSequencer Chain sequencer (non-owning pointer)
     * @param signingKeyPem PEM private key used to sign CSRs
     * @param environment Onboarding environment (CSR template name)
     */
    EInvoiceHandler(
        zatca::engine::InvoiceProcessor* invoiceProcessor,
        zatca::api::CsidClient* csidClient,
        zatca::chain::ChainSequencer* chainSequencer,
        std::string signingKeyPem,
        zatca::common::ZatcaEnvironment environment);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    zatca::engine::InvoiceProcessor* invoiceProcessor_;
    zatca::api::CsidClient* csidClient_;
    zatca::chain::ChainSequencer* chainSequencer_;
    std::string signingKeyPem_;
    zatca::common::ZatcaEnvironment environment_;

    /**
     * @brief POST /api/einvoice/csr
     *
     * Request body: CSR fields (commonName, serialNumber, organizationIdentifier,
     * organizationName, organizationUnitName?, countryName, invoiceType,
     * location, industry)
     *
     * Response: { "success": true, "csr": "<base64 PEM>" }
     */
    void handleCsr(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief POST /api/einvoice/csid/compliance
     *
     * Request body: { "csr": "...", "otp": "123456" }
     */
    void handleComplianceCsid(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief POST /api/einvoice/csid/production
     *
     * Request body: { "csid": "...", "secret": "...", "complianceRequestId": "..." }
     */
    void handleProductionCsid(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief POST /api/einvoice/csid/renew
     *
     * Request body: { "csid": "...", "secret": "...", "csr": "...", "otp": "..." }
     */
    void handleRenewCsid(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief POST /api/einvoice/invoices/{mode}
     *
     * Request body:
     * {
     *   "organizationId": "org-1",
     *   "credential": { "csid": "...", "secret": "...", "expiresAt": "2027-01-01T00:00:00Z" },
     *   "invoice": { ... }
     * }
     *
     * 200 accepted, 422 rejected (locally or by the regulator),
     * 503 when the submission outcome is unknown.
     */
    void handleInvoice(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& mode);

    /**
     * @brief GET /api/einvoice/chain/{organizationId}/verify
     */
    void handleVerifyChain(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& organizationId);

    static drogon::HttpResponsePtr errorResponse(drogon::HttpStatusCode code, const std::string& message);
};

} // namespace handlers
