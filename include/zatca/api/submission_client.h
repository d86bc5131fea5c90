/**
 * @file submission_client.h
 * @brief Invoice submission: clearance, reporting and compliance checks
 *
 * All modes POST {invoiceHash, uuid, invoice} with Basic auth and share
 * one response contract. Only transport failures are retried, and a retry
 * resends the identical request; validation errors are returned as-is.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "zatca/api/api_types.h"
#include "zatca/api/http_transport.h"
#include "zatca/api/wire_types.h"
#include "zatca/common/engine_config.h"

namespace zatca::api {

struct RetryPolicy {
    int maxRetries = 3;          ///< Retries after the first attempt
    int initialBackoffMs = 500;  ///< Doubled per retry
};

class SubmissionClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @param transport HTTP transport (non-owning, must outlive the client)
     * @param endpoints Regulator endpoint set
     * @param timeoutSeconds Per-request timeout
     * @param retry Transport retry policy
     */
    SubmissionClient(IHttpTransport* transport,
                     common::ApiEndpoints endpoints,
                     int timeoutSeconds = 30,
                     RetryPolicy retry = RetryPolicy{});

    /// @brief Synchronous clearance (standard invoices); header Clearance-Status: 1
    SubmissionResult submitForClearance(const InvoiceSubmissionRequest& request, const Credential& credential);

    /// @brief Reporting (simplified invoices); acknowledgment only
    SubmissionResult submitForReporting(const InvoiceSubmissionRequest& request, const Credential& credential);

    /// @brief Compliance-phase test invoice, authenticated with the compliance CSID
    SubmissionResult submitComplianceInvoice(const InvoiceSubmissionRequest& request, const Credential& credential);

    SubmissionResult submit(SubmissionMode mode, const InvoiceSubmissionRequest& request, const Credential& credential);

    /// @brief Replace the backoff sleep (tests)
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    /// @brief Replace the clock used for credential expiry checks (tests)
    void setClock(Clock clock) { clock_ = std::move(clock); }

private:
    HttpRequest buildRequest(SubmissionMode mode,
                             const InvoiceSubmissionRequest& request,
                             const Credential& credential) const;
    SubmissionResult mapResponse(SubmissionMode mode, const HttpResponse& response) const;

    IHttpTransport* transport_;
    common::ApiEndpoints endpoints_;
    int timeoutSeconds_;
    RetryPolicy retry_;
    Sleeper sleeper_;
    Clock clock_;
};

} // namespace zatca::api
