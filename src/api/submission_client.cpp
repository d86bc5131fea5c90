/**
 * @file submission_client.cpp
 * @brief Invoice submission client
 */

#include "zatca/api/submission_client.h"
#include "zatca/api/response_mapper.h"

#include <stdexcept>
#include <thread>
#include <spdlog/spdlog.h>

namespace zatca::api {

namespace {

std::string modeUrl(SubmissionMode mode, const common::ApiEndpoints& endpoints) {
    switch (mode) {
        case SubmissionMode::CLEARANCE:  return endpoints.clearanceApiUrl;
        case SubmissionMode::REPORTING:  return endpoints.reportingApiUrl;
        case SubmissionMode::COMPLIANCE: return endpoints.complianceApiUrl + "/invoices";
    }
    return endpoints.clearanceApiUrl;
}

SubmissionResult failure(SubmissionMode mode, ApiMessage message) {
    SubmissionResult result;
    result.mode = mode;
    result.status = ValidationStatus::ERROR;
    result.errors.push_back(std::move(message));
    return result;
}

} // namespace

SubmissionClient::SubmissionClient(IHttpTransport* transport,
                                   common::ApiEndpoints endpoints,
                                   int timeoutSeconds,
                                   RetryPolicy retry)
    : transport_(transport),
      endpoints_(std::move(endpoints)),
      timeoutSeconds_(timeoutSeconds),
      retry_(retry),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }),
      clock_([] { return std::chrono::system_clock::now(); }) {
    if (!transport_) {
        throw std::invalid_argument("SubmissionClient: transport cannot be nullptr");
    }
}

SubmissionResult SubmissionClient::submitForClearance(const InvoiceSubmissionRequest& request,
                                                      const Credential& credential) {
    return submit(SubmissionMode::CLEARANCE, request, credential);
}

SubmissionResult SubmissionClient::submitForReporting(const InvoiceSubmissionRequest& request,
                                                      const Credential& credential) {
    return submit(SubmissionMode::REPORTING, request, credential);
}

SubmissionResult SubmissionClient::submitComplianceInvoice(const InvoiceSubmissionRequest& request,
                                                           const Credential& credential) {
    return submit(SubmissionMode::COMPLIANCE, request, credential);
}

HttpRequest SubmissionClient::buildRequest(SubmissionMode mode,
                                           const InvoiceSubmissionRequest& request,
                                           const Credential& credential) const {
    HttpRequest http;
    http.method = HttpMethod::POST;
    http.url = modeUrl(mode, endpoints_);
    http.timeoutSeconds = timeoutSeconds_;
    http.headers["Accept"] = "application/json";
    http.headers["Content-Type"] = "application/json";
    http.headers["Accept-Version"] = "V2";
    http.headers["Accept-Language"] = "en";
    http.headers["Authorization"] = credential.basicAuthorization();
    if (mode == SubmissionMode::CLEARANCE) {
        http.headers["Clearance-Status"] = "1";
    }
    http.body = toJsonString(request.toJson());
    return http;
}

SubmissionResult SubmissionClient::submit(SubmissionMode mode,
                                          const InvoiceSubmissionRequest& request,
                                          const Credential& credential) {
    const std::string modeName = submissionModeToString(mode);

    if (credential.isExpired(clock_())) {
        spdlog::warn("[SubmissionClient] Refusing {} of {}: credential expired", modeName, request.uuid);
        return failure(mode, credentialExpiredMessage());
    }

    // Built once: every retry resends the same hash, UUID and body
    const HttpRequest http = buildRequest(mode, request, credential);

    TransportResult transport;
    int attempt = 0;
    auto backoff = std::chrono::milliseconds(retry_.initialBackoffMs);

    while (true) {
        attempt++;
        spdlog::info("[SubmissionClient] {} uuid={} attempt {}/{}", modeName, request.uuid,
                     attempt, retry_.maxRetries + 1);

        transport = transport_->send(http);
        if (transport.ok || attempt > retry_.maxRetries) {
            break;
        }

        spdlog::warn("[SubmissionClient] Transport failure ({}), retrying in {} ms",
                     transport.error, backoff.count());
        sleeper_(backoff);
        backoff *= 2;
    }

    if (!transport.ok) {
        spdlog::error("[SubmissionClient] {} uuid={} failed after {} attempts: {}",
                      modeName, request.uuid, attempt, transport.error);
        SubmissionResult result = failure(mode, transportFailureMessage(transport));
        result.invoiceHash = request.invoiceHash;
        result.attempts = attempt;
        return result;
    }

    SubmissionResult result = mapResponse(mode, transport.response);
    result.attempts = attempt;
    if (result.invoiceHash.empty()) {
        result.invoiceHash = request.invoiceHash;
    }

    spdlog::info("[SubmissionClient] {} uuid={} -> HTTP {} status={} (errors={}, warnings={})",
                 modeName, request.uuid, result.httpStatus,
                 validationStatusToString(result.status), result.errors.size(), result.warnings.size());
    return result;
}

SubmissionResult SubmissionClient::mapResponse(SubmissionMode mode, const HttpResponse& response) const {
    SubmissionResult result;
    result.mode = mode;
    result.httpStatus = response.statusCode;

    if (!response.isSuccess()) {
        result.status = ValidationStatus::ERROR;
        result.errors = httpErrorMessages(response);
        if (auto json = parseJson(response.body)) {
            if (json->isObject() && json->isMember("validationResults")) {
                auto validation = ValidationResults::fromJson((*json)["validationResults"]);
                result.warnings = validation.warningMessages;
                result.infos = validation.infoMessages;
            }
        }
        return result;
    }

    std::string parseError;
    auto json = parseJson(response.body, &parseError);
    if (!json || !json->isObject()) {
        result.status = ValidationStatus::ERROR;
        result.errors.push_back(invalidResponseMessage(
            json ? "Response body is not a JSON object" : "Malformed JSON: " + parseError));
        return result;
    }

    SubmissionResponse body = SubmissionResponse::fromJson(*json);
    result.invoiceHash = body.invoiceHash;
    result.clearanceStatus = body.clearanceStatus;
    result.reportingStatus = body.reportingStatus;
    result.qrCode = body.qrCode;
    if (mode == SubmissionMode::CLEARANCE || mode == SubmissionMode::COMPLIANCE) {
        result.clearedInvoice = body.clearedInvoice;
    }

    result.errors = body.validationResults.errorMessages;
    result.warnings = body.validationResults.warningMessages;
    result.infos = body.validationResults.infoMessages;

    if (!result.errors.empty()) {
        result.status = ValidationStatus::ERROR;
    } else if (body.validationResults.statusPresent) {
        result.status = body.validationResults.status;
    } else {
        result.status = result.warnings.empty() ? ValidationStatus::PASS : ValidationStatus::WARNING;
    }
    result.success = true;
    return result;
}

} // namespace zatca::api
