/**
 * @file wire_types.h
 * @brief Regulator request/response bodies with JSON mapping (jsoncpp)
 *
 * Response parsers tolerate absent optional fields and report missing
 * required ones through the error string instead of throwing.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <json/json.h>

#include "zatca/api/api_types.h"

namespace zatca::api {

/// @brief Compact (single-line) JSON serialization
std::string toJsonString(const Json::Value& value);

/**
 * @brief Parse a JSON document
 * @return std::nullopt on syntax error (reason in error)
 */
std::optional<Json::Value> parseJson(const std::string& body, std::string* error = nullptr);

struct ComplianceCsidRequest {
    std::string csr;

    Json::Value toJson() const;
};

struct ProductionCsidRequest {
    std::string complianceRequestId;

    Json::Value toJson() const;
};

struct CsidRenewalRequest {
    std::string csr;

    Json::Value toJson() const;
};

/**
 * @brief Body of all three invoice submission modes
 *
 * Built once per invoice and resent unchanged on retry.
 */
struct InvoiceSubmissionRequest {
    std::string invoiceHash;
    std::string uuid;
    std::string invoice;     ///< Base64 of the invoice XML

    static InvoiceSubmissionRequest fromXml(const std::string& invoiceHash,
                                            const std::string& uuid,
                                            const std::string& xml);

    Json::Value toJson() const;
};

struct ValidationResults {
    ValidationStatus status = ValidationStatus::PASS;
    bool statusPresent = false;
    std::vector<ApiMessage> infoMessages;
    std::vector<ApiMessage> warningMessages;
    std::vector<ApiMessage> errorMessages;

    static ValidationResults fromJson(const Json::Value& json);
};

struct CsidResponse {
    std::string requestId;
    std::string binarySecurityToken;
    std::string secret;
    std::optional<std::string> tokenExpiry;
    std::string dispositionMessage;
    std::optional<ValidationResults> validationResults;

    /**
     * @return std::nullopt if requestID, binarySecurityToken or secret is missing
     */
    static std::optional<CsidResponse> fromJson(const Json::Value& json, std::string* error = nullptr);
};

struct SubmissionResponse {
    std::string invoiceHash;
    std::string clearanceStatus;
    std::string reportingStatus;
    std::optional<std::string> clearedInvoice;
    std::optional<std::string> qrCode;
    ValidationResults validationResults;

    static SubmissionResponse fromJson(const Json::Value& json);
};

} // namespace zatca::api
