/**
 * @file api_types.h
 * @brief Result shapes shared by the CSID and submission clients
 *
 * Transport, HTTP and regulator validation failures all surface through
 * the same ApiMessage list; callers branch on success/status and inspect
 * message types, never on exceptions.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace zatca::api {

/// @brief Origin of a message
enum class MessageType {
    NETWORK,      ///< No HTTP response received
    FETCH_ERROR,  ///< Transport-level failure (timeout, refused, DNS)
    API,          ///< Response received but unusable (bad JSON, missing fields)
    HTTP,         ///< Non-2xx status without regulator messages
    ERROR,        ///< Regulator validation error
    WARNING,      ///< Regulator validation warning
    INFO,         ///< Regulator validation info
    VALIDATION    ///< Local pre-flight rejection (invoice data, expired credential)
};

std::string messageTypeToString(MessageType type);

/**
 * @brief Parse a regulator message type ("ERROR", "WARNING", "INFO", ...)
 * @return fallback for unknown values
 */
MessageType messageTypeFromString(const std::string& value, MessageType fallback);

struct ApiMessage {
    MessageType type = MessageType::ERROR;
    std::string code;
    std::string category;
    std::string message;
    std::string status;

    bool isTransportFailure() const {
        return type == MessageType::NETWORK || type == MessageType::FETCH_ERROR;
    }
};

/// @brief validationResults.status
enum class ValidationStatus {
    PASS,
    WARNING,
    ERROR
};

std::string validationStatusToString(ValidationStatus status);

/// @brief Unknown values map to ERROR
ValidationStatus validationStatusFromString(const std::string& value);

/**
 * @brief CSID credential pair
 *
 * Immutable once issued; expiry is known from tokenExpiry or the
 * certificate's notAfter.
 */
struct Credential {
    std::string requestId;
    std::string csid;      ///< binarySecurityToken
    std::string secret;
    std::optional<std::chrono::system_clock::time_point> expiresAt;

    bool isExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const {
        return expiresAt && *expiresAt <= now;
    }

    /// @brief "Basic base64(csid:secret)"
    std::string basicAuthorization() const;
};

struct CsidResult {
    bool success = false;
    Credential credential;
    std::string dispositionMessage;
    int httpStatus = 0;
    std::vector<ApiMessage> errors;
    std::vector<ApiMessage> warnings;
};

enum class SubmissionMode {
    CLEARANCE,
    REPORTING,
    COMPLIANCE
};

std::string submissionModeToString(SubmissionMode mode);

struct SubmissionResult {
    bool success = false;
    ValidationStatus status = ValidationStatus::ERROR;
    SubmissionMode mode = SubmissionMode::CLEARANCE;

    std::string invoiceHash;
    std::string clearanceStatus;
    std::string reportingStatus;
    std::optional<std::string> qrCode;
    std::optional<std::string> clearedInvoice;  ///< Base64 XML returned by clearance

    int httpStatus = 0;
    int attempts = 0;
    std::vector<ApiMessage> errors;
    std::vector<ApiMessage> warnings;
    std::vector<ApiMessage> infos;

    /**
     * @brief Whether the invoice may be marked legally cleared/reported
     *
     * False whenever any error entry is present, whatever status says.
     */
    bool isClearable() const {
        return success && status != ValidationStatus::ERROR && errors.empty();
    }

    bool requiresReview() const { return !warnings.empty(); }
};

} // namespace zatca::api
