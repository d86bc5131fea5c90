#include "zatca/api/api_types.h"
#include "zatca/common/base64.h"

#include <algorithm>
#include <cctype>

namespace zatca::api {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

std::string messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::NETWORK:     return "NETWORK";
        case MessageType::FETCH_ERROR: return "FETCH_ERROR";
        case MessageType::API:         return "API";
        case MessageType::HTTP:        return "HTTP";
        case MessageType::ERROR:       return "ERROR";
        case MessageType::WARNING:     return "WARNING";
        case MessageType::INFO:        return "INFO";
        case MessageType::VALIDATION:  return "VALIDATION";
    }
    return "ERROR";
}

MessageType messageTypeFromString(const std::string& value, MessageType fallback) {
    std::string upper = toUpper(value);
    if (upper == "NETWORK") return MessageType::NETWORK;
    if (upper == "FETCH_ERROR") return MessageType::FETCH_ERROR;
    if (upper == "API") return MessageType::API;
    if (upper == "HTTP") return MessageType::HTTP;
    if (upper == "ERROR") return MessageType::ERROR;
    if (upper == "WARNING") return MessageType::WARNING;
    if (upper == "INFO") return MessageType::INFO;
    if (upper == "VALIDATION") return MessageType::VALIDATION;
    return fallback;
}

std::string validationStatusToString(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::PASS:    return "PASS";
        case ValidationStatus::WARNING: return "WARNING";
        case ValidationStatus::ERROR:   return "ERROR";
    }
    return "ERROR";
}

ValidationStatus validationStatusFromString(const std::string& value) {
    std::string upper = toUpper(value);
    if (upper == "PASS") return ValidationStatus::PASS;
    if (upper == "WARNING") return ValidationStatus::WARNING;
    return ValidationStatus::ERROR;
}

std::string Credential::basicAuthorization() const {
    return "Basic " + common::Base64::encode(csid + ":" + secret);
}

std::string submissionModeToString(SubmissionMode mode) {
    switch (mode) {
        case SubmissionMode::CLEARANCE:  return "clearance";
        case SubmissionMode::REPORTING:  return "reporting";
        case SubmissionMode::COMPLIANCE: return "compliance";
    }
    return "clearance";
}

} // namespace zatca::api
