/**
 * @file wire_types.cpp
 * @brief jsoncpp mapping of regulator bodies
 */

#include "zatca/api/wire_types.h"
#include "zatca/common/base64.h"

#include <memory>
#include <sstream>

namespace zatca::api {

namespace {

std::string stringField(const Json::Value& json, const char* name) {
    if (!json.isObject() || !json.isMember(name)) return "";
    const Json::Value& v = json[name];
    if (v.isString()) return v.asString();
    // requestID arrives as a JSON number
    if (v.isUInt64()) return std::to_string(v.asUInt64());
    if (v.isInt64()) return std::to_string(v.asInt64());
    return "";
}

std::optional<std::string> optionalString(const Json::Value& json, const char* name) {
    std::string value = stringField(json, name);
    if (value.empty()) return std::nullopt;
    return value;
}

std::vector<ApiMessage> parseMessages(const Json::Value& list, MessageType fallback) {
    std::vector<ApiMessage> messages;
    if (!list.isArray()) return messages;

    for (const auto& item : list) {
        ApiMessage msg;
        msg.type = messageTypeFromString(stringField(item, "type"), fallback);
        msg.code = stringField(item, "code");
        msg.category = stringField(item, "category");
        msg.message = stringField(item, "message");
        msg.status = stringField(item, "status");
        messages.push_back(std::move(msg));
    }
    return messages;
}

} // namespace

std::string toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::optional<Json::Value> parseJson(const std::string& body, std::string* error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        if (error) *error = errs;
        return std::nullopt;
    }
    return root;
}

Json::Value ComplianceCsidRequest::toJson() const {
    Json::Value json;
    json["csr"] = csr;
    return json;
}

Json::Value ProductionCsidRequest::toJson() const {
    Json::Value json;
    json["complianceRequestId"] = complianceRequestId;
    return json;
}

Json::Value CsidRenewalRequest::toJson() const {
    Json::Value json;
    json["csr"] = csr;
    return json;
}

InvoiceSubmissionRequest InvoiceSubmissionRequest::fromXml(const std::string& invoiceHash,
                                                           const std::string& uuid,
                                                           const std::string& xml) {
    InvoiceSubmissionRequest request;
    request.invoiceHash = invoiceHash;
    request.uuid = uuid;
    request.invoice = common::Base64::encode(xml);
    return request;
}

Json::Value InvoiceSubmissionRequest::toJson() const {
    Json::Value json;
    json["invoiceHash"] = invoiceHash;
    json["uuid"] = uuid;
    json["invoice"] = invoice;
    return json;
}

ValidationResults ValidationResults::fromJson(const Json::Value& json) {
    ValidationResults results;
    if (!json.isObject()) return results;

    std::string status = stringField(json, "status");
    if (!status.empty()) {
        results.status = validationStatusFromString(status);
        results.statusPresent = true;
    }
    results.infoMessages = parseMessages(json["infoMessages"], MessageType::INFO);
    results.warningMessages = parseMessages(json["warningMessages"], MessageType::WARNING);
    results.errorMessages = parseMessages(json["errorMessages"], MessageType::ERROR);
    return results;
}

std::optional<CsidResponse> CsidResponse::fromJson(const Json::Value& json, std::string* error) {
    CsidResponse response;
    response.requestId = stringField(json, "requestID");
    response.binarySecurityToken = stringField(json, "binarySecurityToken");
    response.secret = stringField(json, "secret");
    response.tokenExpiry = optionalString(json, "tokenExpiry");
    response.dispositionMessage = stringField(json, "dispositionMessage");
    if (json.isObject() && json.isMember("validationResults")) {
        response.validationResults = ValidationResults::fromJson(json["validationResults"]);
    }

    const char* missing = nullptr;
    if (response.requestId.empty()) missing = "requestID";
    else if (response.binarySecurityToken.empty()) missing = "binarySecurityToken";
    else if (response.secret.empty()) missing = "secret";

    if (missing) {
        if (error) *error = std::string("missing field ") + missing;
        return std::nullopt;
    }
    return response;
}

SubmissionResponse SubmissionResponse::fromJson(const Json::Value& json) {
    SubmissionResponse response;
    response.invoiceHash = stringField(json, "invoiceHash");
    response.clearanceStatus = stringField(json, "clearanceStatus");
    response.reportingStatus = stringField(json, "reportingStatus");
    response.clearedInvoice = optionalString(json, "clearedInvoice");
    if (!response.clearedInvoice) {
        response.clearedInvoice = optionalString(json, "signedInvoice");
    }
    response.qrCode = optionalString(json, "qrCode");
    if (json.isObject() && json.isMember("validationResults")) {
        response.validationResults = ValidationResults::fromJson(json["validationResults"]);
    }
    return response;
}

} // namespace zatca::api
