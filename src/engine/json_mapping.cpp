/**
 * @file json_mapping.cpp
 * @brief JSON mapping for the REST boundary
 */

#include "zatca/engine/json_mapping.h"
#include "zatca/common/exceptions.h"
#include "zatca/common/time_utils.h"

namespace zatca::engine {

using common::ParsingException;

namespace {

std::string requireString(const Json::Value& json, const char* field) {
    if (!json.isMember(field)) return "";
    if (!json[field].isString()) {
        throw ParsingException(std::string("field '") + field + "' must be a string");
    }
    return json[field].asString();
}

double requireNumber(const Json::Value& json, const char* field, double fallback) {
    if (!json.isMember(field)) return fallback;
    if (!json[field].isNumeric()) {
        throw ParsingException(std::string("field '") + field + "' must be a number");
    }
    return json[field].asDouble();
}

invoice::Party partyFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw ParsingException("party must be an object");
    }

    invoice::Party party;
    party.name = requireString(json, "name");
    party.vatNumber = requireString(json, "vatNumber");
    std::string crn = requireString(json, "crn");
    if (!crn.empty()) party.crn = crn;

    if (json.isMember("address")) {
        const Json::Value& a = json["address"];
        if (!a.isObject()) {
            throw ParsingException("address must be an object");
        }
        party.address.street = requireString(a, "street");
        party.address.buildingNumber = requireString(a, "buildingNumber");
        party.address.city = requireString(a, "city");
        party.address.postalCode = requireString(a, "postalCode");
        party.address.district = requireString(a, "district");
        std::string country = requireString(a, "country");
        if (!country.empty()) party.address.country = country;
    }
    return party;
}

Json::Value messagesToJson(const std::vector<api::ApiMessage>& messages) {
    Json::Value array = Json::arrayValue;
    for (const auto& m : messages) {
        array.append(toJson(m));
    }
    return array;
}

} // namespace

invoice::InvoiceRequest invoiceRequestFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw ParsingException("invoice must be an object");
    }

    invoice::InvoiceRequest request;
    request.invoiceNumber = requireString(json, "invoiceNumber");
    request.uuid = requireString(json, "uuid");
    request.issueDate = requireString(json, "issueDate");
    request.issueTime = requireString(json, "issueTime");

    std::string typeCode = requireString(json, "invoiceTypeCode");
    if (!typeCode.empty()) request.typeCode = typeCode;

    std::string kind = requireString(json, "kind");
    request.kind = (kind == "simplified") ? invoice::InvoiceKind::SIMPLIFIED
                                          : invoice::InvoiceKind::STANDARD;

    std::string currency = requireString(json, "currency");
    if (!currency.empty()) request.currency = currency;

    if (json.isMember("seller")) {
        request.seller = partyFromJson(json["seller"]);
    }
    if (json.isMember("buyer") && !json["buyer"].isNull()) {
        request.buyer = partyFromJson(json["buyer"]);
    }

    if (json.isMember("lineItems")) {
        if (!json["lineItems"].isArray()) {
            throw ParsingException("lineItems must be an array");
        }
        for (const auto& item : json["lineItems"]) {
            if (!item.isObject()) {
                throw ParsingException("lineItems entries must be objects");
            }
            invoice::LineItem line;
            line.name = requireString(item, "name");
            line.quantity = requireNumber(item, "quantity", 0.0);
            line.unitPrice = requireNumber(item, "unitPrice", 0.0);
            line.vatRate = requireNumber(item, "vatRate", 15.0);
            request.lineItems.push_back(std::move(line));
        }
    }

    if (json.isMember("billingReference") && json["billingReference"].isObject()) {
        invoice::BillingReference ref;
        ref.invoiceNumber = requireString(json["billingReference"], "invoiceNumber");
        ref.reason = requireString(json["billingReference"], "reason");
        request.billingReference = ref;
    }
    return request;
}

api::Credential credentialFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw ParsingException("credential must be an object");
    }

    api::Credential credential;
    credential.requestId = requireString(json, "requestId");
    credential.csid = requireString(json, "csid");
    credential.secret = requireString(json, "secret");

    std::string expiresAt = requireString(json, "expiresAt");
    if (!expiresAt.empty()) {
        credential.expiresAt = common::parseIso8601(expiresAt);
        if (!credential.expiresAt) {
            throw ParsingException("expiresAt is not ISO 8601: " + expiresAt);
        }
    }
    return credential;
}

crypto::CsrConfig csrConfigFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw ParsingException("CSR config must be an object");
    }

    crypto::CsrConfig config;
    config.commonName = requireString(json, "commonName");
    config.serialNumber = requireString(json, "serialNumber");
    config.organizationIdentifier = requireString(json, "organizationIdentifier");
    config.organizationName = requireString(json, "organizationName");
    std::string unit = requireString(json, "organizationUnitName");
    if (!unit.empty()) config.organizationUnitName = unit;
    config.countryName = requireString(json, "countryName");
    config.invoiceType = requireString(json, "invoiceType");
    config.location = requireString(json, "location");
    config.industry = requireString(json, "industry");
    return config;
}

Json::Value toJson(const api::ApiMessage& message) {
    Json::Value json;
    json["type"] = api::messageTypeToString(message.type);
    json["code"] = message.code;
    json["category"] = message.category;
    json["message"] = message.message;
    json["status"] = message.status;
    return json;
}

Json::Value toJson(const api::SubmissionResult& result) {
    Json::Value json;
    json["success"] = result.success;
    json["status"] = api::validationStatusToString(result.status);
    json["mode"] = api::submissionModeToString(result.mode);
    json["invoiceHash"] = result.invoiceHash;
    if (!result.clearanceStatus.empty()) json["clearanceStatus"] = result.clearanceStatus;
    if (!result.reportingStatus.empty()) json["reportingStatus"] = result.reportingStatus;
    if (result.qrCode) json["qrCode"] = *result.qrCode;
    if (result.clearedInvoice) json["clearedInvoice"] = *result.clearedInvoice;
    json["httpStatus"] = result.httpStatus;
    json["attempts"] = result.attempts;
    json["errors"] = messagesToJson(result.errors);
    json["warnings"] = messagesToJson(result.warnings);
    json["infos"] = messagesToJson(result.infos);
    json["clearable"] = result.isClearable();
    return json;
}

Json::Value toJson(const api::CsidResult& result) {
    Json::Value json;
    json["success"] = result.success;
    if (result.success) {
        json["requestId"] = result.credential.requestId;
        json["csid"] = result.credential.csid;
        json["secret"] = result.credential.secret;
        if (result.credential.expiresAt) {
            json["expiresAt"] = common::formatIso8601(*result.credential.expiresAt);
        }
        if (!result.dispositionMessage.empty()) {
            json["dispositionMessage"] = result.dispositionMessage;
        }
    }
    json["errors"] = messagesToJson(result.errors);
    json["warnings"] = messagesToJson(result.warnings);
    return json;
}

Json::Value toJson(const chain::ChainEntry& entry) {
    Json::Value json;
    json["organizationId"] = entry.orgId;
    json["icv"] = Json::Int64(entry.icv);
    json["previousHash"] = entry.previousHash;
    json["invoiceHash"] = entry.invoiceHash;
    json["uuid"] = entry.uuid;
    json["status"] = chain::entryStatusToString(entry.status);
    return json;
}

Json::Value toJson(const chain::ChainVerification& verification) {
    Json::Value json;
    json["valid"] = verification.valid;
    if (!verification.valid) {
        json["brokenAtIcv"] = Json::Int64(verification.brokenAtIcv);
        json["reason"] = verification.reason;
    }
    return json;
}

Json::Value toJson(const ProcessedInvoice& processed) {
    Json::Value json;
    json["accepted"] = processed.accepted;
    if (processed.mode == api::SubmissionMode::COMPLIANCE) {
        json["compliancePassed"] = processed.compliancePassed;
    }
    json["requiresReview"] = processed.requiresReview;
    if (processed.entry) {
        json["entry"] = toJson(*processed.entry);
    }
    json["invoiceHash"] = processed.invoiceHash;
    json["signature"] = processed.signature;
    json["signedInvoice"] = processed.signedXml;
    json["qrCode"] = processed.qrCode;
    if (processed.clearedInvoice) {
        json["clearedInvoice"] = *processed.clearedInvoice;
    }
    json["submission"] = toJson(processed.submission);
    return json;
}

} // namespace zatca::engine
