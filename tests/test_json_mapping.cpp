/**
 * @file test_json_mapping.cpp
 * @brief Unit tests for REST boundary JSON mapping
 */

#include <gtest/gtest.h>

#include "zatca/api/wire_types.h"
#include "zatca/common/exceptions.h"
#include "zatca/common/time_utils.h"
#include "zatca/engine/json_mapping.h"

using namespace zatca;
using namespace zatca::engine;

namespace {

Json::Value parse(const std::string& text) {
    auto json = api::parseJson(text);
    if (!json) {
        ADD_FAILURE() << "test JSON did not parse: " << text;
        return Json::Value();
    }
    return *json;
}

} // namespace

// ============================================================================
// Requests
// ============================================================================

TEST(JsonMappingTest, InvoiceRequest_FullDocument) {
    Json::Value json = parse(R"({
        "invoiceNumber": "SME00023",
        "uuid": "3cf5ee18-ee25-44ea-a444-2c37ba7f28be",
        "issueDate": "2024-02-01",
        "issueTime": "09:15:00",
        "invoiceTypeCode": "381",
        "currency": "SAR",
        "seller": {"name": "Seller", "vatNumber": "399999999900003", "crn": "1010010000",
                   "address": {"street": "King Fahd", "buildingNumber": "1234", "city": "Riyadh",
                               "postalCode": "12345", "district": "Olaya"}},
        "buyer": {"name": "Buyer", "vatNumber": "399999999800003"},
        "lineItems": [{"name": "Widget", "quantity": 3, "unitPrice": 12.5},
                      {"name": "Export", "quantity": 1, "unitPrice": 100, "vatRate": 0}],
        "billingReference": {"invoiceNumber": "SME00010", "reason": "Returned goods"}
    })");

    invoice::InvoiceRequest request = invoiceRequestFromJson(json);

    EXPECT_EQ(request.invoiceNumber, "SME00023");
    EXPECT_EQ(request.typeCode, "381");
    EXPECT_EQ(request.kind, invoice::InvoiceKind::STANDARD);
    ASSERT_TRUE(request.seller.crn.has_value());
    EXPECT_EQ(*request.seller.crn, "1010010000");
    EXPECT_EQ(request.seller.address.country, "SA");
    ASSERT_TRUE(request.buyer.has_value());
    EXPECT_FALSE(request.buyer->crn.has_value());

    ASSERT_EQ(request.lineItems.size(), 2u);
    EXPECT_DOUBLE_EQ(request.lineItems[0].quantity, 3.0);
    EXPECT_DOUBLE_EQ(request.lineItems[0].vatRate, 15.0);
    EXPECT_DOUBLE_EQ(request.lineItems[1].vatRate, 0.0);

    ASSERT_TRUE(request.billingReference.has_value());
    EXPECT_EQ(request.billingReference->reason, "Returned goods");
}

TEST(JsonMappingTest, InvoiceRequest_Defaults) {
    invoice::InvoiceRequest request = invoiceRequestFromJson(parse(R"({"kind": "simplified"})"));

    EXPECT_EQ(request.kind, invoice::InvoiceKind::SIMPLIFIED);
    EXPECT_EQ(request.typeCode, invoice::kTaxInvoice);
    EXPECT_EQ(request.currency, invoice::kDefaultCurrency);
    EXPECT_FALSE(request.buyer.has_value());
    EXPECT_TRUE(request.lineItems.empty());
}

TEST(JsonMappingTest, InvoiceRequest_WrongTypesThrow) {
    EXPECT_THROW(invoiceRequestFromJson(parse(R"([])")), common::ParsingException);
    EXPECT_THROW(invoiceRequestFromJson(parse(R"({"invoiceNumber": 12})")), common::ParsingException);
    EXPECT_THROW(invoiceRequestFromJson(parse(R"({"lineItems": {}})")), common::ParsingException);
    EXPECT_THROW(invoiceRequestFromJson(parse(R"({"lineItems": [{"quantity": "two"}]})")),
                 common::ParsingException);
    EXPECT_THROW(invoiceRequestFromJson(parse(R"({"seller": "Seller"})")), common::ParsingException);
}

TEST(JsonMappingTest, NonObjectBodiesThrowParsingException) {
    EXPECT_THROW(invoiceRequestFromJson(parse(R"("invoice")")), common::ParsingException);
    EXPECT_THROW(invoiceRequestFromJson(parse(R"(42)")), common::ParsingException);
    EXPECT_THROW(invoiceRequestFromJson(parse(R"({"lineItems": ["Coffee"]})")), common::ParsingException);
    EXPECT_THROW(credentialFromJson(parse(R"(["csid"])")), common::ParsingException);
    EXPECT_THROW(csrConfigFromJson(parse(R"("cn")")), common::ParsingException);
}

TEST(JsonMappingTest, Credential_WithExpiry) {
    api::Credential credential = credentialFromJson(parse(
        R"({"requestId": "1234567890123", "csid": "TUlJQ0", "secret": "s3cret", "expiresAt": "2030-01-01T00:00:00Z"})"));

    EXPECT_EQ(credential.requestId, "1234567890123");
    EXPECT_EQ(credential.csid, "TUlJQ0");
    ASSERT_TRUE(credential.expiresAt.has_value());
    EXPECT_EQ(common::formatIso8601(*credential.expiresAt), "2030-01-01T00:00:00Z");
    EXPECT_FALSE(credential.isExpired());
}

TEST(JsonMappingTest, Credential_BadExpiryThrows) {
    EXPECT_THROW(credentialFromJson(parse(R"({"csid": "a", "secret": "b", "expiresAt": "tomorrow"})")),
                 common::ParsingException);
}

TEST(JsonMappingTest, CsrConfig_OptionalUnit) {
    crypto::CsrConfig config = csrConfigFromJson(parse(R"({
        "commonName": "TST-886431145-399999999900003",
        "serialNumber": "1-TST|2-TST|3-ed22f1d8-e6a2-1118-9b58-d9a8f11e445f",
        "organizationIdentifier": "399999999900003",
        "organizationName": "Maximum Speed Tech Supply LTD",
        "countryName": "SA",
        "invoiceType": "1100",
        "location": "Riyadh",
        "industry": "Supply activities"
    })"));

    EXPECT_EQ(config.invoiceType, "1100");
    EXPECT_FALSE(config.organizationUnitName.has_value());
}

// ============================================================================
// Responses
// ============================================================================

TEST(JsonMappingTest, SubmissionResult_ClearableFlag) {
    api::SubmissionResult result;
    result.success = true;
    result.status = api::ValidationStatus::PASS;
    result.mode = api::SubmissionMode::REPORTING;
    result.httpStatus = 200;
    result.attempts = 1;

    Json::Value json = toJson(result);
    EXPECT_TRUE(json["clearable"].asBool());
    EXPECT_EQ(json["status"].asString(), "PASS");
    EXPECT_EQ(json["mode"].asString(), "reporting");
    EXPECT_FALSE(json.isMember("qrCode"));

    api::ApiMessage error;
    error.type = api::MessageType::ERROR;
    error.code = "E1";
    result.errors.push_back(error);

    json = toJson(result);
    EXPECT_FALSE(json["clearable"].asBool());
    ASSERT_EQ(json["errors"].size(), 1u);
    EXPECT_EQ(json["errors"][0]["code"].asString(), "E1");
}

TEST(JsonMappingTest, CsidResult_HidesCredentialOnFailure) {
    api::CsidResult failed;
    failed.credential.secret = "leak";
    EXPECT_FALSE(toJson(failed).isMember("secret"));

    api::CsidResult ok;
    ok.success = true;
    ok.credential.csid = "TUlJQ0";
    ok.credential.secret = "s3cret";
    Json::Value json = toJson(ok);
    EXPECT_EQ(json["secret"].asString(), "s3cret");
    EXPECT_FALSE(json.isMember("expiresAt"));
}

TEST(JsonMappingTest, ChainVerification) {
    chain::ChainVerification ok;
    EXPECT_FALSE(toJson(ok).isMember("brokenAtIcv"));

    chain::ChainVerification broken;
    broken.valid = false;
    broken.brokenAtIcv = 7;
    broken.reason = "gap";
    Json::Value json = toJson(broken);
    EXPECT_FALSE(json["valid"].asBool());
    EXPECT_EQ(json["brokenAtIcv"].asInt64(), 7);
}

TEST(JsonMappingTest, ProcessedInvoice_EntryOnlyWhenSequenced) {
    ProcessedInvoice rejected;
    EXPECT_FALSE(toJson(rejected).isMember("entry"));

    ProcessedInvoice sequenced;
    sequenced.entry = chain::ChainEntry{"org-1", 3, "pih", "hash", "uuid-3", chain::EntryStatus::CLEARED};
    Json::Value json = toJson(sequenced);
    EXPECT_EQ(json["entry"]["icv"].asInt64(), 3);
    EXPECT_EQ(json["entry"]["status"].asString(), "CLEARED");
}

TEST(JsonMappingTest, ProcessedInvoice_CompliancePassedIsNotAccepted) {
    ProcessedInvoice processed;
    processed.mode = api::SubmissionMode::COMPLIANCE;
    processed.compliancePassed = true;
    processed.signedXml = "<Invoice/>";

    Json::Value json = toJson(processed);
    EXPECT_FALSE(json["accepted"].asBool());
    EXPECT_TRUE(json["compliancePassed"].asBool());
    EXPECT_EQ(json["signedInvoice"].asString(), "<Invoice/>");
}
