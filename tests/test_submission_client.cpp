/**
 * @file test_submission_client.cpp
 * @brief Unit tests for clearance / reporting / compliance submission
 */

#include <gtest/gtest.h>

#include "test_helpers.h"

#include "zatca/api/submission_client.h"
#include "zatca/api/wire_types.h"
#include "zatca/common/base64.h"

using namespace zatca::api;
using namespace test_helpers;

class SubmissionClientTest : public ::testing::Test {
protected:
    FakeHttpTransport transport_;
    zatca::common::ApiEndpoints endpoints_;
    std::unique_ptr<SubmissionClient> client_;
    std::vector<std::chrono::milliseconds> sleeps_;

    InvoiceSubmissionRequest request_;
    Credential credential_;

    void SetUp() override {
        endpoints_.complianceApiUrl = "https://gw.example.sa/compliance";
        endpoints_.clearanceApiUrl = "https://gw.example.sa/invoices/clearance/single";
        endpoints_.reportingApiUrl = "https://gw.example.sa/invoices/reporting/single";
        endpoints_.productionCsidApiUrl = "https://gw.example.sa/production/csids";

        RetryPolicy retry;
        retry.maxRetries = 3;
        retry.initialBackoffMs = 100;
        client_ = std::make_unique<SubmissionClient>(&transport_, endpoints_, 10, retry);
        client_->setSleeper([this](std::chrono::milliseconds d) { sleeps_.push_back(d); });

        request_ = InvoiceSubmissionRequest::fromXml("hash==", "3cf5ee18-ee25-44ea-a444-2c37ba7f28be", "<Invoice/>");

        credential_.csid = "TUlJQ0";
        credential_.secret = "s3cret";
    }
};

TEST(SubmissionClientCtorTest, NullTransportThrows) {
    EXPECT_THROW(SubmissionClient(nullptr, zatca::common::ApiEndpoints{}), std::invalid_argument);
}

// ============================================================================
// Request shape
// ============================================================================

TEST_F(SubmissionClientTest, Clearance_RequestShape) {
    transport_.enqueue(200, clearedResponseBody());
    client_->submitForClearance(request_, credential_);

    ASSERT_EQ(transport_.requests.size(), 1u);
    const HttpRequest& sent = transport_.requests[0];
    EXPECT_EQ(sent.method, HttpMethod::POST);
    EXPECT_EQ(sent.url, endpoints_.clearanceApiUrl);
    EXPECT_EQ(sent.header("Clearance-Status"), "1");
    EXPECT_EQ(sent.header("Accept-Version"), "V2");
    EXPECT_EQ(sent.header("Authorization"),
              "Basic " + zatca::common::Base64::encode(std::string("TUlJQ0:s3cret")));
    EXPECT_EQ(sent.timeoutSeconds, 10);

    auto body = parseJson(sent.body);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ((*body)["invoiceHash"].asString(), "hash==");
    EXPECT_EQ((*body)["uuid"].asString(), "3cf5ee18-ee25-44ea-a444-2c37ba7f28be");
    EXPECT_EQ((*body)["invoice"].asString(), zatca::common::Base64::encode(std::string("<Invoice/>")));
}

TEST_F(SubmissionClientTest, Reporting_NoClearanceHeader) {
    transport_.enqueue(200, clearedResponseBody());
    client_->submitForReporting(request_, credential_);

    ASSERT_EQ(transport_.requests.size(), 1u);
    EXPECT_EQ(transport_.requests[0].url, endpoints_.reportingApiUrl);
    EXPECT_EQ(transport_.requests[0].header("Clearance-Status"), "");
}

TEST_F(SubmissionClientTest, Compliance_InvoicesEndpoint) {
    transport_.enqueue(200, clearedResponseBody());
    client_->submitComplianceInvoice(request_, credential_);
    EXPECT_EQ(transport_.requests[0].url, "https://gw.example.sa/compliance/invoices");
}

// ============================================================================
// Response mapping
// ============================================================================

TEST_F(SubmissionClientTest, Clearance_Pass) {
    transport_.enqueue(200, clearedResponseBody());
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, ValidationStatus::PASS);
    EXPECT_TRUE(result.isClearable());
    EXPECT_EQ(result.clearanceStatus, "CLEARED");
    ASSERT_TRUE(result.clearedInvoice.has_value());
    EXPECT_EQ(*result.clearedInvoice, "PD94bWw+");
    ASSERT_TRUE(result.qrCode.has_value());
    EXPECT_EQ(result.infos.size(), 1u);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.invoiceHash, "hash==");
}

TEST_F(SubmissionClientTest, Reporting_NoClearedInvoice) {
    transport_.enqueue(200, clearedResponseBody());
    SubmissionResult result = client_->submitForReporting(request_, credential_);
    EXPECT_TRUE(result.isClearable());
    EXPECT_EQ(result.reportingStatus, "REPORTED");
    EXPECT_FALSE(result.clearedInvoice.has_value());
}

TEST_F(SubmissionClientTest, Accepted_WithWarnings) {
    transport_.enqueue(202, R"({"validationResults":{"status":"WARNING","warningMessages":[
        {"type":"WARNING","code":"BR-KSA-08","category":"KSA","message":"Seller id","status":"WARNING"}],
        "errorMessages":[]},"clearanceStatus":"CLEARED","clearedInvoice":"PD94"})");
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.status, ValidationStatus::WARNING);
    EXPECT_TRUE(result.isClearable());
    EXPECT_TRUE(result.requiresReview());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, "BR-KSA-08");
    EXPECT_EQ(result.warnings[0].type, MessageType::WARNING);
}

TEST_F(SubmissionClientTest, Http400_RegulatorErrors) {
    transport_.enqueue(400, R"({"validationResults":{"status":"ERROR","errorMessages":[
        {"type":"ERROR","code":"X1","category":"C","message":"bad","status":"ERROR"}]}})");
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, ValidationStatus::ERROR);
    EXPECT_FALSE(result.isClearable());
    EXPECT_EQ(result.httpStatus, 400);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].code, "X1");
    EXPECT_EQ(result.errors[0].message, "bad");
    EXPECT_EQ(transport_.requests.size(), 1u);  // not retried
}

TEST_F(SubmissionClientTest, Http400_StringErrorsDoNotThrow) {
    transport_.enqueue(400, R"({"errors":["bad"]})");
    SubmissionResult result;
    ASSERT_NO_THROW(result = client_->submitForClearance(request_, credential_));

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.isClearable());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].type, MessageType::HTTP);
    EXPECT_EQ(result.errors[0].code, "HTTP_400");
}

TEST_F(SubmissionClientTest, Http401_SyntheticError) {
    transport_.enqueue(401, "");
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].type, MessageType::HTTP);
    EXPECT_EQ(result.errors[0].code, "HTTP_401");
}

TEST_F(SubmissionClientTest, Http200_WithErrorsNotClearable) {
    transport_.enqueue(200, R"({"validationResults":{"status":"PASS","errorMessages":[
        {"type":"ERROR","code":"BR-01","category":"EN","message":"missing","status":"ERROR"}]},
        "clearanceStatus":"NOT_CLEARED"})");
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_EQ(result.status, ValidationStatus::ERROR);
    EXPECT_FALSE(result.isClearable());
}

TEST_F(SubmissionClientTest, MalformedBody_InvalidResponse) {
    transport_.enqueue(200, "<html>gateway</html>");
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].type, MessageType::API);
    EXPECT_EQ(result.errors[0].code, "INVALID_RESPONSE");
}

// ============================================================================
// Retry and credentials
// ============================================================================

TEST_F(SubmissionClientTest, TransportFailure_RetriedIdentically) {
    transport_.enqueue(FakeHttpTransport::networkFailure());
    transport_.enqueue(FakeHttpTransport::networkFailure(true));
    transport_.enqueue(200, clearedResponseBody());

    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_TRUE(result.isClearable());
    EXPECT_EQ(result.attempts, 3);
    ASSERT_EQ(transport_.requests.size(), 3u);
    EXPECT_EQ(transport_.requests[0].body, transport_.requests[1].body);
    EXPECT_EQ(transport_.requests[1].body, transport_.requests[2].body);

    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 100);
    EXPECT_EQ(sleeps_[1].count(), 200);
}

TEST_F(SubmissionClientTest, TransportFailure_ExhaustsRetries) {
    // Empty queue: every attempt fails
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.attempts, 4);
    EXPECT_EQ(transport_.requests.size(), 4u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].type, MessageType::FETCH_ERROR);
    EXPECT_TRUE(result.errors[0].isTransportFailure());
}

TEST_F(SubmissionClientTest, ExpiredCredential_NoNetwork) {
    credential_.expiresAt = std::chrono::system_clock::now() - std::chrono::hours(1);
    SubmissionResult result = client_->submitForClearance(request_, credential_);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(transport_.requests.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].type, MessageType::VALIDATION);
    EXPECT_EQ(result.errors[0].code, "CREDENTIAL_EXPIRED");
}

TEST_F(SubmissionClientTest, ExpiryUsesInjectedClock) {
    auto expiry = std::chrono::system_clock::now() + std::chrono::hours(1);
    credential_.expiresAt = expiry;
    client_->setClock([expiry] { return expiry + std::chrono::seconds(1); });

    SubmissionResult result = client_->submitForClearance(request_, credential_);
    EXPECT_TRUE(transport_.requests.empty());
    EXPECT_EQ(result.errors[0].code, "CREDENTIAL_EXPIRED");
}
