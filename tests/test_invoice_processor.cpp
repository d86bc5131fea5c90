/**
 * @file test_invoice_processor.cpp
 * @brief End-to-end tests: validate, sequence, sign, QR, submit, record
 */

#include <gtest/gtest.h>

#include "test_helpers.h"

#include "zatca/api/wire_types.h"
#include "zatca/chain/chain_sequencer.h"
#include "zatca/common/base64.h"
#include "zatca/common/exceptions.h"
#include "zatca/crypto/crypto_core.h"
#include "zatca/engine/invoice_processor.h"
#include "zatca/tlv/tlv_codec.h"

using namespace zatca;
using namespace test_helpers;
using chain::EntryStatus;

namespace {

const char* kOrg = "399999999900003";

std::string reportedWithoutQrBody() {
    return R"({"validationResults":{"infoMessages":[],"warningMessages":[],"errorMessages":[],"status":"PASS"},"reportingStatus":"REPORTED"})";
}

} // namespace

class InvoiceProcessorTest : public ::testing::Test {
protected:
    FakeHttpTransport transport_;
    chain::InMemoryChainStateStore store_;
    std::unique_ptr<chain::ChainSequencer> sequencer_;
    std::unique_ptr<api::SubmissionClient> client_;
    std::unique_ptr<engine::InvoiceProcessor> processor_;

    crypto::KeyPair keys_;
    api::Credential credential_;

    void SetUp() override {
        keys_ = crypto::generateKeyPair();

        common::ApiEndpoints endpoints;
        endpoints.complianceApiUrl = "https://gw.example.sa/compliance";
        endpoints.clearanceApiUrl = "https://gw.example.sa/invoices/clearance/single";
        endpoints.reportingApiUrl = "https://gw.example.sa/invoices/reporting/single";
        endpoints.productionCsidApiUrl = "https://gw.example.sa/production/csids";

        api::RetryPolicy retry;
        retry.maxRetries = 0;
        client_ = std::make_unique<api::SubmissionClient>(&transport_, endpoints, 5, retry);
        client_->setSleeper([](std::chrono::milliseconds) {});

        sequencer_ = std::make_unique<chain::ChainSequencer>(&store_);

        engine::SigningIdentity identity;
        identity.privateKeyPem = keys_.privateKeyPem;
        identity.certificate = toBinarySecurityToken(createSelfSignedCertPem(keys_.privateKeyPem));
        processor_ = std::make_unique<engine::InvoiceProcessor>(sequencer_.get(), client_.get(), identity);

        credential_.csid = "TUlJQ0";
        credential_.secret = "s3cret";
    }

    EntryStatus storedStatus(int64_t icv) {
        for (const auto& e : store_.entries(kOrg)) {
            if (e.icv == icv) return e.status;
        }
        ADD_FAILURE() << "no entry for ICV " << icv;
        return EntryStatus::ISSUED;
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(InvoiceProcessorTest, Ctor_NullDependenciesThrow) {
    engine::SigningIdentity identity;
    identity.privateKeyPem = keys_.privateKeyPem;
    EXPECT_THROW(engine::InvoiceProcessor(nullptr, client_.get(), identity), std::invalid_argument);
    EXPECT_THROW(engine::InvoiceProcessor(sequencer_.get(), nullptr, identity), std::invalid_argument);
}

TEST_F(InvoiceProcessorTest, Ctor_CertificateForOtherKeyThrows) {
    crypto::KeyPair other = crypto::generateKeyPair();
    engine::SigningIdentity identity;
    identity.privateKeyPem = keys_.privateKeyPem;
    identity.certificate = toBinarySecurityToken(createSelfSignedCertPem(other.privateKeyPem));
    EXPECT_THROW(engine::InvoiceProcessor(sequencer_.get(), client_.get(), identity), common::CryptoException);
}

// ============================================================================
// Accepted submissions
// ============================================================================

TEST_F(InvoiceProcessorTest, Process_StandardCleared) {
    transport_.enqueue(200, clearedResponseBody());

    auto result = processor_->process(kOrg, sampleInvoice(), credential_);

    EXPECT_TRUE(result.accepted);
    ASSERT_TRUE(result.entry.has_value());
    EXPECT_EQ(result.entry->icv, 1);
    EXPECT_EQ(result.entry->previousHash, crypto::initialPreviousHash());
    EXPECT_EQ(result.entry->status, EntryStatus::CLEARED);
    EXPECT_EQ(storedStatus(1), EntryStatus::CLEARED);

    EXPECT_EQ(result.invoiceHash, crypto::hash(result.xml));
    EXPECT_TRUE(crypto::verify(result.invoiceHash, result.signature, keys_.publicKeyPem));

    // Regulator QR and cleared XML take precedence
    EXPECT_EQ(result.qrCode, "AQNTTUU=");
    ASSERT_TRUE(result.clearedInvoice.has_value());
    EXPECT_EQ(*result.clearedInvoice, "PD94bWw+");

    ASSERT_EQ(transport_.requests.size(), 1u);
    EXPECT_EQ(transport_.requests[0].header("Clearance-Status"), "1");
}

TEST_F(InvoiceProcessorTest, Process_SubmitsSignedInvoice) {
    transport_.enqueue(200, clearedResponseBody());

    auto result = processor_->process(kOrg, sampleInvoice(), credential_);

    ASSERT_EQ(transport_.requests.size(), 1u);
    auto body = api::parseJson(transport_.requests[0].body);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ((*body)["invoiceHash"].asString(), result.invoiceHash);

    std::string submitted = common::Base64::decodeToString((*body)["invoice"].asString());
    EXPECT_EQ(submitted, result.signedXml);
    EXPECT_NE(submitted.find("<ds:SignatureValue>" + result.signature + "</ds:SignatureValue>"),
              std::string::npos);
    EXPECT_NE(submitted.find("<ds:DigestValue>" + result.invoiceHash + "</ds:DigestValue>"),
              std::string::npos);
    EXPECT_NE(submitted.find("<ds:X509Certificate>MII"), std::string::npos);
    EXPECT_NE(submitted.find("<cbc:ID>QR</cbc:ID>"), std::string::npos);

    // The hash still covers the document without the signature parts
    EXPECT_EQ(result.invoiceHash, crypto::hash(result.xml));
    EXPECT_NE(result.invoiceHash, crypto::hash(result.signedXml));
    EXPECT_EQ(result.xml.find("ds:Signature"), std::string::npos);
}

TEST_F(InvoiceProcessorTest, Process_SecondInvoiceChainsToFirst) {
    transport_.enqueue(200, clearedResponseBody());
    transport_.enqueue(200, clearedResponseBody());

    auto first = processor_->process(kOrg, sampleInvoice("SME00010"), credential_);
    auto second = processor_->process(kOrg, sampleInvoice("SME00011"), credential_);

    EXPECT_EQ(second.entry->icv, 2);
    EXPECT_EQ(second.entry->previousHash, first.invoiceHash);
    EXPECT_NE(second.xml.find(first.invoiceHash), std::string::npos);
    EXPECT_TRUE(sequencer_->verify(kOrg).valid);
}

TEST_F(InvoiceProcessorTest, ProcessSimplified_Reported) {
    transport_.enqueue(200, reportedWithoutQrBody());

    invoice::SimplifiedInvoiceData data;
    data.invoiceNumber = "SMP00001";
    data.issueDate = "2024-01-15";
    data.issueTime = "12:00:00";
    data.seller = sampleSeller();
    data.lineItems.push_back({"Coffee", 1.0, 100.0, 15.0});

    auto result = processor_->processSimplified(kOrg, data, credential_);

    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.kind, invoice::InvoiceKind::SIMPLIFIED);
    EXPECT_EQ(result.mode, api::SubmissionMode::REPORTING);
    EXPECT_EQ(result.entry->status, EntryStatus::REPORTED);
    EXPECT_FALSE(result.clearedInvoice.has_value());
    ASSERT_EQ(transport_.requests.size(), 1u);
    EXPECT_TRUE(transport_.requests[0].header("Clearance-Status").empty());
}

TEST_F(InvoiceProcessorTest, Process_LocalQrHasNineTags) {
    transport_.enqueue(200, reportedWithoutQrBody());

    auto request = sampleInvoice();
    request.kind = invoice::InvoiceKind::SIMPLIFIED;
    request.buyer.reset();
    auto result = processor_->process(kOrg, request, credential_);

    auto records = tlv::decodeBase64(result.qrCode);
    ASSERT_EQ(records.size(), 9u);
    EXPECT_EQ(records[0].tag, 1);
    EXPECT_EQ(std::string(records[0].value.begin(), records[0].value.end()), request.seller.name);
    EXPECT_EQ(std::string(records[3].value.begin(), records[3].value.end()), "23.00");
    EXPECT_EQ(std::string(records[4].value.begin(), records[4].value.end()), "3.00");
    EXPECT_EQ(std::string(records[5].value.begin(), records[5].value.end()), result.invoiceHash);
}

// ============================================================================
// Rejected before sequencing
// ============================================================================

TEST_F(InvoiceProcessorTest, Process_InvalidInvoiceConsumesNoIcv) {
    auto request = sampleInvoice();
    request.lineItems.clear();

    auto result = processor_->process(kOrg, request, credential_);

    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(result.entry.has_value());
    EXPECT_FALSE(result.validation.valid);
    EXPECT_FALSE(result.submission.errors.empty());
    EXPECT_TRUE(transport_.requests.empty());
    EXPECT_TRUE(store_.entries(kOrg).empty());

    transport_.enqueue(200, clearedResponseBody());
    EXPECT_EQ(processor_->process(kOrg, sampleInvoice(), credential_).entry->icv, 1);
}

TEST_F(InvoiceProcessorTest, Process_OversizedSellerNameConsumesNoIcv) {
    auto request = sampleInvoice();
    request.seller.name = std::string(300, 'N');

    auto result = processor_->process(kOrg, request, credential_);

    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(result.entry.has_value());
    EXPECT_TRUE(result.validation.hasError("SEL-003"));
    EXPECT_TRUE(transport_.requests.empty());
    EXPECT_TRUE(store_.entries(kOrg).empty());
}

TEST_F(InvoiceProcessorTest, Process_ExpiredCredentialConsumesNoIcv) {
    credential_.expiresAt = std::chrono::system_clock::now() - std::chrono::hours(1);

    auto result = processor_->process(kOrg, sampleInvoice(), credential_);

    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(result.entry.has_value());
    ASSERT_EQ(result.submission.errors.size(), 1u);
    EXPECT_TRUE(transport_.requests.empty());
    EXPECT_TRUE(store_.entries(kOrg).empty());
}

// ============================================================================
// Post-sequencing outcomes
// ============================================================================

TEST_F(InvoiceProcessorTest, Process_RegulatorRejection) {
    transport_.enqueue(400, R"({"validationResults":{"status":"ERROR","errorMessages":[
        {"type":"ERROR","code":"BR-KSA-37","category":"KSA","message":"bad seller","status":"ERROR"}]}})");

    auto result = processor_->process(kOrg, sampleInvoice(), credential_);

    EXPECT_FALSE(result.accepted);
    ASSERT_TRUE(result.entry.has_value());
    EXPECT_EQ(result.entry->status, EntryStatus::REJECTED);
    EXPECT_EQ(storedStatus(1), EntryStatus::REJECTED);
    EXPECT_EQ(result.submission.httpStatus, 400);
}

TEST_F(InvoiceProcessorTest, Process_PassWithErrorsIsNotAccepted) {
    transport_.enqueue(200, R"({"validationResults":{"status":"PASS","errorMessages":[
        {"type":"ERROR","code":"E1","category":"C","message":"hidden","status":"ERROR"}]},"clearanceStatus":"CLEARED"})");

    auto result = processor_->process(kOrg, sampleInvoice(), credential_);

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.entry->status, EntryStatus::REJECTED);
}

TEST_F(InvoiceProcessorTest, Process_WarningsRequireReview) {
    transport_.enqueue(200, R"({"validationResults":{"status":"WARNING","warningMessages":[
        {"type":"WARNING","code":"W1","category":"C","message":"check","status":"WARNING"}]},"clearanceStatus":"CLEARED"})");

    auto result = processor_->process(kOrg, sampleInvoice(), credential_);

    EXPECT_TRUE(result.accepted);
    EXPECT_TRUE(result.requiresReview);
}

TEST_F(InvoiceProcessorTest, Resubmit_AfterTransportFailure) {
    auto first = processor_->process(kOrg, sampleInvoice(), credential_);

    EXPECT_FALSE(first.accepted);
    ASSERT_TRUE(first.entry.has_value());
    EXPECT_EQ(first.entry->status, EntryStatus::ISSUED);
    EXPECT_EQ(storedStatus(1), EntryStatus::ISSUED);

    transport_.enqueue(200, clearedResponseBody());
    auto second = processor_->resubmit(first, credential_);

    EXPECT_TRUE(second.accepted);
    EXPECT_EQ(second.entry->icv, 1);
    EXPECT_EQ(second.entry->status, EntryStatus::CLEARED);
    EXPECT_EQ(storedStatus(1), EntryStatus::CLEARED);

    ASSERT_EQ(transport_.requests.size(), 2u);
    EXPECT_EQ(transport_.requests[0].body, transport_.requests[1].body);
    EXPECT_EQ(store_.entries(kOrg).size(), 1u);
}

TEST_F(InvoiceProcessorTest, Resubmit_SettledInvoiceThrows) {
    transport_.enqueue(200, clearedResponseBody());
    auto result = processor_->process(kOrg, sampleInvoice(), credential_);
    EXPECT_THROW(processor_->resubmit(result, credential_), std::invalid_argument);

    engine::ProcessedInvoice neverSequenced;
    EXPECT_THROW(processor_->resubmit(neverSequenced, credential_), std::invalid_argument);
}

TEST_F(InvoiceProcessorTest, VoidInvoice) {
    auto result = processor_->process(kOrg, sampleInvoice(), credential_);
    ASSERT_EQ(result.entry->status, EntryStatus::ISSUED);

    processor_->voidInvoice(kOrg, result.entry->icv);
    EXPECT_EQ(storedStatus(1), EntryStatus::VOID);
    EXPECT_TRUE(sequencer_->verify(kOrg).valid);
}

TEST_F(InvoiceProcessorTest, VoidInvoice_UnknownIcvThrows) {
    EXPECT_THROW(processor_->voidInvoice(kOrg, 42), common::ChainException);
}

// ============================================================================
// Compliance mode
// ============================================================================

TEST_F(InvoiceProcessorTest, Compliance_PassIsNeverAccepted) {
    transport_.enqueue(200, clearedResponseBody());

    auto result = processor_->process(kOrg, sampleInvoice(), credential_, api::SubmissionMode::COMPLIANCE);

    EXPECT_FALSE(result.accepted);
    EXPECT_TRUE(result.compliancePassed);
    ASSERT_TRUE(result.entry.has_value());
    EXPECT_EQ(result.entry->orgId, engine::complianceChainId(kOrg));
    EXPECT_EQ(result.entry->status, EntryStatus::COMPLIANCE_PASSED);
    EXPECT_EQ(transport_.requests[0].url, "https://gw.example.sa/compliance/invoices");

    // The live chain is untouched
    EXPECT_TRUE(store_.entries(kOrg).empty());
    auto complianceEntries = store_.entries(engine::complianceChainId(kOrg));
    ASSERT_EQ(complianceEntries.size(), 1u);
    EXPECT_EQ(complianceEntries[0].status, EntryStatus::COMPLIANCE_PASSED);
}

TEST_F(InvoiceProcessorTest, Compliance_DoesNotAdvanceLiveChain) {
    transport_.enqueue(200, clearedResponseBody());
    transport_.enqueue(200, clearedResponseBody());

    processor_->process(kOrg, sampleInvoice("TST00001"), credential_, api::SubmissionMode::COMPLIANCE);
    auto live = processor_->process(kOrg, sampleInvoice("SME00010"), credential_);

    EXPECT_TRUE(live.accepted);
    EXPECT_EQ(live.entry->icv, 1);
    EXPECT_EQ(live.entry->previousHash, crypto::initialPreviousHash());
    EXPECT_EQ(storedStatus(1), EntryStatus::CLEARED);
}

TEST_F(InvoiceProcessorTest, Compliance_RejectionRecordedOnComplianceChain) {
    transport_.enqueue(400, R"({"validationResults":{"status":"ERROR","errorMessages":[
        {"type":"ERROR","code":"BR-KSA-37","category":"KSA","message":"bad seller","status":"ERROR"}]}})");

    auto result = processor_->process(kOrg, sampleInvoice(), credential_, api::SubmissionMode::COMPLIANCE);

    EXPECT_FALSE(result.accepted);
    EXPECT_FALSE(result.compliancePassed);
    EXPECT_EQ(result.entry->status, EntryStatus::REJECTED);
    EXPECT_TRUE(store_.entries(kOrg).empty());
}
