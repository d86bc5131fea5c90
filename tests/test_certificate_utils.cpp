/**
 * @file test_certificate_utils.cpp
 * @brief Unit tests for CSID certificate helpers and the Phase-2 QR
 */

#include <gtest/gtest.h>

#include "test_helpers.h"

#include "zatca/common/base64.h"
#include "zatca/common/exceptions.h"
#include "zatca/crypto/certificate_utils.h"
#include "zatca/crypto/crypto_core.h"
#include "zatca/crypto/phase2_qr.h"
#include "zatca/tlv/tlv_codec.h"

using namespace zatca::crypto;
using namespace test_helpers;
using zatca::common::Base64;
using zatca::common::ParsingException;

class CertificateUtilsTest : public ::testing::Test {
protected:
    KeyPair keys_;
    std::string certPem_;

    void SetUp() override {
        keys_ = generateKeyPair();
        certPem_ = createSelfSignedCertPem(keys_.privateKeyPem);
    }
};

// ============================================================================
// parseBinarySecurityToken
// ============================================================================

TEST_F(CertificateUtilsTest, Parse_RegulatorToken) {
    auto cert = parseBinarySecurityToken(toBinarySecurityToken(certPem_));
    EXPECT_NE(cert, nullptr);
}

TEST_F(CertificateUtilsTest, Parse_Pem) {
    auto cert = parseBinarySecurityToken(certPem_);
    EXPECT_NE(cert, nullptr);
}

TEST_F(CertificateUtilsTest, Parse_AllFormsSameCertificate) {
    auto fromToken = parseBinarySecurityToken(toBinarySecurityToken(certPem_));
    auto fromPem = parseCertificatePem(certPem_);
    EXPECT_EQ(X509_cmp(fromToken.get(), fromPem.get()), 0);
}

TEST(CertificateParseTest, Parse_GarbageThrows) {
    EXPECT_THROW(parseBinarySecurityToken("!!not base64!!"), ParsingException);
    EXPECT_THROW(parseBinarySecurityToken(Base64::encode(std::string("hello world"))), ParsingException);
    EXPECT_THROW(parseBinarySecurityToken(""), ParsingException);
}

// ============================================================================
// Accessors
// ============================================================================

TEST_F(CertificateUtilsTest, PublicKey_MatchesKeyPair) {
    auto cert = parseCertificatePem(certPem_);
    std::string spki = certificatePublicKey(cert.get());

    // Same DER as the PEM public key body
    std::string pemBody;
    for (size_t pos = 0; pos < keys_.publicKeyPem.size();) {
        size_t end = keys_.publicKeyPem.find('\n', pos);
        if (end == std::string::npos) end = keys_.publicKeyPem.size();
        std::string line = keys_.publicKeyPem.substr(pos, end - pos);
        if (line.rfind("-----", 0) != 0) pemBody += line;
        pos = end + 1;
    }
    EXPECT_EQ(spki, pemBody);
}

TEST_F(CertificateUtilsTest, Signature_NonEmptyBase64) {
    auto cert = parseCertificatePem(certPem_);
    std::string sig = certificateSignature(cert.get());
    EXPECT_FALSE(sig.empty());
    EXPECT_TRUE(Base64::isValid(sig));
}

TEST_F(CertificateUtilsTest, NotAfter_InFuture) {
    auto cert = parseCertificatePem(certPem_);
    auto notAfter = certificateNotAfter(cert.get());
    ASSERT_TRUE(notAfter.has_value());
    EXPECT_GT(*notAfter, std::chrono::system_clock::now() + std::chrono::hours(24 * 300));
}

TEST_F(CertificateUtilsTest, MatchesKey) {
    auto cert = parseCertificatePem(certPem_);
    EXPECT_TRUE(certificateMatchesKey(cert.get(), keys_.privateKeyPem));

    KeyPair other = generateKeyPair();
    EXPECT_FALSE(certificateMatchesKey(cert.get(), other.privateKeyPem));
}

// ============================================================================
// assemblePhase2Tlv
// ============================================================================

TEST_F(CertificateUtilsTest, Phase2Qr_NineTagsWithRawBytes) {
    auto cert = parseCertificatePem(certPem_);
    std::string invoiceHash = hash("<Invoice/>");
    std::string signature = sign(invoiceHash, keys_.privateKeyPem);
    std::string publicKey = certificatePublicKey(cert.get());
    std::string certSig = certificateSignature(cert.get());

    std::string qr = assemblePhase2Tlv("Seller", "399999999900003", "2024-01-15T10:30:00",
                                       "23.00", "3.00", invoiceHash, signature, publicKey, certSig);

    auto records = zatca::tlv::decodeBase64(qr);
    ASSERT_EQ(records.size(), 9u);
    for (size_t i = 0; i < records.size(); i++) {
        EXPECT_EQ(records[i].tag, i + 1);
    }
    EXPECT_EQ(records[3].valueAsString(), "23.00");
    EXPECT_EQ(records[5].value, Base64::decode(invoiceHash));
    EXPECT_EQ(records[5].value.size(), 32u);
    EXPECT_EQ(records[6].value, Base64::decode(signature));
    EXPECT_EQ(records[7].valueAsString(), publicKey);
    EXPECT_EQ(records[8].value, Base64::decode(certSig));
}
