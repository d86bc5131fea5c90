/**
 * @file test_helpers.h
 * @brief Shared test helpers for zatca_einvoice unit tests
 *
 * Scripted HTTP transport, self-signed certificate generation and sample
 * invoices, so tests run without network or database.
 */

#pragma once

#include <ctime>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <openssl/pem.h>
#include <openssl/x509.h>

#include "zatca/api/http_transport.h"
#include "zatca/common/base64.h"
#include "zatca/common/uuid.h"
#include "zatca/crypto/crypto_core.h"
#include "zatca/crypto/openssl_types.h"
#include "zatca/invoice/invoice_types.h"

namespace test_helpers {

using zatca::api::HttpRequest;
using zatca::api::TransportResult;

// --- HTTP ---

/**
 * @brief IHttpTransport returning queued results and recording requests
 *
 * When the queue is empty every call returns a network failure.
 */
class FakeHttpTransport : public zatca::api::IHttpTransport {
public:
    TransportResult send(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (responses_.empty()) {
            return networkFailure();
        }
        TransportResult result = responses_.front();
        responses_.pop_front();
        return result;
    }

    void enqueue(int status, const std::string& body) {
        TransportResult r;
        r.ok = true;
        r.response.statusCode = status;
        r.response.body = body;
        enqueue(r);
    }

    void enqueue(const TransportResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(result);
    }

    static TransportResult networkFailure(bool timedOut = false) {
        TransportResult r;
        r.ok = false;
        r.timedOut = timedOut;
        r.error = timedOut ? "timeout" : "connection refused";
        return r;
    }

    std::vector<HttpRequest> requests;

private:
    std::mutex mutex_;
    std::deque<TransportResult> responses_;
};

// --- Certificates ---

/**
 * @brief Self-signed certificate for the given PEM private key, as PEM
 */
inline std::string createSelfSignedCertPem(
    const std::string& privateKeyPem,
    const std::string& cn = "EGS1-886431145",
    long validSeconds = 365L * 86400)
{
    auto key = zatca::crypto::loadPrivateKeyPem(privateKeyPem);

    zatca::crypto::UniqueCert cert(X509_new());
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);

    X509_NAME* name = X509_NAME_new();
    X509_NAME_add_entry_by_txt(name, "C", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>("SA"), -1, -1, 0);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
        reinterpret_cast<const unsigned char*>(cn.c_str()), -1, -1, 0);
    X509_set_subject_name(cert.get(), name);
    X509_set_issuer_name(cert.get(), name);
    X509_NAME_free(name);

    ASN1_TIME_set(X509_getm_notBefore(cert.get()), time(nullptr) - 86400);
    ASN1_TIME_set(X509_getm_notAfter(cert.get()), time(nullptr) + validSeconds);

    X509_set_pubkey(cert.get(), key.get());
    X509_sign(cert.get(), key.get(), EVP_sha256());

    zatca::crypto::UniqueBio bio(BIO_new(BIO_s_mem()));
    PEM_write_bio_X509(bio.get(), cert.get());
    return zatca::crypto::bioToString(bio.get());
}

/**
 * @brief Certificate in the regulator's binarySecurityToken form: Base64(Base64(DER))
 */
inline std::string toBinarySecurityToken(const std::string& certPem) {
    zatca::crypto::UniqueBio bio(BIO_new_mem_buf(certPem.data(), static_cast<int>(certPem.size())));
    zatca::crypto::UniqueCert cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));

    unsigned char* der = nullptr;
    int len = i2d_X509(cert.get(), &der);
    std::string inner = zatca::common::Base64::encode(der, static_cast<size_t>(len));
    OPENSSL_free(der);
    return zatca::common::Base64::encode(inner);
}

// --- Invoices ---

inline zatca::invoice::Party sampleSeller() {
    zatca::invoice::Party seller;
    seller.name = "Maximum Speed Tech Supply LTD";
    seller.vatNumber = "399999999900003";
    seller.crn = "1010010000";
    seller.address.street = "Prince Sultan";
    seller.address.buildingNumber = "2322";
    seller.address.city = "Riyadh";
    seller.address.postalCode = "23333";
    seller.address.district = "Al-Murabba";
    return seller;
}

inline zatca::invoice::Party sampleBuyer() {
    zatca::invoice::Party buyer;
    buyer.name = "Fatoora Samples LTD";
    buyer.vatNumber = "399999999800003";
    buyer.address.street = "Salah Al-Din";
    buyer.address.buildingNumber = "1111";
    buyer.address.city = "Riyadh";
    buyer.address.postalCode = "12222";
    buyer.address.district = "Al-Murabba";
    return buyer;
}

/**
 * @brief Valid standard tax invoice: 2 x 10.00 at 15% (20.00 + 3.00 = 23.00)
 */
inline zatca::invoice::InvoiceRequest sampleInvoice(const std::string& number = "SME00010") {
    zatca::invoice::InvoiceRequest request;
    request.invoiceNumber = number;
    request.uuid = zatca::common::Uuid::generate();
    request.issueDate = "2024-01-15";
    request.issueTime = "10:30:00";
    request.seller = sampleSeller();
    request.buyer = sampleBuyer();
    request.lineItems.push_back({"Book", 2.0, 10.0, 15.0});
    request.invoiceCounterValue = 1;
    request.previousInvoiceHash = zatca::crypto::initialPreviousHash();
    return request;
}

/// @brief Regulator success body for clearance / reporting
inline std::string clearedResponseBody(const std::string& status = "PASS") {
    return R"({"validationResults":{"infoMessages":[{"type":"INFO","code":"XSD_ZATCA_VALID","category":"XSD validation","message":"Complied with UBL 2.1 standards","status":"PASS"}],"warningMessages":[],"errorMessages":[],"status":")" +
           status + R"("},"clearanceStatus":"CLEARED","reportingStatus":"REPORTED","clearedInvoice":"PD94bWw+","qrCode":"AQNTTUU="})";
}

} // namespace test_helpers
