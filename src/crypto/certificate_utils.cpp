/**
 * @file certificate_utils.cpp
 * @brief X.509 helpers for CSID certificates
 */

#include "zatca/crypto/certificate_utils.h"
#include "zatca/common/base64.h"
#include "zatca/common/exceptions.h"
#include "zatca/common/time_utils.h"

#include <vector>
#include <openssl/pem.h>

namespace zatca::crypto {

using common::Base64;
using common::ParsingException;

namespace {

UniqueCert certFromDer(const std::vector<uint8_t>& der) {
    const unsigned char* p = der.data();
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));
    if (!cert) ERR_clear_error();
    return UniqueCert(cert);
}

std::string stripWhitespace(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') out.push_back(c);
    }
    return out;
}

} // namespace

UniqueCert parseCertificatePem(const std::string& pem) {
    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    UniqueCert cert(bio ? PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr) : nullptr);
    if (!cert) {
        throw ParsingException(drainOpenSslErrors("malformed PEM certificate"));
    }
    return cert;
}

UniqueCert parseBinarySecurityToken(const std::string& token) {
    if (token.find("-----BEGIN CERTIFICATE-----") != std::string::npos) {
        return parseCertificatePem(token);
    }

    std::string compact = stripWhitespace(token);
    if (compact.empty() || !Base64::isValid(compact)) {
        throw ParsingException("binarySecurityToken is not Base64");
    }

    std::vector<uint8_t> outer = Base64::decode(compact);

    // Regulator form: Base64(Base64(DER))
    std::string inner = stripWhitespace(std::string(outer.begin(), outer.end()));
    if (!inner.empty() && Base64::isValid(inner)) {
        if (auto cert = certFromDer(Base64::decode(inner))) {
            return cert;
        }
    }

    if (auto cert = certFromDer(outer)) {
        return cert;
    }

    throw ParsingException("binarySecurityToken does not contain an X.509 certificate");
}

std::string certificateSignature(X509* cert) {
    if (!cert) return "";

    const ASN1_BIT_STRING* sig = nullptr;
    X509_get0_signature(&sig, nullptr, cert);
    if (!sig) return "";

    return Base64::encode(ASN1_STRING_get0_data(sig), static_cast<size_t>(ASN1_STRING_length(sig)));
}

std::string certificatePublicKey(X509* cert) {
    if (!cert) return "";

    X509_PUBKEY* pub = X509_get_X509_PUBKEY(cert);
    unsigned char* der = nullptr;
    int len = i2d_X509_PUBKEY(pub, &der);
    if (len <= 0) {
        ERR_clear_error();
        return "";
    }

    std::string result = Base64::encode(der, static_cast<size_t>(len));
    OPENSSL_free(der);
    return result;
}

std::string certificateDer(X509* cert) {
    if (!cert) return "";

    unsigned char* der = nullptr;
    int len = i2d_X509(cert, &der);
    if (len <= 0) {
        ERR_clear_error();
        return "";
    }

    std::string result = Base64::encode(der, static_cast<size_t>(len));
    OPENSSL_free(der);
    return result;
}

std::optional<std::chrono::system_clock::time_point> certificateNotAfter(X509* cert) {
    if (!cert) return std::nullopt;
    return common::asn1TimeToTimePoint(X509_get0_notAfter(cert));
}

bool certificateMatchesKey(X509* cert, const std::string& privateKeyPem) {
    if (!cert) return false;

    UniqueKey key = loadPrivateKeyPem(privateKeyPem);
    bool matches = X509_check_private_key(cert, key.get()) == 1;
    if (!matches) ERR_clear_error();
    return matches;
}

} // namespace zatca::crypto
