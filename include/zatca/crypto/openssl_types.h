/**
 * @file openssl_types.h
 * @brief RAII owners for OpenSSL handles and error-queue helpers
 */

#pragma once

#include <memory>
#include <string>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace zatca::crypto {

struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using UniqueKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

struct PKeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
using UniqueKeyCtx = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

struct MdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct BioDeleter { void operator()(BIO* p) const { BIO_free_all(p); } };
using UniqueBio = std::unique_ptr<BIO, BioDeleter>;

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueCert = std::unique_ptr<X509, X509Deleter>;

struct X509ReqDeleter { void operator()(X509_REQ* p) const { X509_REQ_free(p); } };
using UniqueReq = std::unique_ptr<X509_REQ, X509ReqDeleter>;

/**
 * @brief Drain the thread's OpenSSL error queue into one message
 * @param context Prefix naming the failed operation
 */
inline std::string drainOpenSslErrors(const std::string& context) {
    std::string message = context;
    unsigned long code = 0;
    bool first = true;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        message += first ? ": " : "; ";
        message += buf;
        first = false;
    }
    return message;
}

/**
 * @brief Read everything written to a memory BIO
 */
inline std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || !data) return "";
    return std::string(data, static_cast<size_t>(len));
}

/**
 * @brief Parse a PEM private key (PKCS#8 or traditional)
 * @throws CryptoException on malformed key
 */
UniqueKey loadPrivateKeyPem(const std::string& pem);

/**
 * @brief Parse a PEM SubjectPublicKeyInfo
 * @throws CryptoException on malformed key
 */
UniqueKey loadPublicKeyPem(const std::string& pem);

} // namespace zatca::crypto
