/**
 * @file crypto_core.cpp
 * @brief SHA-256 hashing, EC key generation and ECDSA signing (OpenSSL EVP)
 */

#include "zatca/crypto/crypto_core.h"
#include "zatca/crypto/openssl_types.h"
#include "zatca/common/base64.h"
#include "zatca/common/exceptions.h"

#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

namespace zatca::crypto {

using common::Base64;
using common::CryptoException;

UniqueKey loadPrivateKeyPem(const std::string& pem) {
    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoException(drainOpenSslErrors("BIO_new_mem_buf failed"));
    }
    UniqueKey key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw CryptoException(drainOpenSslErrors("malformed private key"));
    }
    return key;
}

UniqueKey loadPublicKeyPem(const std::string& pem) {
    UniqueBio bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw CryptoException(drainOpenSslErrors("BIO_new_mem_buf failed"));
    }
    UniqueKey key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        throw CryptoException(drainOpenSslErrors("malformed public key"));
    }
    return key;
}

namespace {

std::string writePublicKey(EVP_PKEY* key) {
    UniqueBio bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key) != 1) {
        throw CryptoException(drainOpenSslErrors("public key PEM export failed"));
    }
    return bioToString(bio.get());
}

int curveNid(const std::string& curve) {
    int nid = OBJ_sn2nid(curve.c_str());
    if (nid == NID_undef) nid = OBJ_ln2nid(curve.c_str());
    if (nid == NID_undef) nid = EC_curve_nist2nid(curve.c_str());
    return nid;
}

} // namespace

std::vector<uint8_t> sha256(const uint8_t* data, size_t length) {
    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digestLen = 0;
    if (EVP_Digest(data, length, digest.data(), &digestLen, EVP_sha256(), nullptr) != 1) {
        throw CryptoException(drainOpenSslErrors("SHA-256 failed"));
    }
    digest.resize(digestLen);
    return digest;
}

std::string hash(const std::string& text) {
    return Base64::encode(sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::string hash(const std::vector<uint8_t>& bytes) {
    return Base64::encode(sha256(bytes.data(), bytes.size()));
}

std::string initialPreviousHash() {
    return hash(std::string("0"));
}

KeyPair generateKeyPair(const std::string& curve) {
    int nid = curveNid(curve);
    if (nid == NID_undef) {
        throw CryptoException("unknown EC curve: " + curve);
    }

    UniqueKeyCtx ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
    if (!ctx ||
        EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), nid) <= 0 ||
        EVP_PKEY_CTX_set_ec_param_enc(ctx.get(), OPENSSL_EC_NAMED_CURVE) <= 0) {
        throw CryptoException(drainOpenSslErrors("EC keygen setup failed for " + curve));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw CryptoException(drainOpenSslErrors("EC key generation failed for " + curve));
    }
    UniqueKey key(raw);

    UniqueBio privBio(BIO_new(BIO_s_mem()));
    if (!privBio ||
        PEM_write_bio_PrivateKey(privBio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw CryptoException(drainOpenSslErrors("private key PEM export failed"));
    }

    KeyPair pair;
    pair.privateKeyPem = bioToString(privBio.get());
    pair.publicKeyPem = writePublicKey(key.get());
    return pair;
}

std::string sign(const std::string& data, const std::string& privateKeyPem) {
    UniqueKey key = loadPrivateKeyPem(privateKeyPem);

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        throw CryptoException(drainOpenSslErrors("EVP_DigestSignInit failed"));
    }

    const auto* in = reinterpret_cast<const unsigned char*>(data.data());
    size_t sigLen = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sigLen, in, data.size()) != 1) {
        throw CryptoException(drainOpenSslErrors("signature size query failed"));
    }

    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sigLen, in, data.size()) != 1) {
        throw CryptoException(drainOpenSslErrors("signing failed"));
    }
    signature.resize(sigLen);

    return Base64::encode(signature);
}

bool verify(const std::string& data, const std::string& signatureB64, const std::string& publicKeyPem) {
    UniqueKey key = loadPublicKeyPem(publicKeyPem);

    if (signatureB64.empty() || !Base64::isValid(signatureB64)) {
        return false;
    }
    std::vector<uint8_t> signature = Base64::decode(signatureB64);

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1) {
        throw CryptoException(drainOpenSslErrors("EVP_DigestVerifyInit failed"));
    }

    int rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                              reinterpret_cast<const unsigned char*>(data.data()), data.size());
    if (rc != 1) {
        ERR_clear_error();
    }
    return rc == 1;
}

std::string publicKeyFromPrivate(const std::string& privateKeyPem) {
    UniqueKey key = loadPrivateKeyPem(privateKeyPem);
    return writePublicKey(key.get());
}

} // namespace zatca::crypto
