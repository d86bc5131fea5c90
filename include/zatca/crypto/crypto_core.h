/**
 * @file crypto_core.h
 * @brief Hashing, EC key generation and signing for the invoice chain
 *
 * hash() feeds both the invoice chain (PIH) and the QR payload (tag 6).
 * Signing functions accept PEM key material; malformed keys throw
 * CryptoException and are never retried.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace zatca::crypto {

/// @brief Default signing curve (OpenSSL short name)
constexpr const char* kDefaultCurve = "secp256k1";

struct KeyPair {
    std::string privateKeyPem;  ///< PKCS#8 PEM
    std::string publicKeyPem;   ///< SubjectPublicKeyInfo PEM
};

/**
 * @brief SHA-256 digest, Base64-encoded
 */
std::string hash(const std::string& text);
std::string hash(const std::vector<uint8_t>& bytes);

/**
 * @brief Raw SHA-256 digest (32 bytes)
 */
std::vector<uint8_t> sha256(const uint8_t* data, size_t length);

/**
 * @brief PIH seeding every new chain: hash("0")
 */
std::string initialPreviousHash();

/**
 * @brief Generate an EC key pair on a named curve
 * @param curve OpenSSL curve short name (e.g. "secp256k1", "prime256v1") or NIST name ("P-256")
 * @throws CryptoException on unknown curve or key generation failure
 */
KeyPair generateKeyPair(const std::string& curve = kDefaultCurve);

/**
 * @brief Sign data with SHA-256
 * @param data Bytes to sign (for invoices: the Base64 invoice hash)
 * @param privateKeyPem PEM private key (PKCS#8 or traditional EC)
 * @return Base64 DER signature
 * @throws CryptoException on malformed key or signing failure
 */
std::string sign(const std::string& data, const std::string& privateKeyPem);

/**
 * @brief Verify a Base64 DER signature produced by sign()
 * @return true only when the signature is valid for data
 * @throws CryptoException on malformed public key
 */
bool verify(const std::string& data, const std::string& signatureB64, const std::string& publicKeyPem);

/**
 * @brief Derive the public key PEM from a private key PEM
 * @throws CryptoException on malformed key
 */
std::string publicKeyFromPrivate(const std::string& privateKeyPem);

} // namespace zatca::crypto
