/**
 * @file certificate_utils.h
 * @brief X.509 helpers for regulator-issued CSID certificates
 *
 * The CSID binarySecurityToken is Base64 of the Base64 DER certificate body.
 * Parsing also accepts a plain Base64 DER body or a PEM block.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "zatca/crypto/openssl_types.h"

namespace zatca::crypto {

/**
 * @brief Parse a CSID binarySecurityToken into a certificate
 * @throws ParsingException if no certificate can be decoded
 */
UniqueCert parseBinarySecurityToken(const std::string& token);

/**
 * @brief Parse a PEM certificate
 * @throws ParsingException on malformed input
 */
UniqueCert parseCertificatePem(const std::string& pem);

/**
 * @brief Certificate signature value, Base64 (QR tag 9)
 */
std::string certificateSignature(X509* cert);

/**
 * @brief Base64 DER SubjectPublicKeyInfo (QR tag 8)
 */
std::string certificatePublicKey(X509* cert);

/**
 * @brief Base64 DER certificate body, as carried in ds:X509Certificate
 */
std::string certificateDer(X509* cert);

/**
 * @brief Certificate notAfter, or std::nullopt when unreadable
 */
std::optional<std::chrono::system_clock::time_point> certificateNotAfter(X509* cert);

/**
 * @brief Check that a certificate carries the public half of a private key
 */
bool certificateMatchesKey(X509* cert, const std::string& privateKeyPem);

} // namespace zatca::crypto
