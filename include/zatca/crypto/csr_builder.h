/**
 * @file csr_builder.h
 * @brief PKCS#10 certificate signing request for CSID onboarding
 *
 * Subject: C, OU, O, CN.
 * subjectAltName dirName: SN (EGS serial number), UID (VAT number),
 * title (invoice type), registeredAddress (location), businessCategory (industry).
 * Certificate template extension (1.3.6.1.4.1.311.20.2) selects the
 * regulator's code-signing profile for the onboarding environment.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "zatca/common/engine_config.h"

namespace zatca::crypto {

struct CsrConfig {
    std::string commonName;
    std::string serialNumber;            ///< e.g. "1-Solution|2-Model|3-<device uuid>"
    std::string organizationIdentifier;  ///< VAT number (UID); omitted when empty
    std::string organizationName;
    std::optional<std::string> organizationUnitName;
    std::string countryName;             ///< ISO 3166 alpha-2
    std::string invoiceType;             ///< e.g. "1100" (standard + simplified)
    std::string location;
    std::string industry;
};

/// @brief Parsed view of a generated CSR
struct CsrInfo {
    std::string subject;                 ///< RFC 2253 one-line subject
    std::vector<uint8_t> requestInfoDer; ///< DER of the to-be-signed CertificationRequestInfo
    std::string templateName;
    bool signatureValid = false;
};

/**
 * @brief Certificate template name for an onboarding environment
 */
std::string certificateTemplateName(common::ZatcaEnvironment environment);

/**
 * @brief Build and sign a CSR
 *
 * Identical config and key produce an identical subject and request info;
 * only the ECDSA signature differs between calls.
 *
 * @param config Subject fields; all mandatory except organizationUnitName
 * @param privateKeyPem Signing key; its public half goes into the request
 * @param environment Selects the certificate template name
 * @return Base64 of the PEM-encoded request
 * @throws CsrException naming the first missing mandatory field
 * @throws CryptoException on malformed key or OpenSSL failure
 */
std::string generateCsr(const CsrConfig& config,
                        const std::string& privateKeyPem,
                        common::ZatcaEnvironment environment = common::ZatcaEnvironment::SANDBOX);

/**
 * @brief Decode a CSR produced by generateCsr()
 * @throws ParsingException when the input is not a Base64 PEM request
 */
CsrInfo inspectCsr(const std::string& csrB64);

} // namespace zatca::crypto
