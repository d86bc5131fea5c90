/**
 * @file phase2_qr.h
 * @brief Phase-2 QR payload assembly (TLV tags 1-9)
 */

#pragma once

#include <string>

namespace zatca::crypto {

/**
 * @brief TLV-encode all nine QR fields in fixed tag order and Base64 the result
 *
 * Tags 1-5 carry UTF-8 text. Tags 6, 7 and 9 carry the raw bytes behind the
 * Base64 inputs; tag 8 carries the public key text as given.
 *
 * @throws TlvException if any value exceeds 255 bytes
 * @throws ParsingException if invoiceHash, signature or certSignature is not Base64
 */
std::string assemblePhase2Tlv(const std::string& sellerName,
                              const std::string& vatNumber,
                              const std::string& timestamp,
                              const std::string& total,
                              const std::string& vatTotal,
                              const std::string& invoiceHash,
                              const std::string& signature,
                              const std::string& publicKey,
                              const std::string& certSignature);

} // namespace zatca::crypto
