/**
 * @file tlv_codec.h
 * @brief Tag-Length-Value codec for e-invoice QR payloads
 *
 * Record layout: <tag:1><length:1><value:length>. A QR payload is the
 * Base64 encoding of concatenated records. The 1-byte length field caps a
 * value at 255 bytes; longer values are rejected, never truncated.
 *
 * All functions are pure and thread-safe.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace zatca::tlv {

/// @brief Largest value the 1-byte length field can describe
constexpr size_t kMaxValueLength = 255;

/// @brief QR payload tags (basic: 1-5, Phase-2 adds 6-9). Order is fixed by the regulator.
enum class QrTag : uint8_t {
    SELLER_NAME = 1,
    VAT_NUMBER = 2,
    TIMESTAMP = 3,
    INVOICE_TOTAL = 4,
    VAT_TOTAL = 5,
    INVOICE_HASH = 6,
    DIGITAL_SIGNATURE = 7,
    PUBLIC_KEY = 8,
    CERTIFICATE_SIGNATURE = 9
};

struct TlvRecord {
    uint8_t tag = 0;
    std::vector<uint8_t> value;

    TlvRecord() = default;
    TlvRecord(uint8_t t, std::vector<uint8_t> v) : tag(t), value(std::move(v)) {}
    TlvRecord(uint8_t t, const std::string& text) : tag(t), value(text.begin(), text.end()) {}
    TlvRecord(QrTag t, std::vector<uint8_t> v) : tag(static_cast<uint8_t>(t)), value(std::move(v)) {}
    TlvRecord(QrTag t, const std::string& text) : tag(static_cast<uint8_t>(t)), value(text.begin(), text.end()) {}

    std::string valueAsString() const { return std::string(value.begin(), value.end()); }

    bool operator==(const TlvRecord& other) const {
        return tag == other.tag && value == other.value;
    }
};

/**
 * @brief Encode one record
 * @throws TlvException if value is longer than 255 bytes
 */
std::vector<uint8_t> encode(uint8_t tag, const std::vector<uint8_t>& value);

/**
 * @brief Encode one record from UTF-8 text
 * @throws TlvException if the UTF-8 byte length exceeds 255
 */
std::vector<uint8_t> encode(uint8_t tag, const std::string& value);

/**
 * @brief Concatenate records in the given order (no Base64)
 * @throws TlvException if any value exceeds 255 bytes
 */
std::vector<uint8_t> encodeRecords(const std::vector<TlvRecord>& records);

/**
 * @brief Concatenate records and Base64-encode the result
 * @throws TlvException if any value exceeds 255 bytes
 */
std::string encodeSequence(const std::vector<TlvRecord>& records);

/**
 * @brief Decode concatenated records
 * @throws TlvException on a truncated header or a length running past the buffer
 */
std::vector<TlvRecord> decode(const std::vector<uint8_t>& bytes);

/**
 * @brief Base64-decode a QR payload and decode its records
 * @throws ParsingException on invalid Base64, TlvException on malformed records
 */
std::vector<TlvRecord> decodeBase64(const std::string& payload);

/**
 * @brief Basic (Phase-1) QR payload: tags 1-5
 *
 * @param sellerName Seller registration name (UTF-8)
 * @param vatNumber Seller VAT registration number
 * @param timestamp Invoice timestamp, ISO 8601
 * @param invoiceTotal Tax-inclusive total, formatted decimal string
 * @param vatTotal VAT total, formatted decimal string
 * @return Base64 payload
 */
std::string buildBasicQr(const std::string& sellerName,
                         const std::string& vatNumber,
                         const std::string& timestamp,
                         const std::string& invoiceTotal,
                         const std::string& vatTotal);

} // namespace zatca::tlv
