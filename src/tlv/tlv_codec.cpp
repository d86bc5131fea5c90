/**
 * @file tlv_codec.cpp
 * @brief TLV codec implementation
 */

#include "zatca/tlv/tlv_codec.h"
#include "zatca/common/base64.h"
#include "zatca/common/exceptions.h"

namespace zatca::tlv {

using common::TlvException;

std::vector<uint8_t> encode(uint8_t tag, const std::vector<uint8_t>& value) {
    if (value.size() > kMaxValueLength) {
        throw TlvException("value for tag " + std::to_string(tag) + " is " +
                           std::to_string(value.size()) + " bytes (max " +
                           std::to_string(kMaxValueLength) + ")");
    }

    std::vector<uint8_t> out;
    out.reserve(value.size() + 2);
    out.push_back(tag);
    out.push_back(static_cast<uint8_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
    return out;
}

std::vector<uint8_t> encode(uint8_t tag, const std::string& value) {
    return encode(tag, std::vector<uint8_t>(value.begin(), value.end()));
}

std::vector<uint8_t> encodeRecords(const std::vector<TlvRecord>& records) {
    std::vector<uint8_t> out;
    for (const auto& record : records) {
        auto encoded = encode(record.tag, record.value);
        out.insert(out.end(), encoded.begin(), encoded.end());
    }
    return out;
}

std::string encodeSequence(const std::vector<TlvRecord>& records) {
    return common::Base64::encode(encodeRecords(records));
}

std::vector<TlvRecord> decode(const std::vector<uint8_t>& bytes) {
    std::vector<TlvRecord> records;
    size_t off = 0;

    while (off < bytes.size()) {
        if (off + 2 > bytes.size()) {
            throw TlvException("truncated record header at offset " + std::to_string(off));
        }
        uint8_t tag = bytes[off];
        size_t length = bytes[off + 1];
        off += 2;

        if (off + length > bytes.size()) {
            throw TlvException("length " + std::to_string(length) + " of tag " +
                               std::to_string(tag) + " runs past end of buffer");
        }

        records.emplace_back(tag, std::vector<uint8_t>(bytes.begin() + off, bytes.begin() + off + length));
        off += length;
    }

    return records;
}

std::vector<TlvRecord> decodeBase64(const std::string& payload) {
    return decode(common::Base64::decode(payload));
}

std::string buildBasicQr(const std::string& sellerName,
                         const std::string& vatNumber,
                         const std::string& timestamp,
                         const std::string& invoiceTotal,
                         const std::string& vatTotal) {
    return encodeSequence({
        TlvRecord(QrTag::SELLER_NAME, sellerName),
        TlvRecord(QrTag::VAT_NUMBER, vatNumber),
        TlvRecord(QrTag::TIMESTAMP, timestamp),
        TlvRecord(QrTag::INVOICE_TOTAL, invoiceTotal),
        TlvRecord(QrTag::VAT_TOTAL, vatTotal),
    });
}

} // namespace zatca::tlv
