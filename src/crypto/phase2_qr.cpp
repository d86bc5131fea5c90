#include "zatca/crypto/phase2_qr.h"
#include "zatca/common/base64.h"
#include "zatca/tlv/tlv_codec.h"

namespace zatca::crypto {

using tlv::QrTag;
using tlv::TlvRecord;

std::string assemblePhase2Tlv(const std::string& sellerName,
                              const std::string& vatNumber,
                              const std::string& timestamp,
                              const std::string& total,
                              const std::string& vatTotal,
                              const std::string& invoiceHash,
                              const std::string& signature,
                              const std::string& publicKey,
                              const std::string& certSignature) {
    return tlv::encodeSequence({
        TlvRecord(QrTag::SELLER_NAME, sellerName),
        TlvRecord(QrTag::VAT_NUMBER, vatNumber),
        TlvRecord(QrTag::TIMESTAMP, timestamp),
        TlvRecord(QrTag::INVOICE_TOTAL, total),
        TlvRecord(QrTag::VAT_TOTAL, vatTotal),
        TlvRecord(QrTag::INVOICE_HASH, common::Base64::decode(invoiceHash)),
        TlvRecord(QrTag::DIGITAL_SIGNATURE, common::Base64::decode(signature)),
        TlvRecord(QrTag::PUBLIC_KEY, publicKey),
        TlvRecord(QrTag::CERTIFICATE_SIGNATURE, common::Base64::decode(certSignature)),
    });
}

} // namespace zatca::crypto
