/**
 * @file xml_builder.h
 * @brief UBL 2.1 invoice rendering (pugixml)
 *
 * Pure functions: no I/O, no shared state, safe to call concurrently.
 * Every caller-supplied text value passes through escapeXml() on its way
 * into the document tree; amounts are always rendered with two decimals.
 */

#pragma once

#include <string>

#include "zatca/invoice/invoice_types.h"

namespace zatca::invoice {

/**
 * @brief Escape &, <, >, " and ' for XML text and attribute content
 *
 * Control characters not allowed in XML 1.0 (other than tab, LF, CR) are dropped.
 */
std::string escapeXml(const std::string& text);

/**
 * @brief Material embedded by buildSignedInvoiceXml()
 */
struct InvoiceSignature {
    std::string invoiceHash;     ///< Base64 SHA-256 of the unsigned invoice (ds:DigestValue)
    std::string signatureValue;  ///< Base64 signature over invoiceHash
    std::string certificate;     ///< Base64 DER certificate; KeyInfo omitted when empty
    std::string qrCode;          ///< Base64 TLV; QR reference omitted when empty
};

/**
 * @brief Render a full invoice (standard or simplified per request.kind)
 *
 * ICV and PIH are embedded as AdditionalDocumentReference elements.
 * Debit and credit notes carry a BillingReference to the original invoice.
 * This is the document the invoice hash is computed over.
 */
std::string buildInvoiceXml(const InvoiceRequest& request);

/**
 * @brief Render the invoice with its enveloped signature
 *
 * Identical to buildInvoiceXml() plus the three parts excluded from the
 * invoice hash: ext:UBLExtensions (ds:Signature), the QR document
 * reference and cac:Signature.
 */
std::string buildSignedInvoiceXml(const InvoiceRequest& request, const InvoiceSignature& signature);

/**
 * @brief Render a simplified (B2C) invoice
 */
std::string buildSimplifiedInvoiceXml(const SimplifiedInvoiceData& data);

} // namespace zatca::invoice
