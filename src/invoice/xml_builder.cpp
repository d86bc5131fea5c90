/**
 * @file xml_builder.cpp
 * @brief UBL 2.1 invoice rendering
 */

#include "zatca/invoice/xml_builder.h"
#include "zatca/invoice/invoice_totals.h"

#include <sstream>
#include <pugixml.hpp>

namespace zatca::invoice {

namespace {

constexpr const char* kProfileId = "reporting:1.0";
constexpr const char* kSignatureId = "urn:oasis:names:specification:ubl:signature:Invoice";
constexpr const char* kSignatureMethod = "urn:oasis:names:specification:ubl:dsig:enveloped:xades";

// Values enter the tree already escaped; the document is saved with
// format_no_escapes so each value is escaped exactly once.
constexpr unsigned int kSaveFlags = pugi::format_indent | pugi::format_no_escapes;

void setAttribute(pugi::xml_node node, const char* name, const std::string& value) {
    node.append_attribute(name).set_value(escapeXml(value).c_str());
}

pugi::xml_node appendText(pugi::xml_node parent, const char* name, const std::string& text) {
    pugi::xml_node node = parent.append_child(name);
    node.text().set(escapeXml(text).c_str());
    return node;
}

/// Optional UBL elements must not be rendered empty
void appendOptional(pugi::xml_node parent, const char* name, const std::string& text) {
    if (!text.empty()) appendText(parent, name, text);
}

void appendAmount(pugi::xml_node parent, const char* name, double value, const std::string& currency) {
    setAttribute(appendText(parent, name, formatAmount(value)), "currencyID", currency);
}

void appendTaxScheme(pugi::xml_node parent) {
    appendText(parent.append_child("cac:TaxScheme"), "cbc:ID", "VAT");
}

void appendParty(pugi::xml_node parent, const char* role, const Party& party) {
    pugi::xml_node p = parent.append_child(role).append_child("cac:Party");

    if (party.crn && !party.crn->empty()) {
        pugi::xml_node id = appendText(p.append_child("cac:PartyIdentification"), "cbc:ID", *party.crn);
        setAttribute(id, "schemeID", "CRN");
    }

    pugi::xml_node address = p.append_child("cac:PostalAddress");
    appendOptional(address, "cbc:StreetName", party.address.street);
    appendOptional(address, "cbc:BuildingNumber", party.address.buildingNumber);
    appendOptional(address, "cbc:CitySubdivisionName", party.address.district);
    appendOptional(address, "cbc:CityName", party.address.city);
    appendOptional(address, "cbc:PostalZone", party.address.postalCode);
    appendText(address.append_child("cac:Country"), "cbc:IdentificationCode",
               party.address.country.empty() ? "SA" : party.address.country);

    if (!party.vatNumber.empty()) {
        pugi::xml_node taxScheme = p.append_child("cac:PartyTaxScheme");
        appendText(taxScheme, "cbc:CompanyID", party.vatNumber);
        appendTaxScheme(taxScheme);
    }

    appendText(p.append_child("cac:PartyLegalEntity"), "cbc:RegistrationName", party.name);
}

void appendEmbeddedReference(pugi::xml_node parent, const char* id, const std::string& value) {
    pugi::xml_node ref = parent.append_child("cac:AdditionalDocumentReference");
    appendText(ref, "cbc:ID", id);
    pugi::xml_node object = appendText(ref.append_child("cac:Attachment"),
                                       "cbc:EmbeddedDocumentBinaryObject", value);
    setAttribute(object, "mimeCode", "text/plain");
}

void appendChainReferences(pugi::xml_node parent, const InvoiceRequest& request) {
    pugi::xml_node icv = parent.append_child("cac:AdditionalDocumentReference");
    appendText(icv, "cbc:ID", "ICV");
    appendText(icv, "cbc:UUID", std::to_string(request.invoiceCounterValue));

    appendEmbeddedReference(parent, "PIH", request.previousInvoiceHash);
}

void appendAlgorithm(pugi::xml_node parent, const char* name, const char* algorithm) {
    setAttribute(parent.append_child(name), "Algorithm", algorithm);
}

void appendSignatureExtension(pugi::xml_node invoice, const InvoiceSignature& signature) {
    pugi::xml_node extension = invoice.append_child("ext:UBLExtensions").append_child("ext:UBLExtension");
    appendText(extension, "ext:ExtensionURI", kSignatureMethod);

    pugi::xml_node signatures = extension.append_child("ext:ExtensionContent")
                                         .append_child("sig:UBLDocumentSignatures");
    setAttribute(signatures, "xmlns:sig", "urn:oasis:names:specification:ubl:schema:xsd:CommonSignatureComponents-2");
    setAttribute(signatures, "xmlns:sac", "urn:oasis:names:specification:ubl:schema:xsd:SignatureAggregateComponents-2");
    setAttribute(signatures, "xmlns:sbc", "urn:oasis:names:specification:ubl:schema:xsd:SignatureBasicComponents-2");

    pugi::xml_node information = signatures.append_child("sac:SignatureInformation");
    appendText(information, "cbc:ID", "urn:oasis:names:specification:ubl:signature:1");
    appendText(information, "sbc:ReferencedSignatureID", kSignatureId);

    pugi::xml_node ds = information.append_child("ds:Signature");
    setAttribute(ds, "xmlns:ds", "http://www.w3.org/2000/09/xmldsig#");
    setAttribute(ds, "Id", "signature");

    pugi::xml_node signedInfo = ds.append_child("ds:SignedInfo");
    appendAlgorithm(signedInfo, "ds:CanonicalizationMethod", "http://www.w3.org/2006/12/xml-c14n11");
    appendAlgorithm(signedInfo, "ds:SignatureMethod", "http://www.w3.org/2001/04/xmldsig-more#ecdsa-sha256");

    pugi::xml_node reference = signedInfo.append_child("ds:Reference");
    setAttribute(reference, "Id", "invoiceSignedData");
    setAttribute(reference, "URI", "");
    appendAlgorithm(reference, "ds:DigestMethod", "http://www.w3.org/2001/04/xmlenc#sha256");
    appendText(reference, "ds:DigestValue", signature.invoiceHash);

    appendText(ds, "ds:SignatureValue", signature.signatureValue);

    if (!signature.certificate.empty()) {
        appendText(ds.append_child("ds:KeyInfo").append_child("ds:X509Data"),
                   "ds:X509Certificate", signature.certificate);
    }
}

void appendTaxTotals(pugi::xml_node parent, const InvoiceTotals& totals, const std::string& currency) {
    // First TaxTotal: tax currency amount only
    appendAmount(parent.append_child("cac:TaxTotal"), "cbc:TaxAmount", totals.taxAmount, currency);

    pugi::xml_node taxTotal = parent.append_child("cac:TaxTotal");
    appendAmount(taxTotal, "cbc:TaxAmount", totals.taxAmount, currency);
    for (const auto& subtotal : totals.subtotals) {
        pugi::xml_node sub = taxTotal.append_child("cac:TaxSubtotal");
        appendAmount(sub, "cbc:TaxableAmount", subtotal.taxableAmount, currency);
        appendAmount(sub, "cbc:TaxAmount", subtotal.taxAmount, currency);

        pugi::xml_node category = sub.append_child("cac:TaxCategory");
        appendText(category, "cbc:ID", subtotal.category);
        appendText(category, "cbc:Percent", formatAmount(subtotal.rate));
        if (subtotal.category == "Z") {
            appendText(category, "cbc:TaxExemptionReasonCode", "VATEX-SA-35");
            appendText(category, "cbc:TaxExemptionReason", "Zero rated supply");
        }
        appendTaxScheme(category);
    }
}

void appendLine(pugi::xml_node parent, size_t index, const LineItem& item, const LineTotals& line,
                const std::string& currency) {
    pugi::xml_node node = parent.append_child("cac:InvoiceLine");
    appendText(node, "cbc:ID", std::to_string(index + 1));
    setAttribute(appendText(node, "cbc:InvoicedQuantity", formatQuantity(item.quantity)), "unitCode", "PCE");
    appendAmount(node, "cbc:LineExtensionAmount", line.lineExtensionAmount, currency);

    pugi::xml_node taxTotal = node.append_child("cac:TaxTotal");
    appendAmount(taxTotal, "cbc:TaxAmount", line.taxAmount, currency);
    appendAmount(taxTotal, "cbc:RoundingAmount", line.amountWithVat, currency);

    pugi::xml_node itemNode = node.append_child("cac:Item");
    appendText(itemNode, "cbc:Name", item.name);
    pugi::xml_node category = itemNode.append_child("cac:ClassifiedTaxCategory");
    appendText(category, "cbc:ID", vatCategory(item.vatRate));
    appendText(category, "cbc:Percent", formatAmount(item.vatRate));
    appendTaxScheme(category);

    appendAmount(node.append_child("cac:Price"), "cbc:PriceAmount", item.unitPrice, currency);
}

std::string render(const InvoiceRequest& request, const InvoiceSignature* signature) {
    InvoiceTotals totals = computeTotals(request.lineItems);
    const std::string currency = request.currency.empty() ? kDefaultCurrency : request.currency;

    pugi::xml_document doc;
    pugi::xml_node decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version").set_value("1.0");
    decl.append_attribute("encoding").set_value("UTF-8");

    pugi::xml_node invoice = doc.append_child("Invoice");
    setAttribute(invoice, "xmlns", "urn:oasis:names:specification:ubl:schema:xsd:Invoice-2");
    setAttribute(invoice, "xmlns:cac", "urn:oasis:names:specification:ubl:schema:xsd:CommonAggregateComponents-2");
    setAttribute(invoice, "xmlns:cbc", "urn:oasis:names:specification:ubl:schema:xsd:CommonBasicComponents-2");
    setAttribute(invoice, "xmlns:ext", "urn:oasis:names:specification:ubl:schema:xsd:CommonExtensionComponents-2");

    if (signature) {
        appendSignatureExtension(invoice, *signature);
    }

    appendText(invoice, "cbc:ProfileID", kProfileId);
    appendText(invoice, "cbc:ID", request.invoiceNumber);
    appendText(invoice, "cbc:UUID", request.uuid);
    appendText(invoice, "cbc:IssueDate", request.issueDate);
    appendText(invoice, "cbc:IssueTime", request.issueTime);
    setAttribute(appendText(invoice, "cbc:InvoiceTypeCode", request.typeCode),
                 "name", invoiceSubtypeName(request.kind));
    appendText(invoice, "cbc:DocumentCurrencyCode", currency);
    appendText(invoice, "cbc:TaxCurrencyCode", currency);

    if (request.billingReference) {
        appendText(invoice.append_child("cac:BillingReference").append_child("cac:InvoiceDocumentReference"),
                   "cbc:ID", request.billingReference->invoiceNumber);
    }

    appendChainReferences(invoice, request);

    if (signature) {
        if (!signature->qrCode.empty()) {
            appendEmbeddedReference(invoice, "QR", signature->qrCode);
        }
        pugi::xml_node sig = invoice.append_child("cac:Signature");
        appendText(sig, "cbc:ID", kSignatureId);
        appendText(sig, "cbc:SignatureMethod", kSignatureMethod);
    }

    appendParty(invoice, "cac:AccountingSupplierParty", request.seller);
    if (request.buyer) {
        appendParty(invoice, "cac:AccountingCustomerParty", *request.buyer);
    }

    if (isCreditOrDebitNote(request.typeCode) && request.billingReference) {
        pugi::xml_node means = invoice.append_child("cac:PaymentMeans");
        appendText(means, "cbc:PaymentMeansCode", request.paymentMeansCode);
        appendOptional(means, "cbc:InstructionNote", request.billingReference->reason);
    }

    appendTaxTotals(invoice, totals, currency);

    pugi::xml_node monetary = invoice.append_child("cac:LegalMonetaryTotal");
    appendAmount(monetary, "cbc:LineExtensionAmount", totals.lineExtensionAmount, currency);
    appendAmount(monetary, "cbc:TaxExclusiveAmount", totals.taxExclusiveAmount, currency);
    appendAmount(monetary, "cbc:TaxInclusiveAmount", totals.taxInclusiveAmount, currency);
    appendAmount(monetary, "cbc:PayableAmount", totals.payableAmount, currency);

    for (size_t i = 0; i < request.lineItems.size(); i++) {
        appendLine(invoice, i, request.lineItems[i], totals.lines[i], currency);
    }

    std::ostringstream out;
    doc.save(out, "    ", kSaveFlags, pugi::encoding_utf8);
    return out.str();
}

} // namespace

std::string escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 8);

    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: {
                auto u = static_cast<unsigned char>(c);
                if (u < 0x20 && c != '\t' && c != '\n' && c != '\r') break;
                out += c;
            }
        }
    }
    return out;
}

std::string buildInvoiceXml(const InvoiceRequest& request) {
    return render(request, nullptr);
}

std::string buildSignedInvoiceXml(const InvoiceRequest& request, const InvoiceSignature& signature) {
    return render(request, &signature);
}

std::string buildSimplifiedInvoiceXml(const SimplifiedInvoiceData& data) {
    return buildInvoiceXml(toInvoiceRequest(data));
}

} // namespace zatca::invoice
