#include "zatca/invoice/invoice_types.h"

namespace zatca::invoice {

std::string invoiceSubtypeName(InvoiceKind kind) {
    return kind == InvoiceKind::SIMPLIFIED ? "0200000" : "0100000";
}

InvoiceRequest toInvoiceRequest(const SimplifiedInvoiceData& data) {
    InvoiceRequest request;
    request.invoiceNumber = data.invoiceNumber;
    request.uuid = data.uuid;
    request.issueDate = data.issueDate;
    request.issueTime = data.issueTime;
    request.typeCode = kTaxInvoice;
    request.kind = InvoiceKind::SIMPLIFIED;
    request.currency = data.currency;
    request.seller = data.seller;
    request.lineItems = data.lineItems;
    request.invoiceCounterValue = data.invoiceCounterValue;
    request.previousInvoiceHash = data.previousInvoiceHash;
    return request;
}

bool isCreditOrDebitNote(const std::string& typeCode) {
    return typeCode == kCreditNote || typeCode == kDebitNote;
}

} // namespace zatca::invoice
