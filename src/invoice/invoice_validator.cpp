/**
 * @file invoice_validator.cpp
 * @brief Invoice pre-flight validation
 */

#include "zatca/invoice/invoice_validator.h"
#include "zatca/common/uuid.h"
#include "zatca/tlv/tlv_codec.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace zatca::invoice {

namespace {

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

bool withinLineLimit(double value) {
    return std::isfinite(value) && std::fabs(value) <= kMaxLineAmount;
}

bool hasCode(const std::vector<ValidationIssue>& issues, const std::string& code) {
    return std::any_of(issues.begin(), issues.end(),
        [&](const ValidationIssue& i) { return i.code == code; });
}

} // namespace

bool InvoiceValidationResult::hasError(const std::string& code) const {
    return hasCode(errors, code);
}

bool InvoiceValidationResult::hasWarning(const std::string& code) const {
    return hasCode(warnings, code);
}

bool isValidVatNumber(const std::string& vatNumber) {
    return vatNumber.size() == 15 && allDigits(vatNumber) &&
           vatNumber.front() == '3' && vatNumber.back() == '3';
}

bool isValidIsoDate(const std::string& date) {
    static const std::regex pattern(R"(^\d{4}-(0[1-9]|1[0-2])-(0[1-9]|[12]\d|3[01])$)");
    return std::regex_match(date, pattern);
}

bool isValidIsoTime(const std::string& time) {
    static const std::regex pattern(R"(^([01]\d|2[0-3]):[0-5]\d:[0-5]\d$)");
    return std::regex_match(time, pattern);
}

InvoiceValidationResult validateInvoice(const InvoiceRequest& request, bool checkChain) {
    InvoiceValidationResult result;
    auto error = [&](const char* code, const char* category, std::string message) {
        result.errors.push_back({code, category, std::move(message)});
    };
    auto warning = [&](const char* code, const char* category, std::string message) {
        result.warnings.push_back({code, category, std::move(message)});
    };

    // --- Invoice header ---
    if (isBlank(request.invoiceNumber)) {
        error("INV-001", "INVOICE", "Invoice number is required");
    }
    if (!common::Uuid::isValid(request.uuid)) {
        error("INV-002", "INVOICE", "Invoice UUID is not a valid UUID: " + request.uuid);
    }
    if (request.typeCode != kTaxInvoice && request.typeCode != kDebitNote &&
        request.typeCode != kCreditNote) {
        error("INV-003", "INVOICE", "Unsupported invoice type code: " + request.typeCode);
    }
    if (!isValidIsoDate(request.issueDate)) {
        error("INV-004", "INVOICE", "Issue date must be YYYY-MM-DD: " + request.issueDate);
    }
    if (!isValidIsoTime(request.issueTime)) {
        error("INV-005", "INVOICE", "Issue time must be HH:MM:SS: " + request.issueTime);
    }

    // --- Seller ---
    if (isBlank(request.seller.name)) {
        error("SEL-001", "SELLER", "Seller name is required");
    }
    if (!isValidVatNumber(request.seller.vatNumber)) {
        error("SEL-002", "SELLER",
              "Seller VAT number must be 15 digits starting and ending with 3");
    }
    // Seller name and VAT number become QR tags 1 and 2
    if (request.seller.name.size() > tlv::kMaxValueLength) {
        error("SEL-003", "SELLER", "Seller name exceeds " + std::to_string(tlv::kMaxValueLength) +
                                   " bytes (" + std::to_string(request.seller.name.size()) + ")");
    }
    if (request.seller.vatNumber.size() > tlv::kMaxValueLength) {
        error("SEL-003", "SELLER", "Seller VAT number exceeds " +
                                   std::to_string(tlv::kMaxValueLength) + " bytes");
    }
    const std::string& postal = request.seller.address.postalCode;
    if (!postal.empty() && (postal.size() != 5 || !allDigits(postal))) {
        error("SEL-005", "SELLER", "Seller postal code must be 5 digits: " + postal);
    }

    // --- Buyer ---
    if (request.kind == InvoiceKind::STANDARD &&
        (!request.buyer || isBlank(request.buyer->name))) {
        warning("BUY-001", "BUYER", "Standard invoice has no buyer name");
    }

    // --- Lines ---
    if (request.lineItems.empty()) {
        error("LIN-001", "LINE", "At least one line item is required");
    }
    for (size_t i = 0; i < request.lineItems.size(); i++) {
        const auto& item = request.lineItems[i];
        const std::string where = "Line " + std::to_string(i + 1) + ": ";

        if (isBlank(item.name)) {
            error("LIN-002", "LINE", where + "item name is required");
        }
        if (!(item.quantity > 0.0)) {
            error("LIN-003", "LINE", where + "quantity must be positive");
        }
        if (item.unitPrice < 0.0) {
            error("LIN-004", "LINE", where + "unit price must not be negative");
        }
        if (item.vatRate != 0.0 && item.vatRate != 5.0 && item.vatRate != 15.0) {
            error("LIN-006", "LINE", where + "VAT rate must be 0, 5 or 15");
        }
        if (!withinLineLimit(item.quantity) || !withinLineLimit(item.unitPrice) ||
            !withinLineLimit(item.quantity * item.unitPrice)) {
            error("LIN-007", "LINE", where + "quantity and unit price must be finite and line amount at most 1e12");
        }
    }

    // --- Amendments ---
    if (isCreditOrDebitNote(request.typeCode) &&
        (!request.billingReference || isBlank(request.billingReference->invoiceNumber))) {
        warning("REF-001", "REFERENCE", "Debit/credit note does not reference the original invoice");
    }

    // --- Chain ---
    if (checkChain) {
        if (request.invoiceCounterValue < 1) {
            error("CHN-001", "CHAIN", "Invoice counter value must be at least 1");
        }
        if (request.previousInvoiceHash.empty()) {
            error("CHN-002", "CHAIN", "Previous invoice hash is required");
        }
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace zatca::invoice
