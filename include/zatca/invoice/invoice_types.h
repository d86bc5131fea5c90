/**
 * @file invoice_types.h
 * @brief Invoice domain model consumed by the XML builder and validator
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zatca::invoice {

/// @name Invoice type codes (UN/CEFACT 1001)
/// @{
constexpr const char* kTaxInvoice = "388";
constexpr const char* kDebitNote = "383";
constexpr const char* kCreditNote = "381";
/// @}

constexpr const char* kDefaultCurrency = "SAR";

/// @brief Standard (B2B, cleared) or simplified (B2C, reported)
enum class InvoiceKind {
    STANDARD,
    SIMPLIFIED
};

/// @brief InvoiceTypeCode name attribute: "0100000" or "0200000"
std::string invoiceSubtypeName(InvoiceKind kind);

struct Address {
    std::string street;
    std::string buildingNumber;
    std::string city;
    std::string postalCode;
    std::string district;
    std::string country = "SA";
};

struct Party {
    std::string name;
    std::string vatNumber;
    std::optional<std::string> crn;  ///< Commercial registration number
    Address address;
};

struct LineItem {
    std::string name;
    double quantity = 0.0;
    double unitPrice = 0.0;
    double vatRate = 15.0;           ///< Percent: 0, 5 or 15
};

/// @brief Original invoice referenced by a debit or credit note
struct BillingReference {
    std::string invoiceNumber;
    std::string reason;              ///< Rendered as the payment instruction note
};

/// @brief Full (multi-party) invoice
struct InvoiceRequest {
    std::string invoiceNumber;
    std::string uuid;
    std::string issueDate;           ///< YYYY-MM-DD
    std::string issueTime;           ///< HH:MM:SS
    std::string typeCode = kTaxInvoice;
    InvoiceKind kind = InvoiceKind::STANDARD;
    std::string currency = kDefaultCurrency;
    std::string paymentMeansCode = "10";

    Party seller;
    std::optional<Party> buyer;
    std::vector<LineItem> lineItems;
    std::optional<BillingReference> billingReference;

    int64_t invoiceCounterValue = 0; ///< ICV
    std::string previousInvoiceHash; ///< PIH
};

/// @brief Simplified (B2C) invoice: seller only, no buyer party
struct SimplifiedInvoiceData {
    std::string invoiceNumber;
    std::string uuid;
    std::string issueDate;
    std::string issueTime;
    std::string currency = kDefaultCurrency;

    Party seller;
    std::vector<LineItem> lineItems;

    int64_t invoiceCounterValue = 0;
    std::string previousInvoiceHash;
};

/**
 * @brief Widen simplified data into a request of kind SIMPLIFIED
 */
InvoiceRequest toInvoiceRequest(const SimplifiedInvoiceData& data);

bool isCreditOrDebitNote(const std::string& typeCode);

} // namespace zatca::invoice
