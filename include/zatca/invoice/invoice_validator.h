/**
 * @file invoice_validator.h
 * @brief Pre-flight invoice checks run before an ICV is consumed
 *
 * Codes mirror the regulator's message taxonomy (code, category, message)
 * so callers can treat local and remote findings alike.
 */

#pragma once

#include <string>
#include <vector>

#include "zatca/invoice/invoice_types.h"

namespace zatca::invoice {

/// @brief Upper bound for quantity, unit price and their product (LIN-007)
constexpr double kMaxLineAmount = 1e12;

struct ValidationIssue {
    std::string code;      ///< e.g. "SEL-002"
    std::string category;  ///< e.g. "SELLER"
    std::string message;
};

struct InvoiceValidationResult {
    bool valid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;

    bool hasError(const std::string& code) const;
    bool hasWarning(const std::string& code) const;
};

/**
 * @brief Check invoice fields, seller, lines and chain values
 *
 * The chain checks (CHN-001, CHN-002) apply to requests that already carry
 * a sequenced ICV and PIH; use checkChain = false for unsequenced requests.
 */
InvoiceValidationResult validateInvoice(const InvoiceRequest& request, bool checkChain = true);

/// @brief 15 digits, starting and ending with '3'
bool isValidVatNumber(const std::string& vatNumber);

bool isValidIsoDate(const std::string& date);
bool isValidIsoTime(const std::string& time);

} // namespace zatca::invoice
