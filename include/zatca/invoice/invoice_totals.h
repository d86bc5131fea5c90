/**
 * @file invoice_totals.h
 * @brief Amount rounding, formatting and invoice total computation
 *
 * Per line: lineExtension = round2(quantity * unitPrice),
 * lineVat = round2(lineExtension * vatRate / 100). Invoice totals are sums
 * of the rounded line values; tax subtotals group by (category, rate).
 */

#pragma once

#include <string>
#include <vector>

#include "zatca/invoice/invoice_types.h"

namespace zatca::invoice {

struct LineTotals {
    double lineExtensionAmount = 0.0;
    double taxAmount = 0.0;
    double amountWithVat = 0.0;
};

struct TaxSubtotal {
    std::string category;
    double rate = 0.0;
    double taxableAmount = 0.0;
    double taxAmount = 0.0;
};

struct InvoiceTotals {
    std::vector<LineTotals> lines;
    std::vector<TaxSubtotal> subtotals;  ///< In order of first appearance

    double lineExtensionAmount = 0.0;
    double taxExclusiveAmount = 0.0;
    double taxAmount = 0.0;
    double taxInclusiveAmount = 0.0;
    double payableAmount = 0.0;
};

/// @brief Round half away from zero to 2 decimals
double round2(double value);

/// @brief Fixed 2-decimal amount ("20.00")
std::string formatAmount(double value);

/// @brief Fixed 6-decimal quantity
std::string formatQuantity(double value);

/// @brief "Z" for a zero rate, "S" otherwise
std::string vatCategory(double vatRate);

InvoiceTotals computeTotals(const std::vector<LineItem>& items);

} // namespace zatca::invoice
