/**
 * @file invoice_totals.cpp
 * @brief Invoice total computation
 */

#include "zatca/invoice/invoice_totals.h"

#include <cmath>
#include <cstdio>

namespace zatca::invoice {

namespace {

// Absorbs binary representation error (1.005 * 100 = 100.49999...)
constexpr double kRoundingEpsilon = 1e-9;

std::string formatFixed(double value, int decimals) {
    int len = std::snprintf(nullptr, 0, "%.*f", decimals, value);
    if (len <= 0) return "";
    std::string out(static_cast<size_t>(len) + 1, '\0');
    std::snprintf(&out[0], out.size(), "%.*f", decimals, value);
    out.resize(static_cast<size_t>(len));
    if (out.rfind("-0.", 0) == 0 && out.find_first_not_of("-0.") == std::string::npos) {
        out.erase(0, 1);
    }
    return out;
}

} // namespace

double round2(double value) {
    double scaled = value * 100.0;
    scaled += (scaled >= 0.0) ? kRoundingEpsilon : -kRoundingEpsilon;
    return std::round(scaled) / 100.0;
}

std::string formatAmount(double value) {
    return formatFixed(round2(value), 2);
}

std::string formatQuantity(double value) {
    return formatFixed(value, 6);
}

std::string vatCategory(double vatRate) {
    return vatRate == 0.0 ? "Z" : "S";
}

InvoiceTotals computeTotals(const std::vector<LineItem>& items) {
    InvoiceTotals totals;
    totals.lines.reserve(items.size());

    for (const auto& item : items) {
        LineTotals line;
        line.lineExtensionAmount = round2(item.quantity * item.unitPrice);
        line.taxAmount = round2(line.lineExtensionAmount * item.vatRate / 100.0);
        line.amountWithVat = round2(line.lineExtensionAmount + line.taxAmount);
        totals.lines.push_back(line);

        totals.lineExtensionAmount += line.lineExtensionAmount;
        totals.taxAmount += line.taxAmount;

        std::string category = vatCategory(item.vatRate);
        TaxSubtotal* group = nullptr;
        for (auto& subtotal : totals.subtotals) {
            if (subtotal.category == category && subtotal.rate == item.vatRate) {
                group = &subtotal;
                break;
            }
        }
        if (!group) {
            totals.subtotals.push_back(TaxSubtotal{category, item.vatRate, 0.0, 0.0});
            group = &totals.subtotals.back();
        }
        group->taxableAmount = round2(group->taxableAmount + line.lineExtensionAmount);
        group->taxAmount = round2(group->taxAmount + line.taxAmount);
    }

    totals.lineExtensionAmount = round2(totals.lineExtensionAmount);
    totals.taxAmount = round2(totals.taxAmount);
    totals.taxExclusiveAmount = totals.lineExtensionAmount;
    totals.taxInclusiveAmount = round2(totals.taxExclusiveAmount + totals.taxAmount);
    totals.payableAmount = totals.taxInclusiveAmount;
    return totals;
}

} // namespace zatca::invoice
