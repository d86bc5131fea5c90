#include "zatca/chain/chain_types.h"
#include "zatca/common/exceptions.h"
#include "zatca/crypto/crypto_core.h"

#include <algorithm>

namespace zatca::chain {

std::string entryStatusToString(EntryStatus status) {
    switch (status) {
        case EntryStatus::ISSUED:   return "ISSUED";
        case EntryStatus::CLEARED:  return "CLEARED";
        case EntryStatus::REPORTED: return "REPORTED";
        case EntryStatus::REJECTED: return "REJECTED";
        case EntryStatus::VOID:     return "VOID";
        case EntryStatus::COMPLIANCE_PASSED: return "COMPLIANCE_PASSED";
    }
    return "ISSUED";
}

EntryStatus entryStatusFromString(const std::string& value) {
    if (value == "ISSUED") return EntryStatus::ISSUED;
    if (value == "CLEARED") return EntryStatus::CLEARED;
    if (value == "REPORTED") return EntryStatus::REPORTED;
    if (value == "REJECTED") return EntryStatus::REJECTED;
    if (value == "VOID") return EntryStatus::VOID;
    if (value == "COMPLIANCE_PASSED") return EntryStatus::COMPLIANCE_PASSED;
    throw common::ParsingException("unknown chain entry status: " + value);
}

ChainVerification verifyChain(std::vector<ChainEntry> entries) {
    std::sort(entries.begin(), entries.end(),
              [](const ChainEntry& a, const ChainEntry& b) { return a.icv < b.icv; });

    ChainVerification result;
    int64_t expectedIcv = 1;
    std::string expectedHash = crypto::initialPreviousHash();

    for (const auto& entry : entries) {
        if (entry.icv != expectedIcv) {
            result.valid = false;
            result.brokenAtIcv = entry.icv;
            result.reason = "expected ICV " + std::to_string(expectedIcv) +
                            ", found " + std::to_string(entry.icv);
            return result;
        }
        if (entry.previousHash != expectedHash) {
            result.valid = false;
            result.brokenAtIcv = entry.icv;
            result.reason = "previous hash of ICV " + std::to_string(entry.icv) +
                            " does not match hash of ICV " + std::to_string(entry.icv - 1);
            return result;
        }
        expectedIcv = entry.icv + 1;
        expectedHash = entry.invoiceHash;
    }
    return result;
}

} // namespace zatca::chain
