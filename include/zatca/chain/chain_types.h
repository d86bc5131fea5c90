/**
 * @file chain_types.h
 * @brief Per-organization invoice hash chain model
 *
 * For every organization, entries ordered by ICV satisfy
 * entry[n].icv == entry[n-1].icv + 1 and
 * entry[n].previousHash == entry[n-1].invoiceHash,
 * with entry[0].icv == 1 and entry[0].previousHash == hash("0").
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace zatca::chain {

/**
 * @brief Entry lifecycle: ISSUED -> CLEARED | REPORTED | REJECTED | VOID
 *
 * COMPLIANCE_PASSED only appears on compliance chains: a test invoice the
 * regulator validated without clearing or reporting it.
 */
enum class EntryStatus {
    ISSUED,
    CLEARED,
    REPORTED,
    REJECTED,
    VOID,
    COMPLIANCE_PASSED
};

std::string entryStatusToString(EntryStatus status);

/// @throws ParsingException on unknown value
EntryStatus entryStatusFromString(const std::string& value);

/// @brief Head of an organization's chain; version drives compare-and-swap
struct ChainState {
    std::string orgId;
    int64_t lastIcv = 0;
    std::string lastHash;
    int64_t version = 0;
};

struct ChainEntry {
    std::string orgId;
    int64_t icv = 0;
    std::string previousHash;
    std::string invoiceHash;
    std::string uuid;
    EntryStatus status = EntryStatus::ISSUED;
};

/// @brief Position handed to the invoice renderer
struct ChainSlot {
    int64_t icv = 0;
    std::string previousHash;
};

struct ChainVerification {
    bool valid = true;
    int64_t brokenAtIcv = 0;  ///< First offending ICV when !valid
    std::string reason;
};

/**
 * @brief Check the chain-integrity property over one organization's entries
 *
 * Entries may be given in any order; they are checked sorted by ICV.
 * An empty list is a valid (genesis) chain.
 */
ChainVerification verifyChain(std::vector<ChainEntry> entries);

} // namespace zatca::chain
