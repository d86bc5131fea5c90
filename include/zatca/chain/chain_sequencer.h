/**
 * @file chain_sequencer.h
 * @brief Atomic (ICV, PIH) assignment per organization
 *
 * append() treats "read head, render, hash, advance head" as one unit:
 * callers for the same organization are serialized by a per-organization
 * mutex, and the store's version check guards against other processes.
 * Different organizations proceed in parallel.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "zatca/chain/chain_state_store.h"

namespace zatca::chain {

/// @brief Output of the renderer for one slot
struct RenderedInvoice {
    std::string xml;
    std::string uuid;
};

struct SequencedInvoice {
    ChainEntry entry;
    std::string xml;
};

class ChainSequencer {
public:
    using Renderer = std::function<RenderedInvoice(const ChainSlot&)>;

    /**
     * @param store Chain state store (non-owning)
     * @param maxAttempts Commit attempts before giving up on version conflicts
     */
    explicit ChainSequencer(IChainStateStore* store, int maxAttempts = 5);

    /**
     * @brief Render the next invoice of orgId and record it in the chain
     *
     * The renderer receives (icv = lastIcv + 1, previousHash = lastHash) and
     * may be invoked again with a fresh slot if another process advanced the
     * chain in between; it must not have side effects beyond rendering.
     *
     * @return Committed entry (status ISSUED) and the rendered XML
     * @throws ChainException when conflicts persist after maxAttempts
     */
    SequencedInvoice append(const std::string& orgId, const Renderer& renderer);

    /**
     * @brief Record the outcome of a sequenced invoice
     */
    void markStatus(const std::string& orgId, int64_t icv, EntryStatus status);

    ChainVerification verify(const std::string& orgId);

private:
    std::shared_ptr<std::mutex> orgLock(const std::string& orgId);

    IChainStateStore* store_;
    int maxAttempts_;

    std::mutex registryMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> orgLocks_;
};

} // namespace zatca::chain
