/**
 * @file chain_sequencer.cpp
 * @brief Per-organization chain sequencing
 */

#include "zatca/chain/chain_sequencer.h"
#include "zatca/common/exceptions.h"
#include "zatca/crypto/crypto_core.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace zatca::chain {

using common::ChainException;

ChainSequencer::ChainSequencer(IChainStateStore* store, int maxAttempts)
    : store_(store), maxAttempts_(maxAttempts) {
    if (!store_) {
        throw std::invalid_argument("ChainSequencer: store cannot be nullptr");
    }
    if (maxAttempts_ < 1) {
        throw std::invalid_argument("ChainSequencer: maxAttempts must be at least 1");
    }
}

std::shared_ptr<std::mutex> ChainSequencer::orgLock(const std::string& orgId) {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto& slot = orgLocks_[orgId];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

SequencedInvoice ChainSequencer::append(const std::string& orgId, const Renderer& renderer) {
    if (orgId.empty()) {
        throw std::invalid_argument("ChainSequencer: organization id is required");
    }

    auto mutex = orgLock(orgId);
    std::lock_guard<std::mutex> guard(*mutex);

    for (int attempt = 1; attempt <= maxAttempts_; attempt++) {
        ChainState state = store_->load(orgId);

        ChainSlot slot{state.lastIcv + 1, state.lastHash};
        RenderedInvoice rendered = renderer(slot);

        SequencedInvoice result;
        result.entry.orgId = orgId;
        result.entry.icv = slot.icv;
        result.entry.previousHash = slot.previousHash;
        result.entry.invoiceHash = crypto::hash(rendered.xml);
        result.entry.uuid = rendered.uuid;
        result.entry.status = EntryStatus::ISSUED;

        if (store_->commit(state, result.entry)) {
            spdlog::debug("[ChainSequencer] {} ICV {} committed (uuid={})",
                          orgId, slot.icv, rendered.uuid);
            result.xml = std::move(rendered.xml);
            return result;
        }

        spdlog::warn("[ChainSequencer] {} chain advanced concurrently (attempt {}/{}), re-rendering",
                     orgId, attempt, maxAttempts_);
    }

    throw ChainException("could not advance chain for " + orgId + " after " +
                         std::to_string(maxAttempts_) + " attempts");
}

void ChainSequencer::markStatus(const std::string& orgId, int64_t icv, EntryStatus status) {
    store_->updateStatus(orgId, icv, status);
    spdlog::info("[ChainSequencer] {} ICV {} -> {}", orgId, icv, entryStatusToString(status));
}

ChainVerification ChainSequencer::verify(const std::string& orgId) {
    return verifyChain(store_->entries(orgId));
}

} // namespace zatca::chain
