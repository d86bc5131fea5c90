/**
 * @file in_memory_chain_state_store.cpp
 * @brief Mutex-guarded chain state store
 */

#include "zatca/chain/chain_state_store.h"
#include "zatca/common/exceptions.h"
#include "zatca/crypto/crypto_core.h"

namespace zatca::chain {

using common::ChainException;

void checkEntryExtends(const ChainState& expected, const ChainEntry& entry) {
    if (entry.orgId != expected.orgId) {
        throw ChainException("entry organization " + entry.orgId +
                             " does not match state organization " + expected.orgId);
    }
    if (entry.icv != expected.lastIcv + 1) {
        throw ChainException("entry ICV " + std::to_string(entry.icv) +
                             " does not follow " + std::to_string(expected.lastIcv));
    }
    if (entry.previousHash != expected.lastHash) {
        throw ChainException("entry previous hash does not match chain head for ICV " +
                             std::to_string(entry.icv));
    }
}

ChainState InMemoryChainStateStore::load(const std::string& orgId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(orgId);
    if (it == states_.end()) {
        ChainState genesis;
        genesis.orgId = orgId;
        genesis.lastHash = crypto::initialPreviousHash();
        it = states_.emplace(orgId, genesis).first;
    }
    return it->second;
}

bool InMemoryChainStateStore::commit(const ChainState& expected, const ChainEntry& entry) {
    checkEntryExtends(expected, entry);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = states_.find(expected.orgId);
    if (it == states_.end() || it->second.version != expected.version) {
        return false;
    }

    it->second.lastIcv = entry.icv;
    it->second.lastHash = entry.invoiceHash;
    it->second.version++;
    entries_[expected.orgId].push_back(entry);
    return true;
}

void InMemoryChainStateStore::updateStatus(const std::string& orgId, int64_t icv, EntryStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(orgId);
    if (it != entries_.end()) {
        for (auto& entry : it->second) {
            if (entry.icv == icv) {
                entry.status = status;
                return;
            }
        }
    }
    throw ChainException("no chain entry for " + orgId + " ICV " + std::to_string(icv));
}

std::vector<ChainEntry> InMemoryChainStateStore::entries(const std::string& orgId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(orgId);
    return it == entries_.end() ? std::vector<ChainEntry>{} : it->second;
}

} // namespace zatca::chain
