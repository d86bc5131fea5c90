/**
 * @file chain_state_store.h
 * @brief Chain state persistence with optimistic versioning
 */

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "zatca/chain/chain_types.h"

namespace zatca::chain {

/**
 * @brief Chain state store interface
 *
 * commit() is a compare-and-swap on ChainState::version: it advances the
 * head and appends the entry only if nobody committed since the state was
 * loaded. Implementations must make both effects atomic.
 */
class IChainStateStore {
public:
    virtual ~IChainStateStore() = default;

    /**
     * @brief Current head; creates the genesis state (ICV 0, hash("0"), version 0) if absent
     */
    virtual ChainState load(const std::string& orgId) = 0;

    /**
     * @brief Advance the head to entry and append it
     * @param expected State the entry was computed from
     * @return false when the stored version no longer matches expected.version
     * @throws ChainException if entry does not extend expected
     */
    virtual bool commit(const ChainState& expected, const ChainEntry& entry) = 0;

    /**
     * @throws ChainException if no entry exists at (orgId, icv)
     */
    virtual void updateStatus(const std::string& orgId, int64_t icv, EntryStatus status) = 0;

    /// @brief All entries of an organization, ordered by ICV
    virtual std::vector<ChainEntry> entries(const std::string& orgId) = 0;
};

/**
 * @brief Process-local store (tests, single-instance deployments)
 */
class InMemoryChainStateStore : public IChainStateStore {
public:
    ChainState load(const std::string& orgId) override;
    bool commit(const ChainState& expected, const ChainEntry& entry) override;
    void updateStatus(const std::string& orgId, int64_t icv, EntryStatus status) override;
    std::vector<ChainEntry> entries(const std::string& orgId) override;

private:
    std::mutex mutex_;
    std::map<std::string, ChainState> states_;
    std::map<std::string, std::vector<ChainEntry>> entries_;
};

/// @brief Reject an entry that does not extend the expected head
void checkEntryExtends(const ChainState& expected, const ChainEntry& entry);

} // namespace zatca::chain
