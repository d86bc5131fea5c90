/**
 * @file postgres_chain_state_store.h
 * @brief PostgreSQL chain state store
 *
 * Tables:
 *   invoice_chain_state (org_id PK, last_icv, last_hash, version, updated_at)
 *   invoice_chain_entry (org_id, icv, previous_hash, invoice_hash, uuid, status, ...; PK (org_id, icv))
 *
 * The version check and the entry insert run as a single statement, so
 * several service instances can share one chain safely.
 */

#pragma once

#include "zatca/chain/chain_state_store.h"
#include "zatca/db/query_executor.h"

namespace zatca::chain {

class PostgresChainStateStore : public IChainStateStore {
public:
    /**
     * @param executor Query executor (non-owning)
     * @throws std::invalid_argument if executor is nullptr
     */
    explicit PostgresChainStateStore(db::IQueryExecutor* executor);

    /**
     * @brief Create the chain tables if they do not exist
     * @throws DatabaseException on failure
     */
    void ensureSchema();

    ChainState load(const std::string& orgId) override;
    bool commit(const ChainState& expected, const ChainEntry& entry) override;
    void updateStatus(const std::string& orgId, int64_t icv, EntryStatus status) override;
    std::vector<ChainEntry> entries(const std::string& orgId) override;

private:
    db::IQueryExecutor* executor_;
};

} // namespace zatca::chain
