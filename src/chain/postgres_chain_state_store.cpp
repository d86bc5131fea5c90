/**
 * @file postgres_chain_state_store.cpp
 * @brief PostgreSQL chain state store
 */

#include "zatca/chain/postgres_chain_state_store.h"
#include "zatca/common/exceptions.h"
#include "zatca/crypto/crypto_core.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace zatca::chain {

using common::ChainException;

namespace {

int64_t int64Field(const Json::Value& row, const char* name) {
    const Json::Value& v = row[name];
    if (v.isIntegral()) return v.asInt64();
    if (v.isString()) {
        const std::string text = v.asString();
        const std::string invalid = std::string("column ") + name + " is not a valid integer: '" + text + "'";
        size_t consumed = 0;
        int64_t value = 0;
        try {
            value = std::stoll(text, &consumed);
        } catch (const std::invalid_argument&) {
            throw ChainException(invalid);
        } catch (const std::out_of_range&) {
            throw ChainException(invalid);
        }
        if (consumed != text.size()) throw ChainException(invalid);
        return value;
    }
    throw ChainException(std::string("column ") + name + " is missing or not numeric");
}

ChainEntry rowToEntry(const Json::Value& row) {
    ChainEntry entry;
    entry.orgId = row["org_id"].asString();
    entry.icv = int64Field(row, "icv");
    entry.previousHash = row["previous_hash"].asString();
    entry.invoiceHash = row["invoice_hash"].asString();
    entry.uuid = row["uuid"].asString();
    entry.status = entryStatusFromString(row["status"].asString());
    return entry;
}

} // namespace

PostgresChainStateStore::PostgresChainStateStore(db::IQueryExecutor* executor)
    : executor_(executor) {
    if (!executor_) {
        throw std::invalid_argument("PostgresChainStateStore: executor cannot be nullptr");
    }
}

void PostgresChainStateStore::ensureSchema() {
    executor_->executeCommand(
        "CREATE TABLE IF NOT EXISTS invoice_chain_state ("
        "  org_id     VARCHAR(128) PRIMARY KEY,"
        "  last_icv   BIGINT NOT NULL DEFAULT 0,"
        "  last_hash  VARCHAR(128) NOT NULL,"
        "  version    BIGINT NOT NULL DEFAULT 0,"
        "  updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()"
        ")", {});

    executor_->executeCommand(
        "CREATE TABLE IF NOT EXISTS invoice_chain_entry ("
        "  org_id        VARCHAR(128) NOT NULL REFERENCES invoice_chain_state(org_id),"
        "  icv           BIGINT NOT NULL,"
        "  previous_hash VARCHAR(128) NOT NULL,"
        "  invoice_hash  VARCHAR(128) NOT NULL,"
        "  uuid          VARCHAR(64) NOT NULL,"
        "  status        VARCHAR(32) NOT NULL DEFAULT 'ISSUED',"
        "  created_at    TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
        "  updated_at    TIMESTAMPTZ NOT NULL DEFAULT NOW(),"
        "  PRIMARY KEY (org_id, icv)"
        ")", {});

    spdlog::info("[PostgresChainStateStore] Schema ready");
}

ChainState PostgresChainStateStore::load(const std::string& orgId) {
    executor_->executeCommand(
        "INSERT INTO invoice_chain_state (org_id, last_icv, last_hash, version) "
        "VALUES ($1, 0, $2, 0) ON CONFLICT (org_id) DO NOTHING",
        {orgId, crypto::initialPreviousHash()});

    Json::Value rows = executor_->executeQuery(
        "SELECT org_id, last_icv, last_hash, version FROM invoice_chain_state WHERE org_id = $1",
        {orgId});
    if (rows.empty()) {
        throw ChainException("chain state for " + orgId + " vanished after insert");
    }

    const Json::Value& row = rows[0];
    ChainState state;
    state.orgId = row["org_id"].asString();
    state.lastIcv = int64Field(row, "last_icv");
    state.lastHash = row["last_hash"].asString();
    state.version = int64Field(row, "version");
    return state;
}

bool PostgresChainStateStore::commit(const ChainState& expected, const ChainEntry& entry) {
    checkEntryExtends(expected, entry);

    int inserted = executor_->executeCommand(
        "WITH upd AS ("
        "  UPDATE invoice_chain_state"
        "     SET last_icv = $3, last_hash = $4, version = version + 1, updated_at = NOW()"
        "   WHERE org_id = $1 AND version = $2"
        "  RETURNING org_id"
        ") "
        "INSERT INTO invoice_chain_entry (org_id, icv, previous_hash, invoice_hash, uuid, status) "
        "SELECT org_id, $3, $5, $4, $6, $7 FROM upd",
        {expected.orgId,
         std::to_string(expected.version),
         std::to_string(entry.icv),
         entry.invoiceHash,
         entry.previousHash,
         entry.uuid,
         entryStatusToString(entry.status)});

    if (inserted == 0) {
        spdlog::debug("[PostgresChainStateStore] Version conflict for {} at version {}",
                      expected.orgId, expected.version);
    }
    return inserted == 1;
}

void PostgresChainStateStore::updateStatus(const std::string& orgId, int64_t icv, EntryStatus status) {
    int updated = executor_->executeCommand(
        "UPDATE invoice_chain_entry SET status = $3, updated_at = NOW() "
        "WHERE org_id = $1 AND icv = $2",
        {orgId, std::to_string(icv), entryStatusToString(status)});

    if (updated == 0) {
        throw ChainException("no chain entry for " + orgId + " ICV " + std::to_string(icv));
    }
}

std::vector<ChainEntry> PostgresChainStateStore::entries(const std::string& orgId) {
    Json::Value rows = executor_->executeQuery(
        "SELECT org_id, icv, previous_hash, invoice_hash, uuid, status "
        "FROM invoice_chain_entry WHERE org_id = $1 ORDER BY icv",
        {orgId});

    std::vector<ChainEntry> result;
    result.reserve(rows.size());
    for (const auto& row : rows) {
        result.push_back(rowToEntry(row));
    }
    return result;
}

} // namespace zatca::chain
