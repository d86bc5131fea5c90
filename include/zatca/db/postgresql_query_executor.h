/**
 * @file postgresql_query_executor.h
 * @brief libpq implementation of IQueryExecutor
 */

#pragma once

#include "zatca/db/db_connection_pool.h"
#include "zatca/db/query_executor.h"

namespace zatca::db {

class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @param pool Connection pool (non-owning)
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    Json::Value executeQuery(const std::string& query,
                             const std::vector<std::string>& params = {}) override;

    int executeCommand(const std::string& query,
                       const std::vector<std::string>& params) override;

private:
    /// Caller owns the result and must PQclear() it
    PGresult* execute(PGconn* conn, const std::string& query, const std::vector<std::string>& params);

    static Json::Value resultToJson(PGresult* res);

    DbConnectionPool* pool_;
};

} // namespace zatca::db
