/**
 * @file query_executor.h
 * @brief Query executor interface used by the chain state store
 *
 * Results come back as a JSON array of row objects keyed by column name,
 * so store code stays independent of libpq and testable with fakes.
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>

namespace zatca::db {

class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a query returning rows ($1, $2 placeholders)
     * @return JSON array of row objects (INT4/INT8 as integers, BOOL as bool, NULL as null)
     * @throws DatabaseException on failure
     */
    virtual Json::Value executeQuery(const std::string& query,
                                     const std::vector<std::string>& params = {}) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE
     * @return Number of affected rows
     * @throws DatabaseException on failure
     */
    virtual int executeCommand(const std::string& query,
                               const std::vector<std::string>& params) = 0;
};

} // namespace zatca::db
