/**
 * @file postgresql_query_executor.cpp
 * @brief libpq query execution with parameter binding
 */

#include "zatca/db/postgresql_query_executor.h"
#include "zatca/common/exceptions.h"

#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace zatca::db {

using common::DatabaseException;

namespace {

constexpr Oid kOidBool = 16;
constexpr Oid kOidInt8 = 20;
constexpr Oid kOidInt4 = 23;

} // namespace

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
}

PGresult* PostgreSQLQueryExecutor::execute(PGconn* conn,
                                           const std::string& query,
                                           const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    PGresult* res = PQexecParams(conn, query.c_str(), static_cast<int>(params.size()),
                                 nullptr, values.data(), nullptr, nullptr, 0);
    if (!res) {
        throw DatabaseException("query execution failed: null result");
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string error = PQerrorMessage(conn);
        PQclear(res);
        throw DatabaseException("query failed: " + error);
    }
    return res;
}

Json::Value PostgreSQLQueryExecutor::executeQuery(const std::string& query,
                                                  const std::vector<std::string>& params) {
    spdlog::debug("[PostgreSQLQueryExecutor] Query ({} params): {}", params.size(), query);

    auto conn = pool_->acquire();
    PGresult* res = execute(conn.get(), query, params);
    Json::Value rows = resultToJson(res);
    PQclear(res);
    return rows;
}

int PostgreSQLQueryExecutor::executeCommand(const std::string& query,
                                            const std::vector<std::string>& params) {
    spdlog::debug("[PostgreSQLQueryExecutor] Command ({} params): {}", params.size(), query);

    auto conn = pool_->acquire();
    PGresult* res = execute(conn.get(), query, params);

    const char* affected = PQcmdTuples(res);
    int rows = (affected && affected[0] != '\0') ? std::atoi(affected) : 0;
    PQclear(res);
    return rows;
}

Json::Value PostgreSQLQueryExecutor::resultToJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            const char* field = PQfname(res, j);
            if (PQgetisnull(res, i, j)) {
                row[field] = Json::nullValue;
                continue;
            }

            const char* value = PQgetvalue(res, i, j);
            Oid type = PQftype(res, j);
            if (type == kOidInt4 || type == kOidInt8) {
                row[field] = Json::Int64(std::strtoll(value, nullptr, 10));
            } else if (type == kOidBool) {
                row[field] = (value[0] == 't');
            } else {
                row[field] = value;
            }
        }
        array.append(row);
    }
    return array;
}

} // namespace zatca::db
