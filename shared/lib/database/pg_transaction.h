/**
 * @file pg_transaction.h
 * @brief RAII PostgreSQL transaction on a pooled connection
 *
 * BEGIN on construction, ROLLBACK on destruction unless commit() was called.
 * The pooled connection is held for the whole transaction.
 *
 * Error mapping:
 *   SQLSTATE 23505 (unique_violation) -> ConflictException
 *   everything else                    -> StorageException (SQLSTATE in details)
 *
 * Parameters follow the repository convention: an empty string binds NULL.
 */

#pragma once

#include "db_connection_pool.h"

#include <json/json.h>
#include <string>
#include <vector>

namespace common {

class PgTransaction {
public:
    /**
     * @param pool Connection pool (non-owning)
     * @param isolation Optional isolation clause, e.g. "ISOLATION LEVEL SERIALIZABLE"
     */
    explicit PgTransaction(DbConnectionPool* pool, const std::string& isolation = "");
    ~PgTransaction();

    PgTransaction(const PgTransaction&) = delete;
    PgTransaction& operator=(const PgTransaction&) = delete;

    /**
     * @brief Run a row-returning statement
     * @return JSON array of row objects keyed by column name
     */
    Json::Value query(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @brief Run a command
     * @return Number of affected rows
     */
    int execute(const std::string& sql, const std::vector<std::string>& params = {});

    void commit();

    void rollback();

private:
    PGresult* run(const std::string& sql, const std::vector<std::string>& params);

    static Json::Value resultToJson(PGresult* res);

    DbConnection conn_;
    bool finished_;
};

} // namespace common
