/**
 * @file pg_transaction.cpp
 * @brief PgTransaction implementation
 */

#include "pg_transaction.h"
#include "exceptions.h"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <cstring>

namespace common {

namespace {

constexpr const char* SQLSTATE_UNIQUE_VIOLATION = "23505";

// PostgreSQL type OIDs
constexpr Oid OID_BOOL = 16;
constexpr Oid OID_INT8 = 20;
constexpr Oid OID_INT2 = 21;
constexpr Oid OID_INT4 = 23;
constexpr Oid OID_FLOAT4 = 700;
constexpr Oid OID_FLOAT8 = 701;

DbConnection acquireOrThrow(DbConnectionPool* pool) {
    if (!pool) {
        throw std::invalid_argument("PgTransaction: pool cannot be nullptr");
    }
    return pool->acquire();
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

PgTransaction::PgTransaction(DbConnectionPool* pool, const std::string& isolation)
    : conn_(acquireOrThrow(pool))
    , finished_(false)
{
    std::string begin = isolation.empty() ? "BEGIN" : "BEGIN " + isolation;
    PQclear(run(begin, {}));
}

PgTransaction::~PgTransaction() {
    if (!finished_ && conn_.isValid()) {
        PGresult* res = PQexec(conn_.get(), "ROLLBACK");
        if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
            spdlog::warn("[PgTransaction] ROLLBACK failed: {}", PQerrorMessage(conn_.get()));
        }
        if (res) {
            PQclear(res);
        }
    }
}

void PgTransaction::commit() {
    if (finished_) {
        throw StorageException("Transaction already finished");
    }
    finished_ = true;
    PQclear(run("COMMIT", {}));
}

void PgTransaction::rollback() {
    if (finished_) {
        return;
    }
    finished_ = true;
    PQclear(run("ROLLBACK", {}));
}

// ============================================================================
// Statements
// ============================================================================

Json::Value PgTransaction::query(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* res = run(sql, params);
    Json::Value rows = resultToJson(res);
    PQclear(res);
    return rows;
}

int PgTransaction::execute(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* res = run(sql, params);

    const char* affectedRowsStr = PQcmdTuples(res);
    int affectedRows = 0;
    if (affectedRowsStr && affectedRowsStr[0] != '\0') {
        affectedRows = std::atoi(affectedRowsStr);
    }

    PQclear(res);
    return affectedRows;
}

PGresult* PgTransaction::run(const std::string& sql, const std::vector<std::string>& params) {
    if (!conn_.isValid()) {
        throw StorageException("Transaction has no connection");
    }

    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    PGresult* res = PQexecParams(
        conn_.get(),
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        paramValues.data(),
        nullptr,
        nullptr,
        0
    );

    if (!res) {
        throw StorageException("Query execution failed: null result", PQerrorMessage(conn_.get()));
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        const char* sqlState = PQresultErrorField(res, PG_DIAG_SQLSTATE);
        std::string state = sqlState ? sqlState : "";
        std::string error = PQresultErrorMessage(res);
        PQclear(res);

        if (state == SQLSTATE_UNIQUE_VIOLATION) {
            spdlog::debug("[PgTransaction] Unique violation: {}", error);
            throw ConflictException("Unique constraint violated", error);
        }

        spdlog::error("[PgTransaction] Query failed (SQLSTATE {}): {}", state, error);
        throw StorageException(ErrorCode::DB_QUERY_FAILED, "Database query failed",
                               "SQLSTATE " + state + ": " + error);
    }

    return res;
}

Json::Value PgTransaction::resultToJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            const char* fieldName = PQfname(res, j);

            if (PQgetisnull(res, i, j)) {
                row[fieldName] = Json::nullValue;
                continue;
            }

            const char* value = PQgetvalue(res, i, j);
            Oid type = PQftype(res, j);

            if (type == OID_INT2 || type == OID_INT4 || type == OID_INT8) {
                row[fieldName] = Json::Int64(std::strtoll(value, nullptr, 10));
            } else if (type == OID_FLOAT4 || type == OID_FLOAT8) {
                row[fieldName] = std::atof(value);
            } else if (type == OID_BOOL) {
                row[fieldName] = (value[0] == 't');
            } else {
                row[fieldName] = value;
            }
        }
        array.append(row);
    }

    return array;
}

} // namespace common
