#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace polystore {

namespace {

DbResultSet failure(std::string message, std::string code = {}) {
    DbResultSet result;
    result.success = false;
    result.error_message = utils::trim(message);
    // SQLSTATE class 23: integrity constraint violation
    result.constraint_violation = code.starts_with("23");
    result.error_code = std::move(code);
    return result;
}

} // namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        return failure("Connection is null");
    }
    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(const std::string& sql,
                                         const std::vector<SqlParam>& params) {
    if (!conn_) {
        return failure("Connection is null");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    // nullptr types/lengths/formats: server infers types, all values are text
    PGresult* res = PQexecParams(conn_, sql.c_str(),
        static_cast<int>(values.size()), nullptr,
        values.empty() ? nullptr : values.data(), nullptr, nullptr, 0);
    return consume_result(res);
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const auto result = execute(std::format("SET statement_timeout = {}", timeout_ms));
    return result.success;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::consume_result(PGresult* res) {
    if (!res) {
        return failure(PQerrorMessage(conn_));
    }

    DbResultSet result;
    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
            result = process_tuples_result(res);
            break;
        case PGRES_COMMAND_OK:
            result = process_command_result(res);
            break;
        default: {
            const char* sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
            result = failure(PQresultErrorMessage(res), sqlstate ? sqlstate : "");
            break;
        }
    }
    PQclear(res);
    return result;
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    result.column_types.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; ++i) {
        result.column_names.emplace_back(PQfname(res, i));
        result.column_types.push_back(PgTypeMap::oid_type_info(PQftype(res, i)));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));
    for (int i = 0; i < nrows; ++i) {
        std::vector<std::optional<std::string>> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; ++j) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                    static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    // INSERT/UPDATE/DELETE ... RETURNING reports the row count here too
    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected);
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        std::lock_guard lock(mutex_);
        last_error_ = "Failed to allocate PGconn";
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        {
            std::lock_guard lock(mutex_);
            last_error_ = utils::trim(PQerrorMessage(conn));
        }
        utils::log::debug(std::format("PostgreSQL connect to '{}' failed",
            utils::redact_connection_string(connection_string)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

std::string PgConnectionFactory::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

} // namespace polystore
