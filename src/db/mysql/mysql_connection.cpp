#include "db/mysql/mysql_connection.hpp"
#include "db/mysql/mysql_type_map.hpp"
#include "core/utils.hpp"
#include <format>

namespace polystore {

MysqlConnection::MysqlConnection(MYSQL* conn)
    : conn_(conn) {}

MysqlConnection::~MysqlConnection() {
    close();
}

bool MysqlConnection::is_constraint_errno(unsigned int err) {
    // ER_BAD_NULL_ERROR, ER_DUP_ENTRY, ER_ROW_IS_REFERENCED_2, ER_NO_REFERENCED_ROW_2
    return err == 1048 || err == 1062 || err == 1451 || err == 1452;
}

DbResultSet MysqlConnection::last_failure() {
    DbResultSet result;
    result.success = false;
    result.error_message = mysql_error(conn_);
    const unsigned int err = mysql_errno(conn_);
    result.error_code = std::to_string(err);
    result.constraint_violation = is_constraint_errno(err);
    return result;
}

DbResultSet MysqlConnection::execute(const std::string& sql) {
    if (!conn_) {
        DbResultSet result;
        result.error_message = "Connection is null";
        return result;
    }

    if (mysql_real_query(conn_, sql.data(), static_cast<unsigned long>(sql.size())) != 0) {
        return last_failure();
    }

    MYSQL_RES* res = mysql_store_result(conn_);
    if (res) {
        auto result = process_result_set(res);
        mysql_free_result(res);
        return result;
    }

    // No result set: DML/DDL, or an error while fetching one
    if (mysql_field_count(conn_) == 0) {
        return process_affected_rows();
    }
    return last_failure();
}

DbResultSet MysqlConnection::execute_params(const std::string& sql,
                                            const std::vector<SqlParam>& params) {
    if (!conn_) {
        DbResultSet result;
        result.error_message = "Connection is null";
        return result;
    }

    std::string bound;
    if (!bind_params(sql, params, bound)) {
        DbResultSet result;
        result.error_message = std::format(
            "placeholder count does not match {} supplied parameters", params.size());
        return result;
    }
    return execute(bound);
}

bool MysqlConnection::bind_params(const std::string& sql, const std::vector<SqlParam>& params,
                                  std::string& out) {
    out.clear();
    out.reserve(sql.size() + params.size() * 8);

    size_t next = 0;
    char quote = 0;
    for (size_t i = 0; i < sql.size(); ++i) {
        const char c = sql[i];
        if (quote) {
            out += c;
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            out += c;
            continue;
        }
        if (c != '?') {
            out += c;
            continue;
        }

        if (next >= params.size()) return false;
        const auto& param = params[next++];
        if (!param) {
            out += "NULL";
            continue;
        }
        std::string escaped(param->size() * 2 + 1, '\0');
        const unsigned long len = mysql_real_escape_string(conn_, escaped.data(),
            param->data(), static_cast<unsigned long>(param->size()));
        escaped.resize(len);
        out += '\'';
        out += escaped;
        out += '\'';
    }
    return next == params.size();
}

DbResultSet MysqlConnection::process_result_set(MYSQL_RES* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const unsigned int num_fields = mysql_num_fields(res);
    MYSQL_FIELD* fields = mysql_fetch_fields(res);

    result.column_names.reserve(num_fields);
    result.column_types.reserve(num_fields);
    for (unsigned int i = 0; i < num_fields; ++i) {
        result.column_names.emplace_back(fields[i].name);
        result.column_types.push_back(MysqlTypeMap::build_type_info(fields[i]));
    }

    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res)) != nullptr) {
        const unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<std::optional<std::string>> row_data;
        row_data.reserve(num_fields);
        for (unsigned int i = 0; i < num_fields; ++i) {
            if (row[i]) {
                row_data.emplace_back(std::string(row[i], lengths[i]));
            } else {
                row_data.emplace_back(std::nullopt);
            }
        }
        result.rows.push_back(std::move(row_data));
    }

    result.affected_rows = result.rows.size();
    return result;
}

DbResultSet MysqlConnection::process_affected_rows() {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;
    result.affected_rows = static_cast<uint64_t>(mysql_affected_rows(conn_));
    result.last_insert_id = static_cast<uint64_t>(mysql_insert_id(conn_));
    return result;
}

bool MysqlConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || mysql_ping(conn_) != 0) {
        return false;
    }

    if (!health_check_query.empty()) {
        return execute(health_check_query).success;
    }
    return true;
}

bool MysqlConnection::is_connected() const {
    return conn_ != nullptr;
}

bool MysqlConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    // max_execution_time applies to SELECT only (MySQL 5.7.8+)
    return execute(std::format("SET SESSION max_execution_time = {}", timeout_ms)).success;
}

void MysqlConnection::close() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// MysqlConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> MysqlConnectionFactory::create(
    const std::string& connection_string) {

    const auto params = parse_connection_string(connection_string);

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        std::lock_guard lock(mutex_);
        last_error_ = "mysql_init failed";
        return nullptr;
    }

    unsigned int timeout = params.connect_timeout_s;
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
    if (params.tls) {
#if defined(MARIADB_PACKAGE_VERSION)
        my_bool enforce = 1;
        mysql_options(conn, MYSQL_OPT_SSL_ENFORCE, &enforce);
#else
        unsigned int mode = SSL_MODE_REQUIRED;
        mysql_options(conn, MYSQL_OPT_SSL_MODE, &mode);
#endif
    }

    MYSQL* result = mysql_real_connect(
        conn,
        params.host.c_str(),
        params.user.c_str(),
        params.password.c_str(),
        params.database.empty() ? nullptr : params.database.c_str(),
        params.port,
        nullptr,
        0);

    if (!result) {
        {
            std::lock_guard lock(mutex_);
            last_error_ = mysql_error(conn);
        }
        utils::log::debug(std::format("MySQL connect to '{}' failed",
            utils::redact_connection_string(connection_string)));
        mysql_close(conn);
        return nullptr;
    }

    return std::make_unique<MysqlConnection>(conn);
}

std::string MysqlConnectionFactory::last_error() const {
    std::lock_guard lock(mutex_);
    return last_error_;
}

MysqlConnectionFactory::ConnParams MysqlConnectionFactory::parse_connection_string(
    const std::string& conn_str) {

    ConnParams params;
    std::string_view sv(conn_str);

    if (sv.starts_with("mysql://")) {
        sv.remove_prefix(8);
    } else if (sv.starts_with("mariadb://")) {
        sv.remove_prefix(10);
    }

    // Query options after '?'
    if (const size_t q = sv.find('?'); q != std::string_view::npos) {
        for (const auto& opt : utils::split(std::string(sv.substr(q + 1)), '&')) {
            const auto eq = opt.find('=');
            if (eq == std::string::npos) continue;
            const std::string key = opt.substr(0, eq);
            const std::string value = opt.substr(eq + 1);
            if (key == "connect_timeout") {
                params.connect_timeout_s = utils::parse_int<unsigned int>(value, 5);
            } else if (key == "ssl" || key == "tls") {
                params.tls = value == "true" || value == "1";
            }
        }
        sv = sv.substr(0, q);
    }

    if (const size_t at_pos = sv.rfind('@'); at_pos != std::string_view::npos) {
        const std::string_view creds = sv.substr(0, at_pos);
        sv.remove_prefix(at_pos + 1);

        if (const size_t colon = creds.find(':'); colon != std::string_view::npos) {
            params.user = std::string(creds.substr(0, colon));
            params.password = std::string(creds.substr(colon + 1));
        } else {
            params.user = std::string(creds);
        }
    }

    std::string_view host_port = sv;
    if (const size_t slash = sv.find('/'); slash != std::string_view::npos) {
        host_port = sv.substr(0, slash);
        params.database = std::string(sv.substr(slash + 1));
    }

    if (const size_t colon = host_port.find(':'); colon != std::string_view::npos) {
        params.host = std::string(host_port.substr(0, colon));
        params.port = utils::parse_int<unsigned int>(host_port.substr(colon + 1), 3306);
    } else if (!host_port.empty()) {
        params.host = std::string(host_port);
    }

    return params;
}

} // namespace polystore
