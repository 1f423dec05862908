#include "PostgreSQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace pqrow {

PostgreSQLConnection::PostgreSQLConnection(const ConnectionConfig& config)
    : m_conn(PQconnectdb(config.toConnInfo().c_str())) {

    if (!m_conn) {
        throw ConnectionError("PQconnectdb", "Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(m_conn) != CONNECTION_OK) {
        std::string errorMsg = PQerrorMessage(m_conn);
        PQfinish(m_conn);
        m_conn = nullptr;
        throw ConnectionError("PQconnectdb", errorMsg);
    }

    // Set client encoding to UTF-8
    if (PQsetClientEncoding(m_conn, "UTF8") != 0) {
        spdlog::warn("Could not set client encoding to UTF8: {}", PQerrorMessage(m_conn));
    }

    spdlog::debug("Connected to PostgreSQL at {}:{} (server version {})",
                  config.host, config.port, PQserverVersion(m_conn));
}

PostgreSQLConnection::~PostgreSQLConnection() {
    if (m_conn) {
        PQfinish(m_conn);
    }
}

PostgreSQLConnection::PostgreSQLConnection(PostgreSQLConnection&& other) noexcept
    : m_conn(other.m_conn) {
    other.m_conn = nullptr;
}

PostgreSQLConnection& PostgreSQLConnection::operator=(PostgreSQLConnection&& other) noexcept {
    if (this != &other) {
        if (m_conn) {
            PQfinish(m_conn);
        }
        m_conn = other.m_conn;
        other.m_conn = nullptr;
    }
    return *this;
}

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

PostgreSQLResultSet PostgreSQLConnection::execute(const std::string& sql) {
    if (!isValid()) {
        spdlog::error("execute() on a closed PostgreSQL connection");
        return PostgreSQLResultSet();
    }
    spdlog::debug("Executing: {}", sql);
    return PostgreSQLResultSet(PQexec(m_conn, sql.c_str()));
}

PostgreSQLResultSet PostgreSQLConnection::executeParams(const std::string& sql,
                                                        const std::vector<std::string>& params) {
    if (!isValid()) {
        spdlog::error("executeParams() on a closed PostgreSQL connection");
        return PostgreSQLResultSet();
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }

    spdlog::debug("Executing with {} parameters: {}", params.size(), sql);
    return PostgreSQLResultSet(PQexecParams(m_conn, sql.c_str(), static_cast<int>(values.size()),
                                            nullptr, values.data(), nullptr, nullptr, 0));
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

}  // namespace pqrow
