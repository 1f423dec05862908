#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII wrapper for a single PostgreSQL connection.
 *
 * Opens a PGconn from a ConnectionConfig and closes it (PQfinish) when the
 * wrapper goes out of scope. Statements executed here hand back their results
 * as PostgreSQLResultSet, ready to be paired with a row decoder.
 */

#include "Config.hpp"
#include "PostgreSQLResultSet.hpp"

#include <libpq-fe.h>
#include <string>
#include <vector>

namespace pqrow {

/**
 * @class PostgreSQLConnection
 * @brief Owns one PGconn.
 *
 * PostgreSQL libpq API Usage:
 * - PQconnectdb() to open the connection from a conninfo string
 * - PQexec() for simple queries returning PGresult*
 * - PQexecParams() for parameterized queries (SQL injection safe)
 * - PQstatus() for connection state checking
 * - PQerrorMessage() for error details
 *
 * Thread Safety:
 * - A connection must not be used from two threads at once.
 * - Result sets it returns are independent of it and may outlive it.
 */
class PostgreSQLConnection {
public:
    /**
     * @brief Open a connection.
     * @param config Connection parameters.
     * @throws ConnectionError if libpq cannot establish the connection.
     */
    explicit PostgreSQLConnection(const ConnectionConfig& config);

    ~PostgreSQLConnection();

    // Non-copyable (connection ownership semantics)
    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    // Movable (transfer ownership)
    PostgreSQLConnection(PostgreSQLConnection&& other) noexcept;
    PostgreSQLConnection& operator=(PostgreSQLConnection&& other) noexcept;

    /**
     * @brief Get the underlying PGconn handle.
     * @return Raw PGconn* pointer (still owned by this wrapper).
     */
    PGconn* get() const { return m_conn; }

    /**
     * @brief Check if the connection is valid.
     * @return true if PQstatus() == CONNECTION_OK.
     */
    bool isValid() const;

    /**
     * @brief Execute a SQL statement.
     * @param sql The SQL statement to execute.
     * @return The result, possibly a failed one; check it with okResult().
     *
     * An empty result set (no PGresult) is returned when libpq could not
     * even allocate a result, typically because the connection is gone.
     */
    PostgreSQLResultSet execute(const std::string& sql);

    /**
     * @brief Execute a parameterized SQL statement.
     * @param sql SQL statement with $1, $2, etc. placeholders.
     * @param params Text-format parameter values.
     */
    PostgreSQLResultSet executeParams(const std::string& sql,
                                      const std::vector<std::string>& params);

    /**
     * @brief Get the last error message.
     * @return Error message string from PQerrorMessage().
     */
    const char* error() const;

private:
    PGconn* m_conn;  ///< PostgreSQL connection handle (owned)
};

}  // namespace pqrow
