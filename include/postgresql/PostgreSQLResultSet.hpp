#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * This file provides the libpq implementation of RawResult. It owns a
 * PGresult*, clears it (PQclear) when destroyed, and exposes the row, cell
 * and status data that TypedResult reads.
 */

#include "RawResult.hpp"

#include <libpq-fe.h>
#include <string>
#include <vector>

namespace pqrow {

/**
 * @class PostgreSQLResultSet
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * PostgreSQL loads the entire result into client memory before PQexec()
 * returns, so every accessor here is a local read of already materialized
 * data and never touches the connection.
 *
 * Result Status:
 * - PGRES_TUPLES_OK: SELECT query with data
 * - PGRES_COMMAND_OK: DML/DDL completed successfully
 * - PGRES_EMPTY_QUERY: Empty query string
 * - PGRES_FATAL_ERROR: Error occurred
 *
 * A wrapper holding no result (nullptr) reads as an empty, failed result
 * with no diagnostic fields, which okResult() reports as a ConnectionError.
 *
 * Usage:
 * @code
 *   PostgreSQLResultSet raw = conn.execute("SELECT id, name FROM employees");
 *   TypedResult<Employee> result(employeeDecoder, raw);
 *   result.okResult();
 *   std::vector<Employee> all = result.getRows();
 * @endcode
 *
 * Thread Safety:
 * - Const accessors may be called concurrently.
 * - reset(), release() and moves must not race with readers.
 */
class PostgreSQLResultSet : public RawResult {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res PGresult handle to manage (takes ownership), or nullptr.
     */
    explicit PostgreSQLResultSet(PGresult* res = nullptr);

    /**
     * @brief Destructor - clears the result if still owned.
     */
    ~PostgreSQLResultSet() override;

    // Non-copyable
    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    // Movable
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    /**
     * @brief Get the underlying PGresult handle.
     * @return Raw PGresult* pointer (still owned by this object).
     */
    PGresult* get() const { return m_res; }

    // ----- RawResult -----

    int ntuples() const override;
    int nfields() const override;

    /**
     * @brief Get a cell at a specific row and column.
     * @return View of PQgetvalue()/PQgetlength(), or std::nullopt if the
     *         value is NULL or the position is outside the result.
     */
    Cell getCell(int row, int col) const override;

    ExecStatusType resultStatus() const override;
    RawField cmdStatus() const override;
    RawField cmdTuples() const override;
    RawField resultErrorMessage() const override;
    RawField resultErrorField(int fieldCode) const override;

    // ----- Status and column metadata -----

    /**
     * @brief Get the result status as a string.
     * @return Status string (e.g., "PGRES_TUPLES_OK").
     */
    const char* statusMessage() const;

    /**
     * @brief Get a column name by index.
     * @param col Zero-based column index.
     * @return Column name, or nullptr if col is out of range.
     */
    const char* fieldName(int col) const;

    /**
     * @brief Get a column's type Oid.
     * @param col Zero-based column index.
     * @return PostgreSQL type Oid.
     *
     * Common Oids: 16=bool, 23=int4, 25=text, 1043=varchar
     */
    Oid fieldType(int col) const;

    /**
     * @brief Get all column names as a vector.
     * @return Vector of column name strings.
     */
    std::vector<std::string> getColumnNames() const;

    // ----- Resource management -----

    /**
     * @brief Reset the wrapper with a new result.
     * @param res New PGresult to manage (or nullptr).
     *
     * Clears the current result first if any.
     */
    void reset(PGresult* res = nullptr);

    /**
     * @brief Release ownership of the result.
     * @return Raw PGresult* pointer (caller takes ownership).
     *
     * After calling, this wrapper no longer owns the result.
     */
    PGresult* release();

private:
    PGresult* m_res;  ///< PostgreSQL result handle (owned)
};

}  // namespace pqrow
