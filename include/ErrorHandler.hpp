#pragma once

#include "RawResult.hpp"

#include <libpq-fe.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pqrow {

// SQLSTATE classes (first two characters of the code), as listed in the
// PostgreSQL error codes appendix.
enum class SqlStateCategory {
    Success,                       // 00
    Warning,                       // 01
    NoData,                        // 02
    ConnectionException,           // 08
    FeatureNotSupported,           // 0A
    DataException,                 // 22
    IntegrityConstraintViolation,  // 23
    InvalidTransactionState,       // 25
    InvalidAuthorization,          // 28
    TransactionRollback,           // 40
    SyntaxErrorOrAccessRule,       // 42
    InsufficientResources,         // 53
    OperatorIntervention,          // 57
    SystemError,                   // 58
    InternalError,                 // XX
    Other
};

// Status validation and SQLSTATE classification for raw results
class ErrorHandler {
public:
    /**
     * @brief Validate the status of a result.
     *
     * Returns normally for PGRES_COMMAND_OK and PGRES_TUPLES_OK. Otherwise
     * throws SqlError with the result's SQLSTATE and message, or
     * ConnectionError if either of those is missing.
     */
    static void okResult(const RawResult& result);

    // Raw diagnostic fields, copied out of the result
    static std::optional<std::string> resultErrorMessage(const RawResult& result);
    static std::optional<std::string> resultErrorCode(const RawResult& result);

    // Map a SQLSTATE to its class
    static SqlStateCategory categorize(std::string_view sqlState);

    // Check if the SQLSTATE means the session itself is gone
    static bool isConnectionFailure(std::string_view sqlState);

    static const char* categoryName(SqlStateCategory category);
};

// Base class for every failure raised while reading a result
class ResultException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Requested row is not in [0, totalRows)
class RowsOutOfBounds : public ResultException {
public:
    RowsOutOfBounds(std::string operation, int requestedRow, int totalRows);

    const std::string& operation() const { return m_operation; }
    int requestedRow() const { return m_requestedRow; }
    int totalRows() const { return m_totalRows; }

private:
    std::string m_operation;
    int m_requestedRow;
    int m_totalRows;
};

// Result width differs from the width the row decoder was built for
class ColumnShapeMismatch : public ResultException {
public:
    ColumnShapeMismatch(std::string operation, int actualColumns, int expectedColumns);

    const std::string& operation() const { return m_operation; }
    int actualColumns() const { return m_actualColumns; }
    int expectedColumns() const { return m_expectedColumns; }

private:
    std::string m_operation;
    int m_actualColumns;
    int m_expectedColumns;
};

// The row decoder rejected the cells of a row
class RowDecodeError : public ResultException {
public:
    RowDecodeError(std::string operation, std::string message);

    const std::string& operation() const { return m_operation; }
    const std::string& message() const { return m_message; }

private:
    std::string m_operation;
    std::string m_message;
};

// A driver call returned no value where one was required
class ConnectionError : public ResultException {
public:
    explicit ConnectionError(std::string call, const std::string& detail = "");

    const std::string& call() const { return m_call; }

private:
    std::string m_call;
};

// The backend rejected the statement
class SqlError : public ResultException {
public:
    SqlError(ExecStatusType status, std::string sqlState, std::string message);

    ExecStatusType status() const { return m_status; }
    const std::string& sqlState() const { return m_sqlState; }
    const std::string& message() const { return m_message; }

    SqlStateCategory category() const { return ErrorHandler::categorize(m_sqlState); }
    bool isConnectionFailure() const { return ErrorHandler::isConnectionFailure(m_sqlState); }

private:
    ExecStatusType m_status;
    std::string m_sqlState;
    std::string m_message;
};

}  // namespace pqrow
