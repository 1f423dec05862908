#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace pqrow {

namespace {

std::string copyField(const RawField& field) {
    return std::string(field->data(), field->size());
}

// libpq messages end with a newline; keep it out of what().
std::string trimTrailing(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

}  // namespace

void ErrorHandler::okResult(const RawResult& result) {
    ExecStatusType status = result.resultStatus();
    switch (status) {
        case PGRES_COMMAND_OK:
        case PGRES_TUPLES_OK:
            return;
        default:
            break;
    }

    RawField stateCode = result.resultErrorField(PG_DIAG_SQLSTATE);
    if (!stateCode) {
        spdlog::warn("Result with status {} carries no SQLSTATE", PQresStatus(status));
        throw ConnectionError("resultErrorField");
    }

    RawField message = result.resultErrorMessage();
    if (!message) {
        spdlog::warn("Result with status {} and SQLSTATE {} carries no error message",
                     PQresStatus(status), copyField(stateCode));
        throw ConnectionError("resultErrorMessage");
    }

    spdlog::debug("Statement failed with SQLSTATE {}", copyField(stateCode));
    throw SqlError(status, copyField(stateCode), copyField(message));
}

std::optional<std::string> ErrorHandler::resultErrorMessage(const RawResult& result) {
    RawField message = result.resultErrorMessage();
    if (!message) return std::nullopt;
    return copyField(message);
}

std::optional<std::string> ErrorHandler::resultErrorCode(const RawResult& result) {
    RawField code = result.resultErrorField(PG_DIAG_SQLSTATE);
    if (!code) return std::nullopt;
    return copyField(code);
}

SqlStateCategory ErrorHandler::categorize(std::string_view sqlState) {
    if (sqlState.size() != 5) {
        return SqlStateCategory::Other;
    }

    std::string_view cls = sqlState.substr(0, 2);
    if (cls == "00") return SqlStateCategory::Success;
    if (cls == "01") return SqlStateCategory::Warning;
    if (cls == "02") return SqlStateCategory::NoData;
    if (cls == "08") return SqlStateCategory::ConnectionException;
    if (cls == "0A") return SqlStateCategory::FeatureNotSupported;
    if (cls == "22") return SqlStateCategory::DataException;
    if (cls == "23") return SqlStateCategory::IntegrityConstraintViolation;
    if (cls == "25") return SqlStateCategory::InvalidTransactionState;
    if (cls == "28") return SqlStateCategory::InvalidAuthorization;
    if (cls == "40") return SqlStateCategory::TransactionRollback;
    if (cls == "42") return SqlStateCategory::SyntaxErrorOrAccessRule;
    if (cls == "53") return SqlStateCategory::InsufficientResources;
    if (cls == "57") return SqlStateCategory::OperatorIntervention;
    if (cls == "58") return SqlStateCategory::SystemError;
    if (cls == "XX") return SqlStateCategory::InternalError;
    return SqlStateCategory::Other;
}

bool ErrorHandler::isConnectionFailure(std::string_view sqlState) {
    if (categorize(sqlState) == SqlStateCategory::ConnectionException) {
        return true;
    }
    // admin_shutdown, crash_shutdown, cannot_connect_now
    return sqlState == "57P01" || sqlState == "57P02" || sqlState == "57P03";
}

const char* ErrorHandler::categoryName(SqlStateCategory category) {
    switch (category) {
        case SqlStateCategory::Success:
            return "successful_completion";
        case SqlStateCategory::Warning:
            return "warning";
        case SqlStateCategory::NoData:
            return "no_data";
        case SqlStateCategory::ConnectionException:
            return "connection_exception";
        case SqlStateCategory::FeatureNotSupported:
            return "feature_not_supported";
        case SqlStateCategory::DataException:
            return "data_exception";
        case SqlStateCategory::IntegrityConstraintViolation:
            return "integrity_constraint_violation";
        case SqlStateCategory::InvalidTransactionState:
            return "invalid_transaction_state";
        case SqlStateCategory::InvalidAuthorization:
            return "invalid_authorization_specification";
        case SqlStateCategory::TransactionRollback:
            return "transaction_rollback";
        case SqlStateCategory::SyntaxErrorOrAccessRule:
            return "syntax_error_or_access_rule_violation";
        case SqlStateCategory::InsufficientResources:
            return "insufficient_resources";
        case SqlStateCategory::OperatorIntervention:
            return "operator_intervention";
        case SqlStateCategory::SystemError:
            return "system_error";
        case SqlStateCategory::InternalError:
            return "internal_error";
        case SqlStateCategory::Other:
        default:
            return "other";
    }
}

RowsOutOfBounds::RowsOutOfBounds(std::string operation, int requestedRow, int totalRows)
    : ResultException(operation + ": row " + std::to_string(requestedRow) +
                      " out of bounds (result has " + std::to_string(totalRows) + " rows)")
    , m_operation(std::move(operation))
    , m_requestedRow(requestedRow)
    , m_totalRows(totalRows) {
}

ColumnShapeMismatch::ColumnShapeMismatch(std::string operation, int actualColumns,
                                         int expectedColumns)
    : ResultException(operation + ": result has " + std::to_string(actualColumns) +
                      " columns, decoder expects " + std::to_string(expectedColumns))
    , m_operation(std::move(operation))
    , m_actualColumns(actualColumns)
    , m_expectedColumns(expectedColumns) {
}

RowDecodeError::RowDecodeError(std::string operation, std::string message)
    : ResultException(operation + ": " + message)
    , m_operation(std::move(operation))
    , m_message(std::move(message)) {
}

ConnectionError::ConnectionError(std::string call, const std::string& detail)
    : ResultException(detail.empty() ? call + " returned no value"
                                     : call + ": " + trimTrailing(detail))
    , m_call(std::move(call)) {
}

SqlError::SqlError(ExecStatusType status, std::string sqlState, std::string message)
    : ResultException(std::string(PQresStatus(status)) + " [" + sqlState + "]: " +
                      trimTrailing(message))
    , m_status(status)
    , m_sqlState(std::move(sqlState))
    , m_message(std::move(message)) {
}

}  // namespace pqrow
