#pragma once

/**
 * @file RawResult.hpp
 * @brief Read-only view of a fully materialized driver result.
 *
 * The typed layer never talks to libpq directly; it reads rows, cells and
 * status metadata through this interface. Implementations borrow their data
 * from a driver-owned result object, so every byte view returned here is
 * valid only while that object is alive.
 */

#include <libpq-fe.h>
#include <optional>
#include <string_view>

namespace pqrow {

/// A single cell: raw bytes, or std::nullopt for SQL NULL.
using Cell = std::optional<std::string_view>;

/// A textual field reported by the driver, or std::nullopt if none was reported.
using RawField = std::optional<std::string_view>;

/**
 * @class RawResult
 * @brief Abstract raw result handle.
 *
 * All members are const: a RawResult is logically immutable once produced,
 * and may be read concurrently from several threads.
 */
class RawResult {
public:
    virtual ~RawResult() = default;

    /// Number of rows (tuples) in the result.
    virtual int ntuples() const = 0;

    /// Number of columns (fields) in each row.
    virtual int nfields() const = 0;

    /**
     * @brief Raw contents of one cell.
     * @param row Zero-based row index.
     * @param col Zero-based column index.
     * @return The cell bytes, or std::nullopt if the value is NULL.
     */
    virtual Cell getCell(int row, int col) const = 0;

    /// Status of the command that produced this result.
    virtual ExecStatusType resultStatus() const = 0;

    /// Command status tag (e.g. "INSERT 0 3").
    virtual RawField cmdStatus() const = 0;

    /// Affected-row count as text; empty when the command does not report one.
    virtual RawField cmdTuples() const = 0;

    /// Error message attached to the result.
    virtual RawField resultErrorMessage() const = 0;

    /**
     * @brief A single diagnostic field of the error report.
     * @param fieldCode One of libpq's PG_DIAG_* codes.
     */
    virtual RawField resultErrorField(int fieldCode) const = 0;
};

}  // namespace pqrow
