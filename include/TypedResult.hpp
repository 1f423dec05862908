#pragma once

/**
 * @file TypedResult.hpp
 * @brief Typed access to the rows of a raw driver result.
 *
 * A TypedResult pairs a RowDecoder with a RawResult and turns raw rows into
 * values of the decoder's type. Every row access re-checks the result's
 * column count against the decoder width, so a statement/decoder mismatch
 * surfaces as ColumnShapeMismatch on the first row read.
 *
 * Usage:
 * @code
 *   PostgreSQLResultSet raw = conn.execute("SELECT id, note FROM items");
 *   auto decoder = tupleDecoder(notNull(int32Value()), nullable(textValue()));
 *   TypedResult<std::tuple<int32_t, std::optional<std::string>>> result(decoder, raw);
 *   result.okResult();
 *   for (const auto& [id, note] : result.rows()) {
 *       // ...
 *   }
 * @endcode
 */

#include "ColumnDecoders.hpp"
#include "ErrorHandler.hpp"
#include "RawResult.hpp"
#include "RowDecoder.hpp"

#include <cctype>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pqrow {

/**
 * @class TypedResult
 * @brief A row decoder applied to a borrowed raw result.
 *
 * The raw result is not owned: it must outlive the TypedResult and every
 * range or iterator obtained from it. All operations are const and only
 * read the raw result, so one TypedResult may be used from several threads.
 *
 * Failures are thrown:
 * - RowsOutOfBounds when a row index is outside [0, ntuples())
 * - ColumnShapeMismatch when nfields() differs from the decoder width
 * - RowDecodeError when the decoder rejects a row
 */
template <typename T>
class TypedResult {
public:
    using value_type = T;

    /// Finite input range over the decoded rows.
    class RowRange {
    public:
        class iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T*;
            using reference = const T&;

            iterator(const TypedResult* owner, int total, int row)
                : m_owner(owner), m_total(total), m_row(row) {
                advance();
            }

            reference operator*() const { return m_current->first; }
            pointer operator->() const { return &m_current->first; }

            iterator& operator++() {
                m_row = m_current->second;
                advance();
                return *this;
            }

            bool operator==(const iterator& other) const { return position() == other.position(); }
            bool operator!=(const iterator& other) const { return !(*this == other); }

        private:
            void advance() {
                m_current = m_owner->nextRow(m_total, m_row);
            }

            // Exhausted iterators all compare equal to end().
            int position() const { return m_current ? m_row : m_total; }

            const TypedResult* m_owner;
            int m_total;
            int m_row;
            std::optional<std::pair<T, int>> m_current;
        };

        RowRange(const TypedResult& owner, int total) : m_owner(&owner), m_total(total) {}

        iterator begin() const { return iterator(m_owner, m_total, 0); }
        iterator end() const { return iterator(m_owner, m_total, m_total); }

        int size() const { return m_total > 0 ? m_total : 0; }
        bool empty() const { return size() == 0; }

    private:
        const TypedResult* m_owner;
        int m_total;
    };

    TypedResult(RowDecoder<T> decoder, const RawResult& result)
        : m_decoder(std::move(decoder)), m_result(&result) {}

    const RowDecoder<T>& decoder() const { return m_decoder; }
    const RawResult& raw() const { return *m_result; }

    // ----- Row extraction -----

    /**
     * @brief Decode one row.
     * @param row Zero-based row index, 0 <= row < ntuples().
     */
    T getRow(int row) const { return decodeRow("getRow", row); }

    /**
     * @brief Step of an external unfold over the rows.
     * @param total Row count obtained once from ntuples().
     * @param row Current row index.
     * @return std::nullopt once row >= total, otherwise the decoded row and row + 1.
     */
    std::optional<std::pair<T, int>> nextRow(int total, int row) const {
        if (row >= total) {
            return std::nullopt;
        }
        return std::make_pair(decodeRow("nextRow", row), row + 1);
    }

    /**
     * @brief Decode every row, in order.
     *
     * The first failing row aborts the call; no partial result is returned.
     */
    std::vector<T> getRows() const {
        int numRows = ntuples();
        std::vector<T> rows;
        rows.reserve(numRows > 0 ? static_cast<size_t>(numRows) : 0);
        for (int row = 0; row < numRows; ++row) {
            rows.push_back(decodeRow("getRows", row));
        }
        return rows;
    }

    /// Row 0, or std::nullopt for an empty result.
    std::optional<T> firstRow() const {
        if (ntuples() <= 0) {
            return std::nullopt;
        }
        return decodeRow("firstRow", 0);
    }

    /**
     * @brief Lazily decoded rows, built on nextRow().
     *
     * The row count is read once, here. Each begin() starts over from row 0.
     */
    RowRange rows() const { return RowRange(*this, ntuples()); }

    /// Same raw result, with f applied to every decoded row.
    template <typename F>
    auto map(F f) const -> TypedResult<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
        return TypedResult<U>(m_decoder.map(std::move(f)), *m_result);
    }

    // ----- Metadata -----

    /// Apply a function reading the raw result and return what it returns.
    template <typename F>
    auto liftResult(F&& f) const -> decltype(std::forward<F>(f)(std::declval<const RawResult&>())) {
        return std::forward<F>(f)(*m_result);
    }

    int ntuples() const {
        return liftResult([](const RawResult& r) { return r.ntuples(); });
    }

    int nfields() const {
        return liftResult([](const RawResult& r) { return r.nfields(); });
    }

    ExecStatusType resultStatus() const {
        return liftResult([](const RawResult& r) { return r.resultStatus(); });
    }

    /**
     * @brief Command status tag, e.g. "SELECT 3" or "INSERT 0 1".
     * @throws ConnectionError if the driver reports no tag at all.
     */
    std::string cmdStatus() const {
        return liftResult([](const RawResult& r) {
            RawField status = r.cmdStatus();
            if (!status) {
                throw ConnectionError("cmdStatus");
            }
            return std::string(status->data(), status->size());
        });
    }

    /**
     * @brief Rows affected by INSERT, UPDATE, DELETE, MOVE, FETCH, COPY,
     * SELECT or CREATE TABLE AS.
     *
     * std::nullopt when the command reports no count (empty field) or the
     * field is not an unsigned decimal integer.
     *
     * @throws ConnectionError if the driver reports no value at all.
     */
    std::optional<int64_t> cmdTuples() const {
        return liftResult([](const RawResult& r) -> std::optional<int64_t> {
            RawField tuples = r.cmdTuples();
            if (!tuples) {
                throw ConnectionError("cmdTuples");
            }
            if (tuples->empty() || !std::isdigit(static_cast<unsigned char>(tuples->front()))) {
                return std::nullopt;
            }
            DecodeResult<int64_t> count = int64Value()(*tuples);
            if (!count.ok()) {
                return std::nullopt;
            }
            return count.value();
        });
    }

    // ----- Status validation -----

    void okResult() const { ErrorHandler::okResult(*m_result); }

    std::optional<std::string> resultErrorMessage() const {
        return ErrorHandler::resultErrorMessage(*m_result);
    }

    std::optional<std::string> resultErrorCode() const {
        return ErrorHandler::resultErrorCode(*m_result);
    }

private:
    T decodeRow(const char* operation, int row) const {
        int numRows = m_result->ntuples();
        if (row < 0 || row >= numRows) {
            throw RowsOutOfBounds(operation, row, numRows);
        }

        int numCols = m_result->nfields();
        if (numCols < 0 || static_cast<size_t>(numCols) != m_decoder.width()) {
            throw ColumnShapeMismatch(operation, numCols, static_cast<int>(m_decoder.width()));
        }

        Row cells;
        cells.reserve(static_cast<size_t>(numCols));
        for (int col = 0; col < numCols; ++col) {
            cells.push_back(m_result->getCell(row, col));
        }

        DecodeResult<T> decoded = m_decoder.decode(cells);
        if (!decoded.ok()) {
            throw RowDecodeError(operation, decoded.error());
        }
        return std::move(decoded).value();
    }

    RowDecoder<T> m_decoder;
    const RawResult* m_result;  ///< Borrowed, must outlive this object
};

}  // namespace pqrow
