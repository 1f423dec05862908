#pragma once

/**
 * @file RowDecoder.hpp
 * @brief Fixed-width row decoders.
 *
 * A RowDecoder turns one row of nullable raw cells into a typed value. Its
 * width is fixed when it is built; TypedResult checks that width against the
 * column count of every row it reads before calling decode().
 */

#include "DecodeResult.hpp"
#include "RawResult.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace pqrow {

/// One row of raw cells, in column order.
using Row = std::vector<Cell>;

/// Decodes a single cell.
template <typename T>
using ColumnDecoder = std::function<DecodeResult<T>(const Cell&)>;

/**
 * @class RowDecoder
 * @brief A pure decode function together with the row width it expects.
 *
 * Decoders are cheap to copy and safe to share between threads as long as
 * the wrapped function is pure.
 */
template <typename T>
class RowDecoder {
public:
    using value_type = T;
    using Function = std::function<DecodeResult<T>(const Row&)>;

    RowDecoder(std::size_t width, Function fn)
        : m_width(width), m_fn(std::move(fn)) {}

    std::size_t width() const { return m_width; }

    /**
     * @brief Decode one row.
     * @param row Exactly width() cells.
     * @return The decoded value, or the decoder's failure message.
     */
    DecodeResult<T> decode(const Row& row) const {
        if (row.size() != m_width) {
            return DecodeResult<T>::failure("expected " + std::to_string(m_width) +
                                            " columns, got " + std::to_string(row.size()));
        }
        return m_fn(row);
    }

    /// Decoder of the same width whose successful values are passed through f.
    template <typename F>
    auto map(F f) const -> RowDecoder<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
        Function fn = m_fn;
        return RowDecoder<U>(m_width, [fn, f](const Row& row) { return fn(row).map(f); });
    }

private:
    std::size_t m_width;
    Function m_fn;
};

template <typename T, typename F>
RowDecoder<T> makeRowDecoder(std::size_t width, F&& fn) {
    return RowDecoder<T>(width, typename RowDecoder<T>::Function(std::forward<F>(fn)));
}

namespace detail {

template <std::size_t I, typename Columns, typename Values>
bool decodeColumn(const Columns& columns, const Row& row, Values& values, std::string& error) {
    auto result = std::get<I>(columns)(row[I]);
    if (!result.ok()) {
        error = "column " + std::to_string(I) + ": " + result.error();
        return false;
    }
    std::get<I>(values) = std::move(result).value();
    return true;
}

template <typename... Ts, std::size_t... I>
DecodeResult<std::tuple<Ts...>> decodeTuple(const std::tuple<ColumnDecoder<Ts>...>& columns,
                                            const Row& row,
                                            std::index_sequence<I...>) {
    std::tuple<std::optional<Ts>...> values;
    std::string error;
    // Left to right, stopping at the first failing column.
    bool ok = (decodeColumn<I>(columns, row, values, error) && ...);
    if (!ok) {
        return DecodeResult<std::tuple<Ts...>>::failure(std::move(error));
    }
    return DecodeResult<std::tuple<Ts...>>::success(
        std::tuple<Ts...>(std::move(*std::get<I>(values))...));
}

}  // namespace detail

/**
 * @brief Build a row decoder from one column decoder per column.
 *
 * The width is the number of column decoders. A failure message is prefixed
 * with the index of the column that produced it.
 *
 * @code
 *   auto decoder = tupleDecoder(notNull(int32Value()), nullable(textValue()));
 *   // RowDecoder<std::tuple<int32_t, std::optional<std::string>>>, width 2
 * @endcode
 */
template <typename... Ts>
RowDecoder<std::tuple<Ts...>> tupleDecoder(ColumnDecoder<Ts>... columns) {
    std::tuple<ColumnDecoder<Ts>...> cols(std::move(columns)...);
    return RowDecoder<std::tuple<Ts...>>(sizeof...(Ts), [cols](const Row& row) {
        return detail::decodeTuple(cols, row, std::index_sequence_for<Ts...>{});
    });
}

}  // namespace pqrow
