#pragma once

/**
 * @file ColumnDecoders.hpp
 * @brief Column decoders for libpq's text result format.
 *
 * Value parsers turn the bytes of a non-NULL cell into a value. notNull()
 * and nullable() lift a parser into a ColumnDecoder by deciding what a SQL
 * NULL means for that column.
 */

#include "RowDecoder.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pqrow {

/// Parses the bytes of a non-NULL cell.
template <typename T>
using ValueParser = std::function<DecodeResult<T>(std::string_view)>;

ValueParser<std::string> textValue();

// Accepts t, true, f, false (any case), the forms PostgreSQL prints.
ValueParser<bool> boolValue();

ValueParser<int16_t> int16Value();
ValueParser<int32_t> int32Value();
ValueParser<int64_t> int64Value();

ValueParser<float> float4Value();
ValueParser<double> float8Value();

/// NULL is a decode failure.
template <typename T>
ColumnDecoder<T> notNull(ValueParser<T> parser) {
    return [parser = std::move(parser)](const Cell& cell) {
        if (!cell) {
            return DecodeResult<T>::failure("unexpected NULL");
        }
        return parser(*cell);
    };
}

/// NULL decodes to std::nullopt.
template <typename T>
ColumnDecoder<std::optional<T>> nullable(ValueParser<T> parser) {
    return [parser = std::move(parser)](const Cell& cell) {
        if (!cell) {
            return DecodeResult<std::optional<T>>::success(std::nullopt);
        }
        return parser(*cell).map([](const T& value) { return std::optional<T>(value); });
    };
}

}  // namespace pqrow
