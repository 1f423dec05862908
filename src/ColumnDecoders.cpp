#include "ColumnDecoders.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <type_traits>

namespace pqrow {

namespace {

std::string quoted(std::string_view text) {
    return "'" + std::string(text) + "'";
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Whole-string signed integer parse with range check against T.
template <typename T>
DecodeResult<T> parseInteger(std::string_view text, const char* typeName) {
    std::string buffer(text);
    if (buffer.empty() || std::isspace(static_cast<unsigned char>(buffer.front()))) {
        return DecodeResult<T>::failure(std::string("invalid ") + typeName + " " + quoted(text));
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(buffer.c_str(), &end, 10);
    if (end != buffer.c_str() + buffer.size()) {
        return DecodeResult<T>::failure(std::string("invalid ") + typeName + " " + quoted(text));
    }
    if (errno == ERANGE ||
        value < static_cast<long long>(std::numeric_limits<T>::min()) ||
        value > static_cast<long long>(std::numeric_limits<T>::max())) {
        return DecodeResult<T>::failure(std::string(typeName) + " out of range " + quoted(text));
    }
    return DecodeResult<T>::success(static_cast<T>(value));
}

template <typename T>
DecodeResult<T> parseFloating(std::string_view text, const char* typeName) {
    std::string buffer(text);
    if (buffer.empty() || std::isspace(static_cast<unsigned char>(buffer.front()))) {
        return DecodeResult<T>::failure(std::string("invalid ") + typeName + " " + quoted(text));
    }

    errno = 0;
    char* end = nullptr;
    T value;
    if constexpr (std::is_same_v<T, float>) {
        value = std::strtof(buffer.c_str(), &end);
    } else {
        value = std::strtod(buffer.c_str(), &end);
    }
    if (end != buffer.c_str() + buffer.size()) {
        return DecodeResult<T>::failure(std::string("invalid ") + typeName + " " + quoted(text));
    }
    // Underflow to a denormal or zero is fine; overflow is not.
    if (errno == ERANGE && std::abs(value) == std::numeric_limits<T>::infinity()) {
        return DecodeResult<T>::failure(std::string(typeName) + " out of range " + quoted(text));
    }
    return DecodeResult<T>::success(value);
}

}  // namespace

ValueParser<std::string> textValue() {
    return [](std::string_view text) {
        return DecodeResult<std::string>::success(std::string(text));
    };
}

ValueParser<bool> boolValue() {
    return [](std::string_view text) {
        std::string value = lower(text);
        if (value == "t" || value == "true") {
            return DecodeResult<bool>::success(true);
        }
        if (value == "f" || value == "false") {
            return DecodeResult<bool>::success(false);
        }
        return DecodeResult<bool>::failure("invalid bool " + quoted(text));
    };
}

ValueParser<int16_t> int16Value() {
    return [](std::string_view text) { return parseInteger<int16_t>(text, "int2"); };
}

ValueParser<int32_t> int32Value() {
    return [](std::string_view text) { return parseInteger<int32_t>(text, "int4"); };
}

ValueParser<int64_t> int64Value() {
    return [](std::string_view text) { return parseInteger<int64_t>(text, "int8"); };
}

ValueParser<float> float4Value() {
    return [](std::string_view text) { return parseFloating<float>(text, "float4"); };
}

ValueParser<double> float8Value() {
    return [](std::string_view text) { return parseFloating<double>(text, "float8"); };
}

}  // namespace pqrow
