#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pqrow {

// Failure text produced by a decoder. Surfaced verbatim, never interpreted.
struct DecodeError {
    std::string message;
};

/**
 * @class DecodeResult
 * @brief Outcome of decoding a cell or a row: a value, or a DecodeError.
 *
 * Malformed data is an expected condition, so decoders report it through
 * this type instead of throwing.
 */
template <typename T>
class DecodeResult {
public:
    static DecodeResult success(T value) {
        return DecodeResult(std::in_place_index<0>, std::move(value));
    }

    static DecodeResult failure(std::string message) {
        return DecodeResult(std::in_place_index<1>, DecodeError{std::move(message)});
    }

    bool ok() const { return m_state.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!ok()) throw std::logic_error("DecodeResult::value() on failure: " + error());
        return std::get<0>(m_state);
    }

    T&& value() && {
        if (!ok()) throw std::logic_error("DecodeResult::value() on failure: " + error());
        return std::get<0>(std::move(m_state));
    }

    const std::string& error() const {
        if (ok()) throw std::logic_error("DecodeResult::error() on success");
        return std::get<1>(m_state).message;
    }

    // Apply f to the value, passing a failure through unchanged.
    template <typename F>
    auto map(F&& f) const& -> DecodeResult<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (!ok()) return DecodeResult<U>::failure(error());
        return DecodeResult<U>::success(std::forward<F>(f)(std::get<0>(m_state)));
    }

    // Prefix the failure message, e.g. with the column it came from.
    DecodeResult withContext(const std::string& context) && {
        if (ok()) return std::move(*this);
        return failure(context + ": " + error());
    }

private:
    template <std::size_t I, typename... Args>
    explicit DecodeResult(std::in_place_index_t<I> tag, Args&&... args)
        : m_state(tag, std::forward<Args>(args)...) {}

    std::variant<T, DecodeError> m_state;
};

}  // namespace pqrow
