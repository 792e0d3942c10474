#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace vigil {

/// Result of a fallible operation: either a value or an error
/// Used at config, codec and feed boundaries instead of exceptions
template <typename T, typename E = std::string>
class Result {
public:
    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Index-based so Result<std::string, std::string> stays unambiguous
    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /// Access the value, throws std::logic_error when holding an error
    [[nodiscard]] const T& value() const& {
        if (is_err()) {
            throw std::logic_error("value() called on an error Result");
        }
        return std::get<0>(data_);
    }

    [[nodiscard]] T value() && {
        if (is_err()) {
            throw std::logic_error("value() called on an error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Access the error, throws std::logic_error when holding a value
    [[nodiscard]] const E& error() const& {
        if (is_ok()) {
            throw std::logic_error("error() called on an ok Result");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return fallback;
    }

    /// Move the value out (for move-only payloads such as parsed rule sets)
    [[nodiscard]] T take_value() && {
        if (is_err()) {
            throw std::logic_error("take_value() called on an error Result");
        }
        return std::get<0>(std::move(data_));
    }

    /// Chain a second fallible step
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using Next = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return func(std::get<0>(data_));
        }
        return Next::Err(std::get<1>(data_));
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : data_(tag, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

}  // namespace vigil
