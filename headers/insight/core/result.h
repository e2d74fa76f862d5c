//
// Created by gregorian on 19/10/2026.
//

#ifndef INSIGHT_RESULT_H
#define INSIGHT_RESULT_H

#include "insight/core/error.h"
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace insight::core {

    /**
     * @brief Either the value produced by an operation or the Error that stopped it.
     *
     * Accessing the wrong alternative throws std::logic_error; callers test
     * is_success() / is_failure() first.
     *
     * @tparam T Type of the successful value.
     */
    template<typename T>
    class Result {
    public:
        explicit Result(const T& value) : data_(value) {}
        explicit Result(T&& value) : data_(std::move(value)) {}
        explicit Result(const Error& error) : data_(error) {}
        explicit Result(Error&& error) : data_(std::move(error)) {}

        static Result success(const T& value) { return Result(value); }
        static Result success(T&& value) { return Result(std::move(value)); }

        static Result failure(const Error& error) { return Result(error); }
        static Result failure(Error&& error) { return Result(std::move(error)); }

        static Result failure(const ErrorCode code, std::string message) {
            return Result(make_error(code, std::move(message)));
        }

        [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
        [[nodiscard]] bool is_failure() const { return std::holds_alternative<Error>(data_); }
        explicit operator bool() const { return is_success(); }

        const T& value() const & {
            if (!is_success()) throw std::logic_error("value() called on a failed Result");
            return std::get<T>(data_);
        }

        T& value() & {
            if (!is_success()) throw std::logic_error("value() called on a failed Result");
            return std::get<T>(data_);
        }

        T&& value() && {
            if (!is_success()) throw std::logic_error("value() called on a failed Result");
            return std::move(std::get<T>(data_));
        }

        [[nodiscard]] const Error& error() const & {
            if (!is_failure()) throw std::logic_error("error() called on a successful Result");
            return std::get<Error>(data_);
        }

        Error&& error() && {
            if (!is_failure()) throw std::logic_error("error() called on a successful Result");
            return std::move(std::get<Error>(data_));
        }

        T value_or(const T& fallback) const & {
            return is_success() ? std::get<T>(data_) : fallback;
        }

        T value_or(T&& fallback) && {
            return is_success() ? std::move(std::get<T>(data_)) : std::move(fallback);
        }

        /**
         * @brief Transform the value, passing a failure through untouched.
         */
        template<typename F>
        auto map(F&& func) const & -> Result<decltype(func(std::declval<T>()))> {
            using U = decltype(func(std::declval<T>()));
            if (is_success()) return Result<U>::success(func(std::get<T>(data_)));
            return Result<U>::failure(std::get<Error>(data_));
        }

        /**
         * @brief Chain an operation that itself returns a Result.
         */
        template<typename F>
        auto and_then(F&& func) const & -> decltype(func(std::declval<T>())) {
            if (is_success()) return func(std::get<T>(data_));
            using ReturnType = decltype(func(std::declval<T>()));
            return ReturnType::failure(std::get<Error>(data_));
        }

    private:
        std::variant<T, Error> data_;
    };

    /**
     * @brief Outcome of an operation that produces no value.
     */
    template<>
    class Result<void> {
    public:
        Result() : data_(std::monostate{}) {}
        explicit Result(const Error& error) : data_(error) {}
        explicit Result(Error&& error) : data_(std::move(error)) {}

        static Result success() { return {}; }
        static Result failure(const Error& error) { return Result(error); }
        static Result failure(Error&& error) { return Result(std::move(error)); }
        static Result failure(const ErrorCode code, std::string message) {
            return Result(make_error(code, std::move(message)));
        }

        [[nodiscard]] bool is_success() const { return std::holds_alternative<std::monostate>(data_); }
        [[nodiscard]] bool is_failure() const { return std::holds_alternative<Error>(data_); }
        explicit operator bool() const { return is_success(); }

        [[nodiscard]] const Error& error() const & {
            if (!is_failure()) throw std::logic_error("error() called on a successful Result");
            return std::get<Error>(data_);
        }

        template<typename F>
        Result and_then(F&& func) const & {
            if (is_success()) return func();
            return failure(std::get<Error>(data_));
        }

    private:
        std::variant<std::monostate, Error> data_;
    };

    inline Result<void> Ok() { return Result<void>::success(); }

    template<typename T>
    Result<T> Err(ErrorCode code, std::string message) {
        return Result<T>::failure(code, std::move(message));
    }

}  // namespace insight::core

#endif //INSIGHT_RESULT_H
