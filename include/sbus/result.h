#ifndef SBUS_RESULT_H
#define SBUS_RESULT_H

#include <sbus/config.h>
#include <sbus/error.h>
#include <string>
#include <variant>
#include <type_traits>
#include <utility>

namespace sbus {
namespace v1 {

/**
 * A failed outcome: the error code plus a short, non-sensitive detail
 * describing where and why it happened. The detail never carries key
 * material, plaintext or token values.
 */
struct Failure {
    SBusError code{SBusError::INTERNAL_ERROR};
    std::string detail;

    Failure() = default;
    Failure(SBusError c) : code(c) {}
    Failure(SBusError c, std::string d) : code(c), detail(std::move(d)) {}

    std::string to_string() const {
        if (detail.empty()) {
            return error_message(code);
        }
        return error_message(code) + ": " + detail;
    }
};

template<typename T>
class Result;

/**
 * Either a value of type T or a Failure.
 *
 * Operations on the secure bus never throw for expected failures; they
 * return a Result and the caller decides. Calling value() on a failure is
 * a programming error and throws SBusException.
 */
template<typename T>
class SBUS_API Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(SBusError error) : data_(Failure(error)) {}
    Result(Failure failure) : data_(std::move(failure)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    bool is_ok() const noexcept {
        return is_success();
    }

    bool is_error() const noexcept {
        return std::holds_alternative<Failure>(data_);
    }

    const T& value() const & {
        if (is_error()) {
            throw_failure();
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (is_error()) {
            throw_failure();
        }
        return std::get<T>(data_);
    }

    T value() && {
        if (is_error()) {
            throw_failure();
        }
        return std::move(std::get<T>(data_));
    }

    template<typename U>
    T value_or(U&& default_value) const & {
        if (is_success()) {
            return std::get<T>(data_);
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    SBusError error() const noexcept {
        if (is_success()) {
            return SBusError::SUCCESS;
        }
        return std::get<Failure>(data_).code;
    }

    // Empty for successes and for failures created from a bare code
    const std::string& error_detail() const noexcept {
        static const std::string empty;
        if (is_success()) {
            return empty;
        }
        return std::get<Failure>(data_).detail;
    }

    Failure failure() const {
        if (is_success()) {
            return Failure(SBusError::SUCCESS);
        }
        return std::get<Failure>(data_);
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    const T& operator*() const & {
        return value();
    }

    T& operator*() & {
        return value();
    }

    const T* operator->() const {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    T* operator->() {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    template<typename F>
    auto map(F&& func) const & -> Result<decltype(func(std::declval<const T&>()))> {
        using ReturnType = decltype(func(std::declval<const T&>()));
        if (is_error()) {
            return Result<ReturnType>(failure());
        }
        return Result<ReturnType>(func(std::get<T>(data_)));
    }

    template<typename F>
    auto and_then(F&& func) const & -> decltype(func(std::declval<const T&>())) {
        using ReturnType = decltype(func(std::declval<const T&>()));
        if (is_error()) {
            return ReturnType(failure());
        }
        return func(std::get<T>(data_));
    }

private:
    [[noreturn]] void throw_failure() const {
        const Failure& f = std::get<Failure>(data_);
        if (f.detail.empty()) {
            throw SBusException(f.code);
        }
        throw SBusException(f.code, f.detail);
    }

    std::variant<T, Failure> data_;
};

template<>
class SBUS_API Result<void> {
public:
    Result() = default;
    Result(SBusError error) : failure_(error) {}
    Result(Failure failure) : failure_(std::move(failure)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return failure_.code == SBusError::SUCCESS;
    }

    bool is_ok() const noexcept {
        return is_success();
    }

    bool is_error() const noexcept {
        return failure_.code != SBusError::SUCCESS;
    }

    SBusError error() const noexcept {
        return failure_.code;
    }

    const std::string& error_detail() const noexcept {
        return failure_.detail;
    }

    const Failure& failure() const noexcept {
        return failure_;
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    template<typename F>
    auto and_then(F&& func) const -> decltype(func()) {
        if (is_error()) {
            using ReturnType = decltype(func());
            return ReturnType(failure_);
        }
        return func();
    }

private:
    Failure failure_{SBusError::SUCCESS};
};

template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(SBusError error) {
    return Result<T>(error);
}

template<typename T>
Result<T> make_error(SBusError error, std::string detail) {
    return Result<T>(Failure(error, std::move(detail)));
}

// GNU statement expression, as used throughout the library
#define SBUS_TRY(expr) \
    ({ \
        auto _sbus_result = (expr); \
        if (_sbus_result.is_error()) { \
            return _sbus_result.failure(); \
        } \
        std::move(_sbus_result).value(); \
    })

#define SBUS_TRY_VOID(expr) \
    do { \
        auto _sbus_result = (expr); \
        if (_sbus_result.is_error()) { \
            return _sbus_result.failure(); \
        } \
    } while (0)

#define SBUS_RETURN_IF_ERROR(result) \
    do { \
        if (!(result).is_success()) { \
            return (result).failure(); \
        } \
    } while (0)

} // namespace v1
} // namespace sbus

#endif // SBUS_RESULT_H
