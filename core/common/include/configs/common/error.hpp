#pragma once

/**
 * @file error.hpp
 * @brief Structured decode errors and the Attempt result type
 *
 * This header provides:
 * - Error kinds for configuration decoding (missing, wrong type, bad path...)
 * - Rich error context with dotted path and source location
 * - Aggregation of independent errors without masking
 * - Attempt<T>, the success-or-error result of every decode
 */

#include "platform.hpp"

#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#if defined(CONFIGS_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace configs::common {

// ============================================================================
// ERROR KINDS
// ============================================================================

/**
 * @brief Classification of decode failures
 *
 * Callers branch on the kind; catchability predicates of the wrapper
 * decoders are evaluated per kind.
 */
enum class ErrorKind : uint8_t {
    MISSING    = 0x01,  ///< Required key absent (including ambiguous spellings)
    WRONG_TYPE = 0x02,  ///< Node present but of the wrong shape or type
    BAD_PATH   = 0x03,  ///< Malformed path or non-existent addressed property
    BAD_VALUE  = 0x04,  ///< Right shape, unacceptable content
    AGGREGATE  = 0x05,  ///< Several independent errors
};

/**
 * @brief Get kind name as string
 */
constexpr std::string_view kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MISSING:    return "Missing";
        case ErrorKind::WRONG_TYPE: return "WrongType";
        case ErrorKind::BAD_PATH:   return "BadPath";
        case ErrorKind::BAD_VALUE:  return "BadValue";
        case ErrorKind::AGGREGATE:  return "Aggregate";
        default:                    return "Unknown";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

/**
 * @brief Source location information for error tracking
 */
struct SourceLocation {
    const char* file = "";
    const char* function = "";
    uint32_t line = 0;
    uint32_t column = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_,
                             uint32_t line_, uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(CONFIGS_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name())
        , function(loc.function_name())
        , line(loc.line())
        , column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept {
        return SourceLocation();
    }
#endif

    constexpr bool is_valid() const noexcept {
        return line > 0 && file[0] != '\0';
    }
};

#if defined(CONFIGS_HAS_SOURCE_LOCATION)
    #define CONFIGS_CURRENT_LOCATION ::configs::common::SourceLocation::current()
#else
    #define CONFIGS_CURRENT_LOCATION ::configs::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR
// ============================================================================

/**
 * @brief A structured decode error
 *
 * Every error carries the dotted path of the offending node. Aggregate
 * errors own their children; any error may carry suppressed errors of
 * alternatives that were tried and discarded.
 */
class CONFIGS_API Error {
public:
    Error(ErrorKind kind, std::string path, std::string message,
          SourceLocation loc = CONFIGS_CURRENT_LOCATION);

    // Factories
    static Error missing(std::string path, std::string message = {},
                         SourceLocation loc = CONFIGS_CURRENT_LOCATION);
    static Error wrong_type(std::string path, std::string expected, std::string actual,
                            SourceLocation loc = CONFIGS_CURRENT_LOCATION);
    static Error bad_path(std::string path, std::string reason,
                          SourceLocation loc = CONFIGS_CURRENT_LOCATION);
    static Error bad_value(std::string path, std::string reason,
                           SourceLocation loc = CONFIGS_CURRENT_LOCATION);

    /**
     * @brief Collect independent errors
     *
     * Nested aggregates are flattened. A single error is returned as is.
     * @throws std::invalid_argument if errors is empty
     */
    static Error aggregate(std::vector<Error> errors);

    /**
     * @brief Concatenate two errors into one aggregate
     */
    static Error concat(Error first, Error second);

    // Copy constructor (deep copy cause chain)
    Error(const Error& other);
    Error(Error&& other) noexcept = default;
    Error& operator=(const Error& other);
    Error& operator=(Error&& other) noexcept = default;

    // Accessors
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& path() const noexcept { return path_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }
    const SourceLocation& location() const noexcept { return location_; }
    const std::vector<Error>& children() const noexcept { return children_; }
    const std::vector<Error>& suppressed() const noexcept { return suppressed_; }
    const std::vector<std::pair<std::string, std::string>>& context() const noexcept {
        return context_;
    }

    bool is(ErrorKind kind) const noexcept { return kind_ == kind; }

    /**
     * @brief Look up a context entry added with with_context()
     */
    std::optional<std::string> context_value(std::string_view key) const;

    // Formatted error, including context, children and cause chain
    std::string to_string() const;

    // One line "path: message" summary
    std::string summary() const;

    // Chain errors (for error wrapping)
    Error& with_cause(Error cause);

    const Error* cause() const noexcept { return cause_.get(); }

    Error& with_context(std::string_view key, std::string_view value);

    Error& with_suppressed(Error other);

    /**
     * @brief Copy of this error with a leading path segment replaced
     *
     * Paths equal to @p from, or starting with @p from followed by '.' or
     * '[', get @p from replaced by @p to. Children, suppressed errors and
     * the cause chain are rebased as well.
     */
    Error rebased(std::string_view from, std::string_view to) const;

private:
    ErrorKind kind_;
    std::string path_;
    std::string message_;
    std::string expected_;
    std::string actual_;
    SourceLocation location_;
    std::unique_ptr<Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
    std::vector<Error> children_;
    std::vector<Error> suppressed_;
};

/**
 * @brief Exception carrying a decode Error
 *
 * Thrown by Attempt::get_or_throw(); caught and converted back to a
 * Failure by Decoder::from().
 */
class CONFIGS_API DecodeException : public std::runtime_error {
public:
    explicit DecodeException(Error error)
        : std::runtime_error(error.to_string()), error_(std::move(error)) {}

    const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

// ============================================================================
// ATTEMPT TYPE
// ============================================================================

template<typename T>
class Attempt;

namespace detail {

template<typename R>
struct is_attempt : std::false_type {};

template<typename T>
struct is_attempt<Attempt<T>> : std::true_type {};

template<typename R>
inline constexpr bool is_attempt_v = is_attempt<std::remove_cvref_t<R>>::value;

}  // namespace detail

/**
 * @brief Success value or structured decode failure
 *
 * Laws: map(identity) is identity, map(f . g) equals map(g).map(f),
 * flat_map short-circuits on the first failure, or_else only evaluates its
 * fallback on failure and discards the original failure when the fallback
 * succeeds.
 */
template<typename T>
class Attempt {
public:
    using value_type = T;

    // Success with value
    Attempt(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : state_(std::in_place_index<0>, std::move(value)) {}

    // Failure
    Attempt(Error error) noexcept
        : state_(std::in_place_index<1>, std::move(error)) {}

    static Attempt success(T value) { return Attempt(std::move(value)); }
    static Attempt failure(Error error) { return Attempt(std::move(error)); }

    // Status
    bool is_success() const noexcept { return state_.index() == 0; }
    bool is_failure() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return is_success(); }

    /**
     * @brief Value access
     * @throws DecodeException carrying the error if this is a failure
     */
    T& value() & {
        throw_if_failure();
        return std::get<0>(state_);
    }
    const T& value() const& {
        throw_if_failure();
        return std::get<0>(state_);
    }
    T&& value() && {
        throw_if_failure();
        return std::move(std::get<0>(state_));
    }

    T get_or_throw() const& { return value(); }
    T get_or_throw() && { return std::move(*this).value(); }

    // Value access with default
    T value_or(T default_value) const& {
        return is_success() ? std::get<0>(state_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_success() ? std::move(std::get<0>(state_)) : std::move(default_value);
    }

    /**
     * @brief Error access (only call if is_failure())
     * @throws std::logic_error on a success
     */
    const Error& error() const& {
        if (CONFIGS_UNLIKELY(is_success())) {
            throw std::logic_error("Attempt::error() called on a success");
        }
        return std::get<1>(state_);
    }

    Error error() && {
        if (CONFIGS_UNLIKELY(is_success())) {
            throw std::logic_error("Attempt::error() called on a success");
        }
        return std::move(std::get<1>(state_));
    }

    std::optional<ErrorKind> kind() const noexcept {
        if (is_success()) return std::nullopt;
        return std::get<1>(state_).kind();
    }

    // Transform the value (if success)
    template<typename F>
    auto map(F&& func) const& -> Attempt<std::invoke_result_t<F, const T&>> {
        using ReturnType = Attempt<std::invoke_result_t<F, const T&>>;
        if (is_success()) {
            return ReturnType(std::invoke(std::forward<F>(func), std::get<0>(state_)));
        }
        return ReturnType(std::get<1>(state_));
    }

    template<typename F>
    auto map(F&& func) && -> Attempt<std::invoke_result_t<F, T&&>> {
        using ReturnType = Attempt<std::invoke_result_t<F, T&&>>;
        if (is_success()) {
            return ReturnType(std::invoke(std::forward<F>(func), std::move(std::get<0>(state_))));
        }
        return ReturnType(std::move(std::get<1>(state_)));
    }

    // Chain an operation returning Attempt<U>
    template<typename F>
    auto flat_map(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using ReturnType = std::invoke_result_t<F, const T&>;
        static_assert(detail::is_attempt_v<ReturnType>, "flat_map function must return an Attempt");
        if (is_success()) {
            return std::invoke(std::forward<F>(func), std::get<0>(state_));
        }
        return ReturnType(std::get<1>(state_));
    }

    template<typename F>
    auto flat_map(F&& func) && -> std::invoke_result_t<F, T&&> {
        using ReturnType = std::invoke_result_t<F, T&&>;
        static_assert(detail::is_attempt_v<ReturnType>, "flat_map function must return an Attempt");
        if (is_success()) {
            return std::invoke(std::forward<F>(func), std::move(std::get<0>(state_)));
        }
        return ReturnType(std::move(std::get<1>(state_)));
    }

    /**
     * @brief Fall back on failure
     *
     * @p fallback is either nullary or takes the error; it must return
     * Attempt<T> and is only invoked when this is a failure.
     */
    template<typename F>
    Attempt or_else(F&& fallback) const& {
        if (is_success()) {
            return *this;
        }
        return invoke_fallback(std::forward<F>(fallback), std::get<1>(state_));
    }

    template<typename F>
    Attempt or_else(F&& fallback) && {
        if (is_success()) {
            return std::move(*this);
        }
        return invoke_fallback(std::forward<F>(fallback), std::get<1>(state_));
    }

    // Transform the error (if failure)
    template<typename F>
    Attempt map_error(F&& func) const& {
        if (is_success()) {
            return *this;
        }
        return Attempt(std::invoke(std::forward<F>(func), std::get<1>(state_)));
    }

    // Add context to the error (no-op on success)
    Attempt& with_context(std::string_view key, std::string_view value) & {
        if (is_failure()) {
            std::get<1>(state_).with_context(key, value);
        }
        return *this;
    }

    Attempt&& with_context(std::string_view key, std::string_view value) && {
        if (is_failure()) {
            std::get<1>(state_).with_context(key, value);
        }
        return std::move(*this);
    }

    friend bool operator==(const Attempt& lhs, const Attempt& rhs)
        requires requires(const T& a, const T& b) { { a == b } -> std::convertible_to<bool>; }
    {
        if (lhs.is_success() != rhs.is_success()) return false;
        if (lhs.is_success()) return std::get<0>(lhs.state_) == std::get<0>(rhs.state_);
        const Error& a = std::get<1>(lhs.state_);
        const Error& b = std::get<1>(rhs.state_);
        return a.kind() == b.kind() && a.path() == b.path() && a.message() == b.message();
    }

private:
    void throw_if_failure() const {
        if (CONFIGS_UNLIKELY(is_failure())) {
            throw DecodeException(std::get<1>(state_));
        }
    }

    template<typename F>
    static Attempt invoke_fallback(F&& fallback, const Error& error) {
        if constexpr (std::is_invocable_v<F, const Error&>) {
            return std::invoke(std::forward<F>(fallback), error);
        } else {
            return std::invoke(std::forward<F>(fallback));
        }
    }

    std::variant<T, Error> state_;
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Create a success Attempt
 */
template<typename T>
Attempt<T> ok(T value) {
    return Attempt<T>(std::move(value));
}

/**
 * @brief Create a failed Attempt
 */
template<typename T>
Attempt<T> fail(Error error) {
    return Attempt<T>(std::move(error));
}

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Assign value or return the error
 *
 * Usage: CONFIGS_TRY_ASSIGN(var, some_function_returning_attempt());
 */
#define CONFIGS_TRY_ASSIGN(var, expr)                                        \
    auto _configs_try_##var = (expr);                                        \
    if (CONFIGS_UNLIKELY(_configs_try_##var.is_failure())) {                \
        return std::move(_configs_try_##var).error();                        \
    }                                                                        \
    var = std::move(_configs_try_##var).value()

}  // namespace configs::common
