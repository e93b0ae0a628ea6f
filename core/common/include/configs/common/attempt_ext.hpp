#pragma once

/**
 * @file attempt_ext.hpp
 * @brief Combinators over Attempt<T>
 *
 * Provides:
 * - flatten: Attempt<Attempt<T>> to Attempt<T>
 * - zip: combine two attempts, accumulating both failures
 * - sequence: vector of attempts to attempt of vector, accumulating failures
 * - inspect / inspect_error: peek without consuming
 *
 * Example:
 * @code
 * auto endpoint = zip(get<std::string>(cfg, "host"), get<int>(cfg, "port"))
 *     .map([](auto pair) { return pair.first + ":" + std::to_string(pair.second); });
 * @endcode
 */

#include "error.hpp"

#include <type_traits>
#include <utility>
#include <vector>

namespace configs::common {

/**
 * @brief Flatten nested Attempt
 */
template<typename T>
Attempt<T> flatten(const Attempt<Attempt<T>>& nested) {
    if (nested.is_failure()) {
        return Attempt<T>(nested.error());
    }
    return nested.value();
}

template<typename T>
Attempt<T> flatten(Attempt<Attempt<T>>&& nested) {
    if (nested.is_failure()) {
        return Attempt<T>(std::move(nested).error());
    }
    return std::move(nested).value();
}

/**
 * @brief Combine two independent attempts
 *
 * Unlike flat_map, both failures are kept: two failures produce an
 * aggregate error.
 */
template<typename A, typename B>
Attempt<std::pair<A, B>> zip(const Attempt<A>& a, const Attempt<B>& b) {
    if (a.is_success() && b.is_success()) {
        return std::pair<A, B>(a.value(), b.value());
    }
    if (a.is_failure() && b.is_failure()) {
        return Error::concat(a.error(), b.error());
    }
    return a.is_failure() ? a.error() : b.error();
}

/**
 * @brief Turn a list of attempts into an attempt of a list
 *
 * Every failure is collected into one aggregate.
 */
template<typename T>
Attempt<std::vector<T>> sequence(std::vector<Attempt<T>> attempts) {
    std::vector<T> values;
    std::vector<Error> errors;
    values.reserve(attempts.size());

    for (auto& a : attempts) {
        if (a.is_success()) {
            values.push_back(std::move(a).value());
        } else {
            errors.push_back(std::move(a).error());
        }
    }

    if (!errors.empty()) {
        return Error::aggregate(std::move(errors));
    }
    return values;
}

/**
 * @brief Call func with the value if success, pass the attempt through
 */
template<typename T, typename F>
const Attempt<T>& inspect(const Attempt<T>& attempt, F&& func) {
    if (attempt.is_success()) {
        func(attempt.value());
    }
    return attempt;
}

/**
 * @brief Call func with the error if failure, pass the attempt through
 */
template<typename T, typename F>
const Attempt<T>& inspect_error(const Attempt<T>& attempt, F&& func) {
    if (attempt.is_failure()) {
        func(attempt.error());
    }
    return attempt;
}

/**
 * @brief Whether the attempt failed with the given kind
 */
template<typename T>
bool failed_with(const Attempt<T>& attempt, ErrorKind kind) noexcept {
    return attempt.is_failure() && attempt.kind() == kind;
}

}  // namespace configs::common
