#pragma once

/**
 * @file catch_policy.hpp
 * @brief Predicates deciding which failures a wrapper decoder absorbs
 */

#include <configs/common/error.hpp>

#include <functional>

namespace configs::decoder {

using CatchPredicate = std::function<bool(common::ErrorKind)>;

/**
 * @brief Missing, WrongType and BadPath (the default)
 */
inline CatchPredicate recoverable_errors() {
    return [](common::ErrorKind kind) {
        return kind == common::ErrorKind::MISSING || kind == common::ErrorKind::WRONG_TYPE ||
               kind == common::ErrorKind::BAD_PATH;
    };
}

inline CatchPredicate missing_only() {
    return [](common::ErrorKind kind) { return kind == common::ErrorKind::MISSING; };
}

/**
 * @brief Every decode failure, aggregates included
 */
inline CatchPredicate any_error() {
    return [](common::ErrorKind) { return true; };
}

}  // namespace configs::decoder
