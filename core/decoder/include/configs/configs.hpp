#pragma once

/**
 * @file configs.hpp
 * @brief Umbrella header and convenience entry points
 *
 * @code
 * auto port    = configs::get<int>(tree, "server.port");
 * auto timeout = configs::get_or_else<std::chrono::milliseconds>(tree, "server.timeout",
 *                                                               std::chrono::seconds(5));
 * auto server  = configs::extract<Server>(tree.fields().at("server"));
 * @endcode
 */

#include <configs/common/attempt_ext.hpp>
#include <configs/common/error.hpp>
#include <configs/decoder/bean.hpp>
#include <configs/decoder/catch_policy.hpp>
#include <configs/decoder/config_node.hpp>
#include <configs/decoder/containers.hpp>
#include <configs/decoder/decoder.hpp>
#include <configs/decoder/naming.hpp>
#include <configs/decoder/primitives.hpp>
#include <configs/decoder/product.hpp>

#include <optional>
#include <string_view>

namespace configs {

using common::Attempt;
using common::DecodeException;
using common::Error;
using common::ErrorKind;
using decoder::ConfigNode;
using decoder::Decoder;
using decoder::Either;

/**
 * @brief Decode the value at path with the registered decoder for T
 */
template<typename T>
Attempt<T> get(const ConfigNode& tree, std::string_view path) {
    return decoder::decoder_of<T>().get(tree, path);
}

/**
 * @brief Decode the whole tree as a T
 */
template<typename T>
Attempt<T> extract(const ConfigNode& tree) {
    return decoder::decoder_of<T>().extract(tree);
}

/**
 * @brief nullopt when the failure is accepted by should_catch
 */
template<typename T>
Attempt<std::optional<T>> opt(const ConfigNode& tree, std::string_view path,
                              decoder::CatchPredicate should_catch = decoder::recoverable_errors()) {
    return decoder::optional_of(decoder::decoder_of<T>(), std::move(should_catch)).get(tree, path);
}

/**
 * @brief The accepted failure as the left alternative
 */
template<typename T>
Attempt<Either<T>> either(const ConfigNode& tree, std::string_view path,
                          decoder::CatchPredicate should_catch = decoder::recoverable_errors()) {
    return decoder::either_of(decoder::decoder_of<T>(), std::move(should_catch)).get(tree, path);
}

/**
 * @brief default_value when the failure is accepted by should_catch
 */
template<typename T>
Attempt<T> get_or_else(const ConfigNode& tree, std::string_view path, T default_value,
                       decoder::CatchPredicate should_catch = decoder::recoverable_errors()) {
    return decoder::or_default(decoder::decoder_of<T>(), std::move(default_value),
                               std::move(should_catch))
        .get(tree, path);
}

}  // namespace configs
