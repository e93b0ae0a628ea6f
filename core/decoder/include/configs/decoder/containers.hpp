#pragma once

/**
 * @file containers.hpp
 * @brief Sequence, map and wrapper decoders
 *
 * Sequences decode element-wise and stop at the first failing element,
 * whose error path is "base[index]". Maps decode every member value at
 * "base.key". Wrappers (optional, either, attempt, or-default) absorb a
 * failure only when their catch predicate accepts its kind.
 */

#include <configs/decoder/catch_policy.hpp>
#include <configs/decoder/decoder.hpp>
#include <configs/decoder/primitives.hpp>

#include <list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace configs::decoder {

/// Result of an either-style decode: the error or the value
template<typename T>
using Either = std::variant<Error, T>;

// ============================================================================
// SEQUENCES
// ============================================================================

/**
 * @brief Decoder for a sequence container C (vector, list, set...)
 */
template<typename C, typename Elem = typename C::value_type>
Decoder<C> sequence_of(Decoder<Elem> element) {
    return Decoder<C>([element](const ConfigNode& tree, std::string_view path) -> Attempt<C> {
        auto node = resolve_path(tree, path).flat_map(
            [&](const ConfigNode& n) { return as_sequence(n, path); });
        if (node.is_failure()) {
            return std::move(node).error();
        }

        C out;
        const auto& items = node.value().items();
        for (size_t i = 0; i < items.size(); ++i) {
            auto value = detail::decode_detached(element, items[i], element_path(path, i));
            if (value.is_failure()) {
                return std::move(value).error();
            }
            out.insert(out.end(), std::move(value).value());
        }
        return out;
    });
}

template<typename T>
Decoder<std::vector<T>> vector_of(Decoder<T> element) {
    return sequence_of<std::vector<T>>(std::move(element));
}

// ============================================================================
// MAPS
// ============================================================================

/**
 * @brief Decoder for an associative container M keyed by text keys
 *
 * key_decoder receives each raw key as a string node at the key's path;
 * its failure aborts the decode like a value failure.
 */
template<typename M, typename K = typename M::key_type, typename V = typename M::mapped_type>
Decoder<M> map_of(Decoder<K> key_decoder, Decoder<V> value_decoder) {
    return Decoder<M>([key_decoder, value_decoder](const ConfigNode& tree,
                                                   std::string_view path) -> Attempt<M> {
        auto node = resolve_path(tree, path).flat_map(
            [&](const ConfigNode& n) { return as_object(n, path); });
        if (node.is_failure()) {
            return std::move(node).error();
        }

        M out;
        for (const auto& [raw_key, member] : node.value().fields()) {
            std::string member_path = join_path(path, raw_key);

            auto key = detail::decode_detached(key_decoder, ConfigNode::string(raw_key),
                                               member_path);
            if (key.is_failure()) {
                return std::move(key).error();
            }
            auto value = detail::decode_detached(value_decoder, member, member_path);
            if (value.is_failure()) {
                return std::move(value).error();
            }
            out.emplace(std::move(key).value(), std::move(value).value());
        }
        return out;
    });
}

template<typename V>
Decoder<std::map<std::string, V>> map_of(Decoder<V> value_decoder) {
    return map_of<std::map<std::string, V>>(decoder_of<std::string>(), std::move(value_decoder));
}

// ============================================================================
// WRAPPERS
// ============================================================================

/**
 * @brief std::optional<T>: nullopt for absorbed failures
 */
template<typename T>
Decoder<std::optional<T>> optional_of(Decoder<T> inner,
                                      CatchPredicate should_catch = recoverable_errors()) {
    return Decoder<std::optional<T>>(
        [inner, should_catch](const ConfigNode& tree,
                              std::string_view path) -> Attempt<std::optional<T>> {
            auto result = inner.get(tree, path);
            if (result.is_success()) {
                return std::optional<T>(std::move(result).value());
            }
            if (should_catch(result.error().kind())) {
                return std::optional<T>();
            }
            return std::move(result).error();
        });
}

/**
 * @brief Either<T>: the absorbed error as a value
 */
template<typename T>
Decoder<Either<T>> either_of(Decoder<T> inner, CatchPredicate should_catch = recoverable_errors()) {
    return Decoder<Either<T>>(
        [inner, should_catch](const ConfigNode& tree,
                              std::string_view path) -> Attempt<Either<T>> {
            auto result = inner.get(tree, path);
            if (result.is_success()) {
                return Either<T>(std::in_place_index<1>, std::move(result).value());
            }
            if (should_catch(result.error().kind())) {
                return Either<T>(std::in_place_index<0>, std::move(result).error());
            }
            return std::move(result).error();
        });
}

/**
 * @brief Attempt<T> as a decoded value
 */
template<typename T>
Decoder<Attempt<T>> attempt_of(Decoder<T> inner,
                               CatchPredicate should_catch = recoverable_errors()) {
    return Decoder<Attempt<T>>(
        [inner, should_catch](const ConfigNode& tree,
                              std::string_view path) -> Attempt<Attempt<T>> {
            auto result = inner.get(tree, path);
            if (result.is_success() || should_catch(result.error().kind())) {
                return Attempt<Attempt<T>>(std::move(result));
            }
            return std::move(result).error();
        });
}

/**
 * @brief T, or default_value for absorbed failures
 */
template<typename T>
Decoder<T> or_default(Decoder<T> inner, T default_value,
                      CatchPredicate should_catch = recoverable_errors()) {
    return Decoder<T>([inner, default_value, should_catch](const ConfigNode& tree,
                                                           std::string_view path) -> Attempt<T> {
        auto result = inner.get(tree, path);
        if (result.is_failure() && should_catch(result.error().kind())) {
            return default_value;
        }
        return result;
    });
}

// ============================================================================
// REGISTRY ENTRIES
// ============================================================================

template<typename T, typename A>
struct DecoderTraits<std::vector<T, A>> {
    static Decoder<std::vector<T, A>> make() {
        return sequence_of<std::vector<T, A>>(deferred_decoder_of<T>());
    }
};

template<typename T, typename A>
struct DecoderTraits<std::list<T, A>> {
    static Decoder<std::list<T, A>> make() {
        return sequence_of<std::list<T, A>>(deferred_decoder_of<T>());
    }
};

template<typename T, typename C, typename A>
struct DecoderTraits<std::set<T, C, A>> {
    static Decoder<std::set<T, C, A>> make() {
        return sequence_of<std::set<T, C, A>>(deferred_decoder_of<T>());
    }
};

template<typename K, typename V, typename C, typename A>
struct DecoderTraits<std::map<K, V, C, A>> {
    static Decoder<std::map<K, V, C, A>> make() {
        return map_of<std::map<K, V, C, A>>(deferred_decoder_of<K>(), deferred_decoder_of<V>());
    }
};

template<typename K, typename V, typename H, typename E, typename A>
struct DecoderTraits<std::unordered_map<K, V, H, E, A>> {
    static Decoder<std::unordered_map<K, V, H, E, A>> make() {
        return map_of<std::unordered_map<K, V, H, E, A>>(deferred_decoder_of<K>(),
                                                         deferred_decoder_of<V>());
    }
};

template<typename T>
struct DecoderTraits<std::optional<T>> {
    static Decoder<std::optional<T>> make() { return optional_of(deferred_decoder_of<T>()); }
};

template<typename T>
struct DecoderTraits<std::variant<Error, T>> {
    static Decoder<Either<T>> make() { return either_of(deferred_decoder_of<T>()); }
};

template<typename T>
struct DecoderTraits<Attempt<T>> {
    static Decoder<Attempt<T>> make() { return attempt_of(deferred_decoder_of<T>()); }
};

/**
 * @brief A subtree as a ConfigNode; the node must be an object
 */
template<>
struct DecoderTraits<ConfigNode> {
    static Decoder<ConfigNode> make() {
        return Decoder<ConfigNode>([](const ConfigNode& tree, std::string_view path) {
            return resolve_path(tree, path).flat_map(
                [&](const ConfigNode& node) { return as_object(node, path); });
        });
    }
};

}  // namespace configs::decoder
