#pragma once

/**
 * @file decoder.hpp
 * @brief Decoder<T>: the typed view of a configuration tree
 *
 * A Decoder<T> is a pure function (tree, path) -> Attempt<T>. Decoders are
 * immutable after construction, cheap to copy (the function is shared) and
 * safe to invoke from any number of threads at once.
 *
 * Decoders for a type are found through DecoderTraits<T>. Specialize it for
 * your own types:
 * @code
 * template<>
 * struct configs::decoder::DecoderTraits<Endpoint> {
 *     static Decoder<Endpoint> make() {
 *         return ProductDecoderBuilder<Endpoint>("Endpoint")
 *             .primary(constructor<Endpoint>(param<std::string>("host"), param<int>("port")))
 *             .build();
 *     }
 * };
 * @endcode
 */

#include <configs/decoder/config_node.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace configs::decoder {

using common::DecodeException;

/// Synthetic key under which extract() addresses the root
inline constexpr std::string_view EXTRACT_KEY = "configs-extract";

template<typename T>
class Decoder;

namespace detail {

template<typename D>
struct is_decoder : std::false_type {};

template<typename T>
struct is_decoder<Decoder<T>> : std::true_type {};

/**
 * @brief Run a user callback, turning its exceptions into failures
 *
 * DecodeException yields its error, other std::exception yields BadValue
 * at path. std::bad_alloc and exceptions not derived from std::exception
 * are fatal and propagate.
 */
template<typename T, typename F>
Attempt<T> guarded(std::string_view path, F&& func) {
    try {
        return func();
    } catch (const DecodeException& e) {
        return e.error();
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        return Error::bad_value(std::string(path), e.what());
    }
}

/**
 * @brief Decode node as if it were the root, reporting errors under base
 *
 * The node is wrapped in a single-key object so that any decoder can run
 * against it; error paths are rebased from the synthetic key onto base.
 */
template<typename T>
Attempt<T> decode_detached(const Decoder<T>& decoder, const ConfigNode& node,
                           std::string_view base) {
    ConfigNode wrapped = ConfigNode::at_key(std::string(EXTRACT_KEY), node);
    auto result        = decoder.get(wrapped, EXTRACT_KEY);
    if (result.is_failure()) {
        return result.error().rebased(EXTRACT_KEY, base);
    }
    return result;
}

}  // namespace detail

// ============================================================================
// DECODER
// ============================================================================

template<typename T>
class Decoder {
public:
    using value_type = T;
    using Function   = std::function<Attempt<T>(const ConfigNode&, std::string_view)>;

    explicit Decoder(Function func)
        : func_(std::make_shared<const Function>(std::move(func))) {}

    /**
     * @brief Decode the value at path
     */
    Attempt<T> get(const ConfigNode& tree, std::string_view path) const {
        return (*func_)(tree, path);
    }

    /**
     * @brief Decode the root node itself
     *
     * Error paths are reported relative to the root.
     */
    Attempt<T> extract(const ConfigNode& root) const {
        return detail::decode_detached(*this, root, "");
    }

    /**
     * @brief Transform the decoded value
     *
     * Exceptions thrown by func are handled as in from().
     */
    template<typename F>
    auto map(F func) const -> Decoder<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        auto self = *this;
        return Decoder<U>([self, func](const ConfigNode& tree, std::string_view path) -> Attempt<U> {
            auto decoded = self.get(tree, path);
            if (decoded.is_failure()) {
                return std::move(decoded).error();
            }
            return detail::guarded<U>(
                path, [&] { return Attempt<U>(std::invoke(func, decoded.value())); });
        });
    }

    /**
     * @brief Choose the next decoder from the decoded value
     *
     * func(value) returns a Decoder<U> which is applied to the same tree
     * and path.
     */
    template<typename F>
    auto flat_map(F func) const -> std::invoke_result_t<F, const T&> {
        using Next = std::invoke_result_t<F, const T&>;
        static_assert(detail::is_decoder<Next>::value, "flat_map function must return a Decoder");
        using U   = typename Next::value_type;
        auto self = *this;
        return Next([self, func](const ConfigNode& tree, std::string_view path) -> Attempt<U> {
            auto first = self.get(tree, path);
            if (first.is_failure()) {
                return std::move(first).error();
            }
            return func(first.value()).get(tree, path);
        });
    }

    /**
     * @brief Try this decoder, then fallback on failure
     */
    Decoder or_else(Decoder fallback) const {
        auto self = *this;
        return Decoder([self, fallback](const ConfigNode& tree, std::string_view path) {
            return self.get(tree, path).or_else([&] { return fallback.get(tree, path); });
        });
    }

    /**
     * @brief Map every element of a container result
     *
     * Only available when T is a container with push_back.
     */
    template<typename F>
    auto map_each(F func) const {
        using Elem   = typename T::value_type;
        using U      = std::invoke_result_t<F, const Elem&>;
        using Target = typename rebind_container<T, U>::type;
        return map([func](const T& values) {
            Target out;
            for (const auto& v : values) {
                out.push_back(func(v));
            }
            return out;
        });
    }

    // ------------------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------------------

    /**
     * @brief Decoder from func(tree, path) -> T
     */
    template<typename F>
    static Decoder from(F func) {
        return Decoder([func](const ConfigNode& tree, std::string_view path) {
            return detail::guarded<T>(path, [&] { return Attempt<T>(func(tree, path)); });
        });
    }

    /**
     * @brief Decoder from func(tree, path) -> Attempt<T>
     */
    template<typename F>
    static Decoder attempt(F func) {
        return Decoder([func](const ConfigNode& tree, std::string_view path) {
            return detail::guarded<T>(path, [&] { return func(tree, path); });
        });
    }

    /**
     * @brief Decoder from func(object_at_path) -> T
     */
    template<typename F>
    static Decoder on_path(F func) {
        return Decoder([func](const ConfigNode& tree, std::string_view path) -> Attempt<T> {
            auto sub = resolve_path(tree, path).flat_map(
                [&](const ConfigNode& node) { return as_object(node, path); });
            if (sub.is_failure()) {
                return std::move(sub).error();
            }
            return detail::guarded<T>(path, [&] { return Attempt<T>(func(sub.value())); });
        });
    }

    /**
     * @brief Decoder from func(object_at_path) -> Attempt<T>
     */
    template<typename F>
    static Decoder attempt_on_path(F func) {
        return Decoder([func](const ConfigNode& tree, std::string_view path) -> Attempt<T> {
            auto sub = resolve_path(tree, path).flat_map(
                [&](const ConfigNode& node) { return as_object(node, path); });
            if (sub.is_failure()) {
                return std::move(sub).error();
            }
            return detail::guarded<T>(path, [&] { return func(sub.value()); });
        });
    }

    /**
     * @brief Decoder that always yields value
     */
    static Decoder pure(T value) {
        return Decoder([value](const ConfigNode&, std::string_view) { return Attempt<T>(value); });
    }

private:
    template<typename C, typename U>
    struct rebind_container;

    template<template<typename...> class C, typename E, typename... Rest, typename U>
    struct rebind_container<C<E, Rest...>, U> {
        using type = C<U>;
    };

    std::shared_ptr<const Function> func_;
};

// ============================================================================
// TYPE-KEYED REGISTRY
// ============================================================================

/**
 * @brief Customization point: DecoderTraits<T>::make() builds the decoder for T
 *
 * Specializations for scalars live in primitives.hpp, for standard
 * containers and wrappers in containers.hpp.
 */
template<typename T, typename Enable = void>
struct DecoderTraits;

/**
 * @brief The registered decoder for T
 *
 * Built on first use and shared afterwards; initialization is thread-safe
 * and the decoder is immutable once built.
 */
template<typename T>
const Decoder<T>& decoder_of() {
    static const Decoder<T> decoder = DecoderTraits<T>::make();
    return decoder;
}

/**
 * @brief Decoder that looks up the registered decoder for T when first invoked
 *
 * Used by builders and containers so that recursive types do not
 * require their own decoder while it is being built.
 */
template<typename T>
Decoder<T> deferred_decoder_of() {
    return Decoder<T>([](const ConfigNode& tree, std::string_view path) {
        return decoder_of<T>().get(tree, path);
    });
}

}  // namespace configs::decoder
