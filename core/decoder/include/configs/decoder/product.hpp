#pragma once

/**
 * @file product.hpp
 * @brief Constructor-based decoder derivation
 *
 * A product type declares one primary and any number of secondary
 * candidates, each a constructor (or factory) with named parameters:
 * @code
 * ProductDecoderBuilder<Person>("Person")
 *     .primary(constructor<Person>(param<std::string>("name"), param<int>("age"),
 *                                  param<std::string>("country").with_default("JPN")))
 *     .secondary(factory<Person>(&Person::from_full_name, param<std::string>("firstName"),
 *                                param<std::string>("lastName")))
 *     .build();
 * @endcode
 *
 * Candidates are tried primary first, then by descending arity. Within a
 * candidate the first failing parameter aborts it; the first candidate
 * whose parameters all resolve is invoked.
 */

#include <configs/decoder/containers.hpp>
#include <configs/decoder/decoder.hpp>
#include <configs/decoder/derivation.hpp>
#include <configs/decoder/naming.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace configs::decoder {

// ============================================================================
// PARAMETERS
// ============================================================================

/**
 * @brief A named constructor parameter
 *
 * Decoded with the registered decoder for T unless with_decoder() is given.
 * The default is used only when no spelling of the name is present.
 */
template<typename T>
class Param {
public:
    explicit Param(std::string name)
        : name_(std::move(name)), decoder_(deferred_decoder_of<T>()) {}

    Param(std::string name, Decoder<T> decoder)
        : name_(std::move(name)), decoder_(std::move(decoder)) {}

    Param with_default(T value) const {
        Param copy(*this);
        copy.default_.emplace(std::move(value));
        return copy;
    }

    Param with_decoder(Decoder<T> decoder) const {
        Param copy(*this);
        copy.decoder_ = std::move(decoder);
        return copy;
    }

    const std::string& name() const noexcept { return name_; }
    bool has_default() const noexcept { return default_.has_value(); }
    const std::optional<T>& default_value() const noexcept { return default_; }
    const Decoder<T>& decoder() const noexcept { return decoder_; }

private:
    std::string name_;
    std::optional<T> default_;
    Decoder<T> decoder_;
};

template<typename T>
Param<T> param(std::string name) {
    return Param<T>(std::move(name));
}

namespace detail {

/**
 * @brief Resolve one field of object at path through its probe list
 */
template<typename A>
Attempt<A> resolve_param(const Param<A>& p, const ConfigNode& object, std::string_view path,
                         const std::vector<std::string>& probes) {
    auto lookup = naming::lookup_key(object, probes);
    switch (lookup.status) {
        case naming::LookupStatus::FOUND:
            return decode_detached(p.decoder(), *object.find(lookup.key),
                                   join_path(path, lookup.key));
        case naming::LookupStatus::AMBIGUOUS:
            return naming::ambiguity_error(path, p.name(), lookup);
        case naming::LookupStatus::ABSENT:
        default:
            if (p.has_default()) {
                return *p.default_value();
            }
            return missing_field(path, p.name());
    }
}

template<typename T, typename Fn, typename... Args, size_t... Is>
Attempt<T> invoke_with_params(const Fn& fn, const std::tuple<Param<Args>...>& params,
                              const ConfigNode& object, std::string_view path,
                              const ProbeTable& probes, std::index_sequence<Is...>) {
    std::tuple<std::optional<Args>...> values;
    std::optional<Error> failure;

    auto step = [&](auto index) -> bool {
        constexpr size_t I = decltype(index)::value;
        auto resolved      = resolve_param(std::get<I>(params), object, path, probes[I]);
        if (resolved.is_failure()) {
            failure.emplace(std::move(resolved).error());
            return false;
        }
        std::get<I>(values).emplace(std::move(resolved).value());
        return true;
    };

    // Left to right, stopping at the first failure
    bool complete = (step(std::integral_constant<size_t, Is>{}) && ...);
    if (!complete) {
        return std::move(*failure);
    }

    return guarded<T>(path, [&]() -> Attempt<T> {
        return std::invoke(fn, std::move(*std::get<Is>(values))...);
    });
}

}  // namespace detail

// ============================================================================
// CANDIDATES
// ============================================================================

/**
 * @brief One way of building T from named fields
 */
template<typename T>
class Candidate {
public:
    using Invoker = std::function<Attempt<T>(const ConfigNode& object, std::string_view path,
                                             const detail::ProbeTable& probes)>;

    Candidate(std::vector<std::string> names, Invoker invoker)
        : names_(std::move(names)), invoker_(std::move(invoker)) {}

    const std::vector<std::string>& names() const noexcept { return names_; }
    size_t arity() const noexcept { return names_.size(); }

    Attempt<T> invoke(const ConfigNode& object, std::string_view path,
                      const detail::ProbeTable& probes) const {
        return invoker_(object, path, probes);
    }

private:
    std::vector<std::string> names_;
    Invoker invoker_;
};

/**
 * @brief Candidate calling fn(args...), which returns T or Attempt<T>
 */
template<typename T, typename Fn, typename... Args>
Candidate<T> factory(Fn fn, Param<Args>... params) {
    std::vector<std::string> names{params.name()...};
    auto captured = std::make_tuple(std::move(params)...);
    return Candidate<T>(std::move(names),
                        [fn, captured](const ConfigNode& object, std::string_view path,
                                       const detail::ProbeTable& probes) {
                            return detail::invoke_with_params<T>(
                                fn, captured, object, path, probes,
                                std::index_sequence_for<Args...>{});
                        });
}

/**
 * @brief Candidate calling the constructor T(args...)
 */
template<typename T, typename... Args>
Candidate<T> constructor(Param<Args>... params) {
    return factory<T>([](Args... args) { return T(std::move(args)...); }, std::move(params)...);
}

// ============================================================================
// BUILDER
// ============================================================================

template<typename T>
class ProductDecoderBuilder {
public:
    explicit ProductDecoderBuilder(std::string type_name) : type_name_(std::move(type_name)) {}

    /**
     * @throws std::invalid_argument if a primary candidate is already set
     */
    ProductDecoderBuilder& primary(Candidate<T> candidate) {
        if (primary_) {
            throw std::invalid_argument(type_name_ + ": primary candidate already declared");
        }
        primary_.emplace(std::move(candidate));
        return *this;
    }

    ProductDecoderBuilder& secondary(Candidate<T> candidate) {
        secondaries_.push_back(std::move(candidate));
        return *this;
    }

    /**
     * @brief Freeze the candidates into a decoder
     * @throws std::invalid_argument without primary candidate, or on an
     *         empty or duplicated parameter name
     */
    Decoder<T> build() const {
        if (!primary_) {
            throw std::invalid_argument(type_name_ + ": no primary candidate declared");
        }

        std::vector<size_t> secondary_arities;
        for (const auto& c : secondaries_) {
            secondary_arities.push_back(c.arity());
        }

        auto prepared = std::make_shared<Prepared>();
        prepared->candidates.push_back(*primary_);
        for (size_t index : detail::order_by_arity(secondary_arities)) {
            prepared->candidates.push_back(secondaries_[index]);
        }

        for (size_t i = 0; i < prepared->candidates.size(); ++i) {
            const auto& c = prepared->candidates[i];
            prepared->probes.push_back(
                detail::build_probe_table(type_name_ + "#" + std::to_string(i), c.names()));
            prepared->arities.push_back(c.arity());
        }

        detail::log_product_built(type_name_, prepared->arities);

        std::shared_ptr<const Prepared> frozen = std::move(prepared);
        return Decoder<T>([frozen](const ConfigNode& tree, std::string_view path) -> Attempt<T> {
            auto object = resolve_path(tree, path).flat_map(
                [&](const ConfigNode& node) { return as_object(node, path); });
            if (object.is_failure()) {
                return std::move(object).error();
            }

            std::vector<Error> errors;
            errors.reserve(frozen->candidates.size());
            for (size_t i = 0; i < frozen->candidates.size(); ++i) {
                auto result = frozen->candidates[i].invoke(object.value(), path, frozen->probes[i]);
                if (result.is_success()) {
                    return result;
                }
                errors.push_back(std::move(result).error());
            }
            return detail::select_candidate_failure(std::move(errors), frozen->arities);
        });
    }

private:
    struct Prepared {
        std::vector<Candidate<T>> candidates;
        std::vector<detail::ProbeTable> probes;
        std::vector<size_t> arities;
    };

    std::string type_name_;
    std::optional<Candidate<T>> primary_;
    std::vector<Candidate<T>> secondaries_;
};

}  // namespace configs::decoder
