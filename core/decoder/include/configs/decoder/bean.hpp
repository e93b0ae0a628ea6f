#pragma once

/**
 * @file bean.hpp
 * @brief Property-based (bean style) decoder derivation
 *
 * A bean is default-constructed (or made by a factory) on every decode and
 * then populated property by property. Absent keys leave the default value
 * untouched; keys that match no property are rejected with BadPath.
 * @code
 * BeanDecoderBuilder<Server>("Server")
 *     .property("host", &Server::host)
 *     .property("port", &Server::set_port)
 *     .build();
 * @endcode
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
#include <type_traits>
#include <utility>
#include <vector>

namespace configs::decoder {

template<typename T>
class BeanDecoderBuilder {
public:
    using Factory       = std::function<T()>;
    using SharedFactory = std::function<std::shared_ptr<T>()>;

    /**
     * @brief Beans made by value-initialization, T{}
     */
    explicit BeanDecoderBuilder(std::string type_name) : type_name_(std::move(type_name)) {
        static_assert(std::is_default_constructible_v<T>,
                      "bean type needs a default constructor or a factory");
        factory_ = [] { return T{}; };
    }

    /**
     * @brief Beans made by factory(), called once per decode
     */
    BeanDecoderBuilder(std::string type_name, Factory factory)
        : type_name_(std::move(type_name)), factory_(std::move(factory)) {}

    // Data member, registered decoder
    template<typename V>
    BeanDecoderBuilder& property(std::string name, V T::*member) {
        return property(std::move(name), member, deferred_decoder_of<V>());
    }

    // Data member, explicit decoder
    template<typename V>
    BeanDecoderBuilder& property(std::string name, V T::*member, Decoder<V> decoder) {
        return add(std::move(name), std::move(decoder),
                   [member](T& target, V&& value) { target.*member = std::move(value); });
    }

    // Setter taking the value
    template<typename V>
    BeanDecoderBuilder& property(std::string name, void (T::*setter)(V)) {
        return add(std::move(name), deferred_decoder_of<V>(),
                   [setter](T& target, V&& value) { (target.*setter)(std::move(value)); });
    }

    // Setter taking a const reference
    template<typename V>
    BeanDecoderBuilder& property(std::string name, void (T::*setter)(const V&)) {
        return add(std::move(name), deferred_decoder_of<V>(),
                   [setter](T& target, V&& value) { (target.*setter)(value); });
    }

    /**
     * @brief Any callable assign(T&, V) with an explicit decoder
     */
    template<typename V, typename Assign>
    BeanDecoderBuilder& property_with(std::string name, Decoder<V> decoder, Assign assign) {
        return add(std::move(name), std::move(decoder),
                   [assign](T& target, V&& value) { assign(target, std::move(value)); });
    }

    /**
     * @brief Decoder producing a fresh T per decode
     * @throws std::invalid_argument on an empty or duplicated property name
     */
    Decoder<T> build() const {
        auto frozen  = freeze();
        auto factory = factory_;
        return Decoder<T>([frozen, factory](const ConfigNode& tree,
                                            std::string_view path) -> Attempt<T> {
            auto object = resolve_path(tree, path).flat_map(
                [&](const ConfigNode& node) { return as_object(node, path); });
            if (object.is_failure()) {
                return std::move(object).error();
            }
            if (auto unknown = detail::check_unknown_keys(object.value(), path, frozen->type_name,
                                                          frozen->probes, frozen->names)) {
                return std::move(*unknown);
            }

            auto instance = detail::guarded<T>(path, [&] { return Attempt<T>(factory()); });
            if (instance.is_failure()) {
                return instance;
            }
            if (auto error = populate(*frozen, instance.value(), object.value(), path)) {
                return std::move(*error);
            }
            return instance;
        });
    }

    /**
     * @brief Decoder producing a fresh, solely owned std::shared_ptr<T>
     *
     * A factory that keeps a reference to the instance it hands out is a
     * programming error: decoding then throws std::logic_error.
     */
    Decoder<std::shared_ptr<T>> build_shared(SharedFactory factory) const {
        auto frozen = freeze();
        return Decoder<std::shared_ptr<T>>(
            [frozen, factory](const ConfigNode& tree,
                              std::string_view path) -> Attempt<std::shared_ptr<T>> {
                auto object = resolve_path(tree, path).flat_map(
                    [&](const ConfigNode& node) { return as_object(node, path); });
                if (object.is_failure()) {
                    return std::move(object).error();
                }
                if (auto unknown = detail::check_unknown_keys(object.value(), path,
                                                              frozen->type_name, frozen->probes,
                                                              frozen->names)) {
                    return std::move(*unknown);
                }

                std::shared_ptr<T> instance = factory();
                if (!instance || instance.use_count() != 1) {
                    throw std::logic_error(frozen->type_name +
                                           ": bean factory must return a new, unshared instance");
                }
                if (auto error = populate(*frozen, *instance, object.value(), path)) {
                    return std::move(*error);
                }
                return instance;
            });
    }

    Decoder<std::shared_ptr<T>> build_shared() const {
        auto factory = factory_;
        return build_shared([factory] { return std::make_shared<T>(factory()); });
    }

private:
    using Assigner = std::function<std::optional<Error>(T& target, const ConfigNode& value,
                                                        std::string_view value_path)>;

    struct Property {
        std::string name;
        Assigner assign;
    };

    struct Frozen {
        std::string type_name;
        std::vector<Property> properties;
        std::vector<std::string> names;
        detail::ProbeTable probes;
    };

    template<typename V, typename Set>
    BeanDecoderBuilder& add(std::string name, Decoder<V> decoder, Set set) {
        Assigner assign = [decoder, set](T& target, const ConfigNode& value,
                                         std::string_view value_path) -> std::optional<Error> {
            auto decoded = detail::decode_detached(decoder, value, value_path);
            if (decoded.is_failure()) {
                return std::move(decoded).error();
            }
            set(target, std::move(decoded).value());
            return std::nullopt;
        };
        properties_.push_back(Property{std::move(name), std::move(assign)});
        return *this;
    }

    std::shared_ptr<const Frozen> freeze() const {
        auto frozen       = std::make_shared<Frozen>();
        frozen->type_name = type_name_;
        frozen->properties = properties_;

        frozen->names.reserve(properties_.size());
        for (const auto& p : properties_) {
            frozen->names.push_back(p.name);
        }
        frozen->probes = detail::build_probe_table(type_name_, frozen->names);

        detail::log_bean_built(type_name_, properties_.size());
        return frozen;
    }

    /**
     * @brief Apply every present property; the first failure aborts
     */
    static std::optional<Error> populate(const Frozen& frozen, T& target,
                                         const ConfigNode& object, std::string_view path) {
        for (size_t i = 0; i < frozen.properties.size(); ++i) {
            const auto& property = frozen.properties[i];
            auto lookup          = naming::lookup_key(object, frozen.probes[i]);
            if (lookup.status == naming::LookupStatus::ABSENT) {
                continue;
            }
            if (lookup.status == naming::LookupStatus::AMBIGUOUS) {
                return naming::ambiguity_error(path, property.name, lookup);
            }
            if (auto error = property.assign(target, *object.find(lookup.key),
                                             join_path(path, lookup.key))) {
                return error;
            }
        }
        return std::nullopt;
    }

    std::string type_name_;
    Factory factory_;
    std::vector<Property> properties_;
};

}  // namespace configs::decoder
