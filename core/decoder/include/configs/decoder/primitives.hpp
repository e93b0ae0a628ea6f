#pragma once

/**
 * @file primitives.hpp
 * @brief Decoders for scalars and durations
 *
 * Conversions follow HOCON: a string holding a number decodes as that
 * number, numbers and booleans decode as their text, and
 * true/false/yes/no/on/off decode as booleans. Integers are range checked.
 */

#include <configs/decoder/decoder.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <ratio>
#include <string>
#include <string_view>
#include <type_traits>

namespace configs::decoder {

// ============================================================================
// TEXT CONVERSIONS
// ============================================================================

namespace conversion {

std::optional<bool> parse_boolean(std::string_view text) noexcept;

std::optional<int64_t> parse_int64(std::string_view text) noexcept;

std::optional<uint64_t> parse_uint64(std::string_view text) noexcept;

std::optional<double> parse_double(std::string_view text);

/**
 * @brief Parse a HOCON duration ("10d", "1 second", "500 millis", "3us")
 *
 * A bare number is milliseconds.
 * @return Length in nanoseconds, nullopt if malformed
 */
std::optional<long double> parse_duration_nanos(std::string_view text);

}  // namespace conversion

// ============================================================================
// NODE DECODING
// ============================================================================

Attempt<bool> decode_bool(const ConfigNode& node, std::string_view path);

Attempt<int64_t> decode_int64(const ConfigNode& node, std::string_view path,
                              std::string_view expected);

Attempt<uint64_t> decode_uint64(const ConfigNode& node, std::string_view path,
                                std::string_view expected);

Attempt<double> decode_double(const ConfigNode& node, std::string_view path,
                              std::string_view expected);

Attempt<std::string> decode_string(const ConfigNode& node, std::string_view path);

Attempt<char> decode_char(const ConfigNode& node, std::string_view path);

/**
 * @brief Duration in nanoseconds; numbers are milliseconds
 */
Attempt<long double> decode_duration_nanos(const ConfigNode& node, std::string_view path);

Error out_of_range(std::string_view path, std::string_view expected, std::string_view value);

namespace detail {

template<typename T>
constexpr std::string_view integral_label() noexcept {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1) return "byte";
        else if constexpr (sizeof(T) == 2) return "short";
        else if constexpr (sizeof(T) == 4) return "int";
        else return "long";
    } else {
        if constexpr (sizeof(T) == 1) return "unsigned byte";
        else if constexpr (sizeof(T) == 2) return "unsigned short";
        else if constexpr (sizeof(T) == 4) return "unsigned int";
        else return "unsigned long";
    }
}

/**
 * @brief Build a decoder from a node-level decode function
 */
template<typename T, typename F>
Decoder<T> scalar_decoder(F decode_node) {
    return Decoder<T>([decode_node](const ConfigNode& tree, std::string_view path) -> Attempt<T> {
        auto node = resolve_path(tree, path);
        if (node.is_failure()) {
            return std::move(node).error();
        }
        return decode_node(node.value(), path);
    });
}

/**
 * @brief Whether a finite value survives conversion to Rep
 *
 * Integer bounds are powers of two, so they are exact in long double.
 */
template<typename Rep>
bool representable_as(long double value) noexcept {
    if (!std::isfinite(value)) {
        return false;
    }
    if constexpr (std::is_floating_point_v<Rep>) {
        return std::fabs(value) <= static_cast<long double>(std::numeric_limits<Rep>::max());
    } else {
        const long double upper = std::ldexp(1.0L, std::numeric_limits<Rep>::digits);
        const long double lower = std::is_signed_v<Rep> ? -upper : 0.0L;
        return value > lower - 1.0L && value < upper;
    }
}

}  // namespace detail

// ============================================================================
// REGISTRY ENTRIES
// ============================================================================

template<>
struct DecoderTraits<bool> {
    static Decoder<bool> make() { return detail::scalar_decoder<bool>(&decode_bool); }
};

template<>
struct DecoderTraits<char> {
    static Decoder<char> make() { return detail::scalar_decoder<char>(&decode_char); }
};

template<>
struct DecoderTraits<std::string> {
    static Decoder<std::string> make() {
        return detail::scalar_decoder<std::string>(&decode_string);
    }
};

template<typename T>
struct DecoderTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                         !std::is_same_v<T, char>>> {
    static Decoder<T> make() {
        return detail::scalar_decoder<T>([](const ConfigNode& node,
                                            std::string_view path) -> Attempt<T> {
            constexpr std::string_view label = detail::integral_label<T>();
            if constexpr (std::is_signed_v<T>) {
                auto wide = decode_int64(node, path, label);
                if (wide.is_failure()) {
                    return std::move(wide).error();
                }
                int64_t v = wide.value();
                if (v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                    v > static_cast<int64_t>(std::numeric_limits<T>::max())) {
                    return out_of_range(path, label, std::to_string(v));
                }
                return static_cast<T>(v);
            } else {
                auto wide = decode_uint64(node, path, label);
                if (wide.is_failure()) {
                    return std::move(wide).error();
                }
                uint64_t v = wide.value();
                if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                    return out_of_range(path, label, std::to_string(v));
                }
                return static_cast<T>(v);
            }
        });
    }
};

template<>
struct DecoderTraits<double> {
    static Decoder<double> make() {
        return detail::scalar_decoder<double>([](const ConfigNode& node, std::string_view path) {
            return decode_double(node, path, "double");
        });
    }
};

template<>
struct DecoderTraits<float> {
    static Decoder<float> make() {
        return detail::scalar_decoder<float>([](const ConfigNode& node,
                                                std::string_view path) -> Attempt<float> {
            auto d = decode_double(node, path, "float");
            if (d.is_failure()) {
                return std::move(d).error();
            }
            double v = d.value();
            if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<float>::max()) {
                return out_of_range(path, "float", node.scalar_text());
            }
            return static_cast<float>(v);
        });
    }
};

template<typename Rep, typename Period>
struct DecoderTraits<std::chrono::duration<Rep, Period>> {
    using Target = std::chrono::duration<Rep, Period>;

    static Decoder<Target> make() {
        return detail::scalar_decoder<Target>([](const ConfigNode& node,
                                                 std::string_view path) -> Attempt<Target> {
            auto nanos = decode_duration_nanos(node, path);
            if (nanos.is_failure()) {
                return std::move(nanos).error();
            }
            using Factor = std::ratio_divide<std::nano, Period>;
            long double count = nanos.value() * static_cast<long double>(Factor::num) /
                                static_cast<long double>(Factor::den);
            if (!detail::representable_as<Rep>(count)) {
                return out_of_range(path, "duration", node.scalar_text());
            }
            return Target(static_cast<Rep>(count));
        });
    }
};

}  // namespace configs::decoder
