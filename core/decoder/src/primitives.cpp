#include <configs/decoder/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace configs::decoder {

namespace {

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

Error wrong_type(const ConfigNode& node, std::string_view path, std::string_view expected) {
    return Error::wrong_type(std::string(path), std::string(expected),
                             std::string(type_name(node.type())));
}

struct DurationUnit {
    std::string_view names[5];
    long double nanos;
};

// Units accepted by HOCON duration strings
constexpr DurationUnit DURATION_UNITS[] = {
    {{"ns", "nano", "nanos", "nanosecond", "nanoseconds"}, 1.0L},
    {{"us", "micro", "micros", "microsecond", "microseconds"}, 1.0e3L},
    {{"ms", "milli", "millis", "millisecond", "milliseconds"}, 1.0e6L},
    {{"s", "second", "seconds", "", ""}, 1.0e9L},
    {{"m", "minute", "minutes", "", ""}, 60.0e9L},
    {{"h", "hour", "hours", "", ""}, 3600.0e9L},
    {{"d", "day", "days", "", ""}, 86400.0e9L},
};

std::optional<long double> unit_nanos(std::string_view unit) noexcept {
    if (unit.empty()) {
        return 1.0e6L;
    }
    for (const auto& u : DURATION_UNITS) {
        for (auto name : u.names) {
            if (!name.empty() && name == unit) {
                return u.nanos;
            }
        }
    }
    return std::nullopt;
}

}  // anonymous namespace

// ============================================================================
// Text conversions
// ============================================================================

namespace conversion {

std::optional<bool> parse_boolean(std::string_view text) noexcept {
    text = trim(text);
    if (text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "false" || text == "no" || text == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<int64_t> parse_int64(std::string_view text) noexcept {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> parse_uint64(std::string_view text) noexcept {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_double(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::string buffer(text);
    char* end    = nullptr;
    double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<long double> parse_duration_nanos(std::string_view text) {
    text = trim(text);

    size_t split = 0;
    while (split < text.size()) {
        char c = text[split];
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' ||
            ((c == 'e' || c == 'E') && split > 0 && split + 1 < text.size() &&
             (std::isdigit(static_cast<unsigned char>(text[split + 1])) ||
              text[split + 1] == '-'))) {
            ++split;
        } else {
            break;
        }
    }

    auto number = parse_double(text.substr(0, split));
    if (!number) {
        return std::nullopt;
    }
    auto unit = unit_nanos(trim(text.substr(split)));
    if (!unit) {
        return std::nullopt;
    }
    return static_cast<long double>(*number) * *unit;
}

}  // namespace conversion

// ============================================================================
// Node decoding
// ============================================================================

Error out_of_range(std::string_view path, std::string_view expected, std::string_view value) {
    return Error::wrong_type(std::string(path), std::string(expected),
                             "out-of-range value " + std::string(value));
}

Attempt<bool> decode_bool(const ConfigNode& node, std::string_view path) {
    switch (node.type()) {
        case NodeType::BOOLEAN:
            return node.as_bool();
        case NodeType::STRING:
            if (auto b = conversion::parse_boolean(node.as_string())) {
                return *b;
            }
            return Error::wrong_type(std::string(path), "boolean",
                                     "string '" + node.as_string() + "'");
        default:
            return wrong_type(node, path, "boolean");
    }
}

Attempt<int64_t> decode_int64(const ConfigNode& node, std::string_view path,
                              std::string_view expected) {
    switch (node.type()) {
        case NodeType::INTEGER:
            return node.as_int();
        case NodeType::DOUBLE: {
            double d = node.as_double();
            if (std::trunc(d) != d) {
                return Error::wrong_type(std::string(path), std::string(expected),
                                         "double " + node.scalar_text());
            }
            if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
                return out_of_range(path, expected, node.scalar_text());
            }
            return static_cast<int64_t>(d);
        }
        case NodeType::STRING: {
            const auto& text = node.as_string();
            if (auto v = conversion::parse_int64(text)) {
                return *v;
            }
            // "1e3" or "12.0" are whole numbers too
            if (auto d = conversion::parse_double(text); d && std::trunc(*d) == *d &&
                                                         *d >= -9223372036854775808.0 &&
                                                         *d < 9223372036854775808.0) {
                return static_cast<int64_t>(*d);
            }
            return Error::wrong_type(std::string(path), std::string(expected),
                                     "string '" + text + "'");
        }
        default:
            return wrong_type(node, path, expected);
    }
}

Attempt<uint64_t> decode_uint64(const ConfigNode& node, std::string_view path,
                                std::string_view expected) {
    if (node.type() == NodeType::STRING) {
        if (auto v = conversion::parse_uint64(node.as_string())) {
            return *v;
        }
    }
    auto wide = decode_int64(node, path, expected);
    if (wide.is_failure()) {
        return std::move(wide).error();
    }
    if (wide.value() < 0) {
        return out_of_range(path, expected, std::to_string(wide.value()));
    }
    return static_cast<uint64_t>(wide.value());
}

Attempt<double> decode_double(const ConfigNode& node, std::string_view path,
                              std::string_view expected) {
    switch (node.type()) {
        case NodeType::INTEGER:
            return static_cast<double>(node.as_int());
        case NodeType::DOUBLE:
            return node.as_double();
        case NodeType::STRING:
            if (auto d = conversion::parse_double(node.as_string())) {
                return *d;
            }
            return Error::wrong_type(std::string(path), std::string(expected),
                                     "string '" + node.as_string() + "'");
        default:
            return wrong_type(node, path, expected);
    }
}

Attempt<std::string> decode_string(const ConfigNode& node, std::string_view path) {
    switch (node.type()) {
        case NodeType::STRING:
            return node.as_string();
        case NodeType::BOOLEAN:
        case NodeType::INTEGER:
        case NodeType::DOUBLE:
            return node.scalar_text();
        default:
            return wrong_type(node, path, "string");
    }
}

Attempt<char> decode_char(const ConfigNode& node, std::string_view path) {
    auto text = decode_string(node, path);
    if (text.is_failure()) {
        return Error::wrong_type(std::string(path), "char", std::string(type_name(node.type())));
    }
    if (text.value().size() != 1) {
        return Error::wrong_type(std::string(path), "char",
                                 "string of length " + std::to_string(text.value().size()));
    }
    return text.value().front();
}

Attempt<long double> decode_duration_nanos(const ConfigNode& node, std::string_view path) {
    switch (node.type()) {
        case NodeType::INTEGER:
            return static_cast<long double>(node.as_int()) * 1.0e6L;
        case NodeType::DOUBLE:
            return static_cast<long double>(node.as_double()) * 1.0e6L;
        case NodeType::STRING:
            if (auto nanos = conversion::parse_duration_nanos(node.as_string())) {
                return *nanos;
            }
            return Error::bad_value(std::string(path),
                                    "could not parse duration '" + node.as_string() + "'");
        default:
            return wrong_type(node, path, "duration");
    }
}

}  // namespace configs::decoder
