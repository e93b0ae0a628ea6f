#include <configs/decoder/config_node.hpp>

#include <array>
#include <charconv>
#include <cmath>

namespace configs::decoder {

// ============================================================================
// ConfigNode Implementation
// ============================================================================

ConfigNode ConfigNode::boolean(bool value) {
    return ConfigNode(std::make_shared<const Storage>(Storage{value}));
}

ConfigNode ConfigNode::integer(int64_t value) {
    return ConfigNode(std::make_shared<const Storage>(Storage{value}));
}

ConfigNode ConfigNode::number(double value) {
    return ConfigNode(std::make_shared<const Storage>(Storage{value}));
}

ConfigNode ConfigNode::string(std::string value) {
    return ConfigNode(std::make_shared<const Storage>(Storage{std::move(value)}));
}

ConfigNode ConfigNode::sequence(Sequence items) {
    return ConfigNode(std::make_shared<const Storage>(Storage{std::move(items)}));
}

ConfigNode ConfigNode::object(Object fields) {
    return ConfigNode(std::make_shared<const Storage>(Storage{std::move(fields)}));
}

ConfigNode ConfigNode::at_key(std::string key, ConfigNode value) {
    Object fields;
    fields.emplace(std::move(key), std::move(value));
    return object(std::move(fields));
}

NodeType ConfigNode::type() const noexcept {
    if (!storage_) {
        return NodeType::NULL_VALUE;
    }
    return static_cast<NodeType>(storage_->value.index());
}

bool ConfigNode::as_bool() const {
    if (!storage_) throw std::bad_variant_access();
    return std::get<bool>(storage_->value);
}

int64_t ConfigNode::as_int() const {
    if (!storage_) throw std::bad_variant_access();
    return std::get<int64_t>(storage_->value);
}

double ConfigNode::as_double() const {
    if (!storage_) throw std::bad_variant_access();
    return std::get<double>(storage_->value);
}

const std::string& ConfigNode::as_string() const {
    if (!storage_) throw std::bad_variant_access();
    return std::get<std::string>(storage_->value);
}

const ConfigNode::Sequence& ConfigNode::items() const {
    if (!storage_) throw std::bad_variant_access();
    return std::get<Sequence>(storage_->value);
}

const ConfigNode::Object& ConfigNode::fields() const {
    if (!storage_) throw std::bad_variant_access();
    return std::get<Object>(storage_->value);
}

const ConfigNode* ConfigNode::find(std::string_view key) const noexcept {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(storage_->value);
    auto it         = obj.find(key);
    return it != obj.end() ? &it->second : nullptr;
}

std::vector<std::string> ConfigNode::keys() const {
    std::vector<std::string> result;
    if (!is_object()) {
        return result;
    }
    const auto& obj = std::get<Object>(storage_->value);
    result.reserve(obj.size());
    for (const auto& [key, _] : obj) {
        result.push_back(key);
    }
    return result;
}

size_t ConfigNode::size() const noexcept {
    switch (type()) {
        case NodeType::SEQUENCE:
            return std::get<Sequence>(storage_->value).size();
        case NodeType::OBJECT:
            return std::get<Object>(storage_->value).size();
        default:
            return 0;
    }
}

std::string ConfigNode::scalar_text() const {
    switch (type()) {
        case NodeType::NULL_VALUE:
            return "null";
        case NodeType::BOOLEAN:
            return as_bool() ? "true" : "false";
        case NodeType::INTEGER:
            return std::to_string(as_int());
        case NodeType::DOUBLE: {
            double d = as_double();
            if (std::isnan(d)) return "NaN";
            if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";

            std::array<char, 64> buf{};
            auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
            std::string text(buf.data(), end);
            if (text.find_first_of(".eE") == std::string::npos) {
                text += ".0";
            }
            return text;
        }
        case NodeType::STRING:
            return as_string();
        default:
            throw std::logic_error("scalar_text() called on a " +
                                   std::string(type_name(type())) + " node");
    }
}

bool operator==(const ConfigNode& lhs, const ConfigNode& rhs) {
    if (lhs.storage_ == rhs.storage_) {
        return true;
    }
    if (lhs.type() != rhs.type()) {
        return false;
    }
    if (lhs.is_null()) {
        return true;
    }
    return lhs.storage_->value == rhs.storage_->value;
}

// ============================================================================
// Paths
// ============================================================================

namespace {

bool needs_quoting(std::string_view key) noexcept {
    if (key.empty()) {
        return true;
    }
    for (char c : key) {
        switch (c) {
            case '.':
            case '"':
            case '[':
            case ']':
            case ' ':
            case '\t':
            case '\n':
            case '$':
            case '{':
            case '}':
            case ':':
            case '=':
            case ',':
            case '#':
                return true;
            default:
                break;
        }
    }
    return false;
}

std::string prefix_of(const std::vector<std::string>& segments, size_t count) {
    std::string path;
    for (size_t i = 0; i < count; ++i) {
        path = join_path(path, segments[i]);
    }
    return path;
}

}  // anonymous namespace

Attempt<std::vector<std::string>> split_path(std::string_view path) {
    std::string path_str(path);
    if (path.empty()) {
        return Error::bad_path(path_str, "path is empty");
    }

    std::vector<std::string> segments;
    std::string current;
    bool quoted_segment = false;
    size_t i            = 0;

    while (i < path.size()) {
        char c = path[i];
        if (c == '"') {
            size_t close = path.find('"', i + 1);
            if (close == std::string_view::npos) {
                return Error::bad_path(path_str, "unterminated quote in path");
            }
            current.append(path.substr(i + 1, close - i - 1));
            quoted_segment = true;
            i              = close + 1;
        } else if (c == '.') {
            if (current.empty() && !quoted_segment) {
                return Error::bad_path(path_str, "path has an empty segment");
            }
            segments.push_back(std::move(current));
            current.clear();
            quoted_segment = false;
            ++i;
        } else {
            current += c;
            ++i;
        }
    }

    if (current.empty() && !quoted_segment) {
        return Error::bad_path(path_str, "path ends with '.'");
    }
    segments.push_back(std::move(current));
    return segments;
}

std::string join_path(std::string_view base, std::string_view key) {
    std::string result;
    result.reserve(base.size() + key.size() + 3);
    if (!base.empty()) {
        result.append(base);
        result += '.';
    }
    if (needs_quoting(key) && key.find('"') == std::string_view::npos) {
        result += '"';
        result.append(key);
        result += '"';
    } else {
        result.append(key);
    }
    return result;
}

std::string element_path(std::string_view base, size_t index) {
    std::string result(base);
    result += '[';
    result += std::to_string(index);
    result += ']';
    return result;
}

Attempt<ConfigNode> resolve_path(const ConfigNode& tree, std::string_view path) {
    auto split = split_path(path);
    if (split.is_failure()) {
        return std::move(split).error();
    }
    const auto& segments = split.value();

    const ConfigNode* current = &tree;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (!current->is_object()) {
            return Error::wrong_type(i == 0 ? std::string("<root>") : prefix_of(segments, i),
                                     "object", std::string(type_name(current->type())));
        }
        const ConfigNode* next = current->find(segments[i]);
        if (next == nullptr || next->is_null()) {
            return Error::missing(std::string(path));
        }
        current = next;
    }
    return *current;
}

bool has_path(const ConfigNode& tree, std::string_view path) {
    return resolve_path(tree, path).is_success();
}

Attempt<ConfigNode> as_object(const ConfigNode& node, std::string_view path) {
    if (!node.is_object()) {
        return Error::wrong_type(std::string(path), "object", std::string(type_name(node.type())));
    }
    return node;
}

Attempt<ConfigNode> as_sequence(const ConfigNode& node, std::string_view path) {
    if (!node.is_sequence()) {
        return Error::wrong_type(std::string(path), "list", std::string(type_name(node.type())));
    }
    return node;
}

Attempt<ConfigNode> as_scalar(const ConfigNode& node, std::string_view path) {
    if (!node.is_scalar()) {
        return Error::wrong_type(std::string(path), "scalar", std::string(type_name(node.type())));
    }
    return node;
}

}  // namespace configs::decoder
