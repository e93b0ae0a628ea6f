#pragma once

/**
 * @file config_node.hpp
 * @brief Immutable configuration tree and path resolution
 *
 * A ConfigNode is a cheap value handle onto immutable shared storage:
 * copying a node never copies the subtree. Trees are built once (by the
 * loader or by hand in tests) and are then read concurrently.
 *
 * Paths are dotted ("server.http.port"). A segment containing dots or
 * other special characters is written in double quotes
 * ("hosts.\"example.com\".port").
 */

#include <configs/common/error.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace configs::decoder {

using common::Attempt;
using common::Error;
using common::ErrorKind;

/**
 * @brief Node types of a configuration tree
 */
enum class NodeType : uint8_t {
    NULL_VALUE = 0,
    BOOLEAN,
    INTEGER,
    DOUBLE,
    STRING,
    SEQUENCE,
    OBJECT
};

/**
 * @brief Lower-case type name used in WrongType errors
 */
constexpr std::string_view type_name(NodeType type) noexcept {
    switch (type) {
        case NodeType::NULL_VALUE:
            return "null";
        case NodeType::BOOLEAN:
            return "boolean";
        case NodeType::INTEGER:
            return "integer";
        case NodeType::DOUBLE:
            return "double";
        case NodeType::STRING:
            return "string";
        case NodeType::SEQUENCE:
            return "list";
        case NodeType::OBJECT:
            return "object";
        default:
            return "unknown";
    }
}

// ============================================================================
// CONFIG NODE
// ============================================================================

class ConfigNode {
public:
    using Sequence = std::vector<ConfigNode>;
    using Object   = std::map<std::string, ConfigNode, std::less<>>;

    /// Null node
    ConfigNode() noexcept = default;

    // Factories
    static ConfigNode null() noexcept { return ConfigNode(); }
    static ConfigNode boolean(bool value);
    static ConfigNode integer(int64_t value);
    static ConfigNode number(double value);
    static ConfigNode string(std::string value);
    static ConfigNode sequence(Sequence items);
    static ConfigNode object(Object fields);

    /**
     * @brief Single-key object {key: value}
     */
    static ConfigNode at_key(std::string key, ConfigNode value);

    NodeType type() const noexcept;

    bool is_null() const noexcept { return type() == NodeType::NULL_VALUE; }
    bool is_object() const noexcept { return type() == NodeType::OBJECT; }
    bool is_sequence() const noexcept { return type() == NodeType::SEQUENCE; }
    bool is_scalar() const noexcept {
        auto t = type();
        return t != NodeType::SEQUENCE && t != NodeType::OBJECT;
    }

    // Raw accessors. Calling one on a node of another type throws
    // std::bad_variant_access.
    bool as_bool() const;
    int64_t as_int() const;
    double as_double() const;
    const std::string& as_string() const;
    const Sequence& items() const;
    const Object& fields() const;

    /**
     * @brief Member lookup on an object node, nullptr if absent or not an object
     */
    const ConfigNode* find(std::string_view key) const noexcept;

    bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

    /**
     * @brief Keys of an object node in sorted order (empty for other types)
     */
    std::vector<std::string> keys() const;

    /**
     * @brief Number of members/items (0 for scalars)
     */
    size_t size() const noexcept;

    /**
     * @brief Text of a scalar as HOCON renders it ("true", "42", "1.5", "null")
     */
    std::string scalar_text() const;

    friend bool operator==(const ConfigNode& lhs, const ConfigNode& rhs);

private:
    struct Storage;

    explicit ConfigNode(std::shared_ptr<const Storage> storage) noexcept
        : storage_(std::move(storage)) {}

    std::shared_ptr<const Storage> storage_;
};

struct ConfigNode::Storage {
    std::variant<std::monostate, bool, int64_t, double, std::string, Sequence, Object> value;
};

// ============================================================================
// PATHS
// ============================================================================

/**
 * @brief Split a dotted path into its key segments
 *
 * Fails with BadPath on an empty path, an empty segment or an unterminated
 * quote.
 */
Attempt<std::vector<std::string>> split_path(std::string_view path);

/**
 * @brief Append a key to a path, quoting the key when required
 */
std::string join_path(std::string_view base, std::string_view key);

/**
 * @brief Path of the index-th element of the sequence at base ("base[index]")
 */
std::string element_path(std::string_view base, size_t index);

/**
 * @brief Navigate from an object root to the node at path
 *
 * Fails with:
 * - BadPath for a malformed path
 * - WrongType when an intermediate node is not an object
 * - Missing when a key is absent or the value is null
 */
Attempt<ConfigNode> resolve_path(const ConfigNode& tree, std::string_view path);

/**
 * @brief Whether path resolves to a non-null value
 */
bool has_path(const ConfigNode& tree, std::string_view path);

// Node inspection; WrongType naming path on mismatch
Attempt<ConfigNode> as_object(const ConfigNode& node, std::string_view path);
Attempt<ConfigNode> as_sequence(const ConfigNode& node, std::string_view path);
Attempt<ConfigNode> as_scalar(const ConfigNode& node, std::string_view path);

}  // namespace configs::decoder
