/**
 * @file tree_loader.cpp
 * @brief yaml-cpp / jsoncpp adapter producing ConfigNode trees
 */

#include <configs/loader/tree_loader.hpp>

#include <configs/common/debug.hpp>
#include <configs/decoder/primitives.hpp>

#include <yaml-cpp/yaml.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace configs::loader {

using common::debug::category::LOADER;
using decoder::NodeType;

// ============================================================================
// FORMAT DETECTION
// ============================================================================

TreeFormat TreeLoader::detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".yaml" || ext == ".yml") {
        return TreeFormat::YAML;
    } else if (ext == ".json") {
        return TreeFormat::JSON;
    }

    return TreeFormat::YAML;  // Default to YAML
}

TreeFormat TreeLoader::detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos >= content.size()) {
        return TreeFormat::YAML;
    }

    // JSON starts with { or [
    if (content[pos] == '{' || content[pos] == '[') {
        return TreeFormat::JSON;
    }

    return TreeFormat::YAML;
}

namespace {

// ============================================================================
// TREE BUILDING
// ============================================================================

/**
 * @brief Insert value at key, expanding dotted keys and merging objects
 */
void insert_member(ConfigNode::Object& fields, const std::string& key, ConfigNode value,
                   bool expand);

ConfigNode merge(const ConfigNode& existing, ConfigNode incoming, const std::string& key) {
    if (existing.is_object() && incoming.is_object()) {
        ConfigNode::Object merged = existing.fields();
        for (const auto& [k, v] : incoming.fields()) {
            insert_member(merged, k, v, false);
        }
        return ConfigNode::object(std::move(merged));
    }
    CONFIGS_LOG_WARN(LOADER, "Key '" << key << "' defined twice, keeping the last value");
    return incoming;
}

void insert_member(ConfigNode::Object& fields, const std::string& key, ConfigNode value,
                   bool expand) {
    if (expand && key.find('.') != std::string::npos) {
        auto segments = decoder::split_path(key);
        if (segments.is_success() && segments.value().size() > 1) {
            const auto& parts = segments.value();
            // Build {b: {c: value}} for "a.b.c", then insert under "a"
            ConfigNode nested = std::move(value);
            for (size_t i = parts.size() - 1; i > 0; --i) {
                nested = ConfigNode::at_key(parts[i], std::move(nested));
            }
            insert_member(fields, parts.front(), std::move(nested), false);
            return;
        }
    }

    auto it = fields.find(key);
    if (it == fields.end()) {
        fields.emplace(key, std::move(value));
    } else {
        it->second = merge(it->second, std::move(value), key);
    }
}

bool has_digit(std::string_view text) noexcept {
    return std::any_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

ConfigNode typed_scalar(const std::string& text) {
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return ConfigNode::null();
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return ConfigNode::boolean(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return ConfigNode::boolean(false);
    }
    if (has_digit(text)) {
        if (auto i = decoder::conversion::parse_int64(text)) {
            return ConfigNode::integer(*i);
        }
        if (auto d = decoder::conversion::parse_double(text);
            d && text.find_first_of(".eE") != std::string::npos) {
            return ConfigNode::number(*d);
        }
    }
    return ConfigNode::string(text);
}

ConfigNode from_yaml(const YAML::Node& node, const LoaderOptions& options) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return ConfigNode::null();

        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            // Quoted scalars carry the non-specific "!" tag
            if (node.Tag() == "!" || !options.infer_scalar_types) {
                return ConfigNode::string(text);
            }
            return typed_scalar(text);
        }

        case YAML::NodeType::Sequence: {
            ConfigNode::Sequence items;
            items.reserve(node.size());
            for (const auto& item : node) {
                items.push_back(from_yaml(item, options));
            }
            return ConfigNode::sequence(std::move(items));
        }

        case YAML::NodeType::Map: {
            ConfigNode::Object fields;
            for (const auto& entry : node) {
                const YAML::Node& key_node = entry.first;
                bool quoted_key            = key_node.Tag() == "!";
                insert_member(fields, key_node.as<std::string>(), from_yaml(entry.second, options),
                              options.expand_dotted_keys && !quoted_key);
            }
            return ConfigNode::object(std::move(fields));
        }
    }
    return ConfigNode::null();
}

ConfigNode from_json(const Json::Value& value, const LoaderOptions& options) {
    switch (value.type()) {
        case Json::nullValue:
            return ConfigNode::null();
        case Json::booleanValue:
            return ConfigNode::boolean(value.asBool());
        case Json::intValue:
            return ConfigNode::integer(static_cast<int64_t>(value.asInt64()));
        case Json::uintValue:
            if (value.asUInt64() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return ConfigNode::number(value.asDouble());
            }
            return ConfigNode::integer(static_cast<int64_t>(value.asUInt64()));
        case Json::realValue:
            return ConfigNode::number(value.asDouble());
        case Json::stringValue:
            return ConfigNode::string(value.asString());
        case Json::arrayValue: {
            ConfigNode::Sequence items;
            items.reserve(value.size());
            for (const auto& item : value) {
                items.push_back(from_json(item, options));
            }
            return ConfigNode::sequence(std::move(items));
        }
        case Json::objectValue: {
            ConfigNode::Object fields;
            for (const auto& name : value.getMemberNames()) {
                insert_member(fields, name, from_json(value[name], options),
                              options.expand_dotted_keys);
            }
            return ConfigNode::object(std::move(fields));
        }
    }
    return ConfigNode::null();
}

// ============================================================================
// RENDERING
// ============================================================================

void emit_yaml(YAML::Emitter& out, const ConfigNode& node) {
    switch (node.type()) {
        case NodeType::NULL_VALUE:
            out << YAML::Null;
            break;
        case NodeType::BOOLEAN:
        case NodeType::INTEGER:
        case NodeType::DOUBLE:
            out << node.scalar_text();
            break;
        case NodeType::STRING:
            out << YAML::DoubleQuoted << node.as_string();
            break;
        case NodeType::SEQUENCE:
            out << YAML::BeginSeq;
            for (const auto& item : node.items()) {
                emit_yaml(out, item);
            }
            out << YAML::EndSeq;
            break;
        case NodeType::OBJECT:
            out << YAML::BeginMap;
            for (const auto& [key, value] : node.fields()) {
                // Quote keys so that dotted keys are not expanded on reload
                out << YAML::Key << YAML::DoubleQuoted << key;
                out << YAML::Value;
                emit_yaml(out, value);
            }
            out << YAML::EndMap;
            break;
    }
}

Json::Value to_json_value(const ConfigNode& node) {
    switch (node.type()) {
        case NodeType::NULL_VALUE:
            return Json::Value(Json::nullValue);
        case NodeType::BOOLEAN:
            return Json::Value(node.as_bool());
        case NodeType::INTEGER:
            return Json::Value(static_cast<Json::Int64>(node.as_int()));
        case NodeType::DOUBLE:
            return Json::Value(node.as_double());
        case NodeType::STRING:
            return Json::Value(node.as_string());
        case NodeType::SEQUENCE: {
            Json::Value array(Json::arrayValue);
            for (const auto& item : node.items()) {
                array.append(to_json_value(item));
            }
            return array;
        }
        case NodeType::OBJECT: {
            Json::Value object(Json::objectValue);
            for (const auto& [key, value] : node.fields()) {
                object[key] = to_json_value(value);
            }
            return object;
        }
    }
    return Json::Value(Json::nullValue);
}

// ============================================================================
// IMPLEMENTATION
// ============================================================================

class TreeLoaderImpl : public TreeLoader {
public:
    explicit TreeLoaderImpl(LoaderOptions options) : options_(options) {}

    Attempt<ConfigNode> parse(std::string_view content, TreeFormat format) override {
        if (format == TreeFormat::AUTO) {
            format = detect_format_from_content(content);
        }

        try {
            if (format == TreeFormat::JSON) {
                Json::Value root;
                Json::CharReaderBuilder builder;
                std::string errors;
                std::istringstream stream{std::string{content}};

                if (!Json::parseFromStream(builder, stream, &root, &errors)) {
                    return Error::bad_value("", "JSON parse error: " + errors);
                }
                return finish(from_json(root, options_), "JSON");
            }

            YAML::Node root = YAML::Load(std::string(content));
            return finish(from_yaml(root, options_), "YAML");
        } catch (const YAML::Exception& e) {
            return Error::bad_value("", std::string("YAML parse error: ") + e.what());
        } catch (const Json::Exception& e) {
            return Error::bad_value("", std::string("JSON parse error: ") + e.what());
        }
    }

    Attempt<ConfigNode> load(const std::filesystem::path& path, TreeFormat format) override {
        auto content = read_file(path);
        if (content.is_failure()) {
            return std::move(content).error().with_context("file", path.string());
        }

        if (format == TreeFormat::AUTO) {
            format = detect_format(path);
        }
        auto tree = parse(content.value(), format);
        tree.with_context("file", path.string());
        return tree;
    }

    std::string to_yaml(const ConfigNode& tree) override {
        YAML::Emitter out;
        emit_yaml(out, tree);
        return out.c_str();
    }

    std::string to_json(const ConfigNode& tree) override {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, to_json_value(tree));
    }

    const LoaderOptions& options() const noexcept override { return options_; }

private:
    static Attempt<std::string> read_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Error::missing("", "Configuration file not found: " + path.string());
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            return Error::missing("", "Failed to open configuration file: " + path.string());
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    static Attempt<ConfigNode> finish(ConfigNode root, std::string_view format_name) {
        // An empty document is an empty object
        if (root.is_null()) {
            return ConfigNode::object({});
        }
        CONFIGS_LOG_DEBUG(LOADER, "Parsed " << format_name << " document: "
                                            << decoder::type_name(root.type()) << " with "
                                            << root.size() << " entries");
        return root;
    }

    LoaderOptions options_;
};

}  // anonymous namespace

std::unique_ptr<TreeLoader> create_tree_loader(LoaderOptions options) {
    return std::make_unique<TreeLoaderImpl>(options);
}

}  // namespace configs::loader
