#pragma once

/**
 * @file tree_loader.hpp
 * @brief Building ConfigNode trees from YAML and JSON documents
 *
 * Parsing is delegated to yaml-cpp and jsoncpp; this adapter converts
 * their documents into immutable ConfigNode trees and renders trees back
 * to text.
 */

#include <configs/common/error.hpp>
#include <configs/decoder/config_node.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace configs::loader {

using common::Attempt;
using common::Error;
using decoder::ConfigNode;

/**
 * @brief Document formats
 */
enum class TreeFormat {
    AUTO,  // From the file extension or the content
    YAML,
    JSON
};

struct LoaderOptions {
    /// "a.b: 1" becomes {a: {b: 1}}; objects under a common prefix merge
    bool expand_dotted_keys = true;

    /// Plain YAML scalars become booleans, numbers and nulls; quoted
    /// scalars always stay strings
    bool infer_scalar_types = true;
};

/**
 * @brief Interface for configuration tree loading
 */
class TreeLoader {
public:
    virtual ~TreeLoader() = default;

    /**
     * @brief Parse a document
     * @return The tree, or BadValue with the parser message
     */
    virtual Attempt<ConfigNode> parse(std::string_view content,
                                      TreeFormat format = TreeFormat::AUTO) = 0;

    /**
     * @brief Read and parse a file
     * @return The tree, Missing if the file cannot be read, BadValue on a parse error
     */
    virtual Attempt<ConfigNode> load(const std::filesystem::path& path,
                                     TreeFormat format = TreeFormat::AUTO) = 0;

    virtual std::string to_yaml(const ConfigNode& tree) = 0;

    virtual std::string to_json(const ConfigNode& tree) = 0;

    virtual const LoaderOptions& options() const noexcept = 0;

    // Format detection
    static TreeFormat detect_format(const std::filesystem::path& path);
    static TreeFormat detect_format_from_content(std::string_view content);
};

std::unique_ptr<TreeLoader> create_tree_loader(LoaderOptions options = {});

}  // namespace configs::loader
