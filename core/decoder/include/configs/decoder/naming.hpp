#pragma once

/**
 * @file naming.hpp
 * @brief Matching declared identifiers against configuration keys
 *
 * A declared identifier is looked up under a probe list of spellings, in
 * priority order:
 *   exact, lower-hyphen, lowerCamel, UpperCamel, lower_snake, UPPER_SNAKE
 * with duplicates removed. lower-hyphen is the canonical on-disk form.
 *
 * Word segmentation splits at '_' and '-', at lower-to-upper and
 * digit-to-upper boundaries, and before the last capital of an upper-case
 * run followed by a lower-case letter ("UPPERThenCamel" -> upper, then,
 * camel).
 */

#include <configs/decoder/config_node.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace configs::decoder::naming {

/**
 * @brief Lower-cased words of an identifier
 */
std::vector<std::string> split_words(std::string_view identifier);

std::string to_lower_hyphen(std::string_view identifier);
std::string to_lower_camel(std::string_view identifier);
std::string to_upper_camel(std::string_view identifier);
std::string to_lower_snake(std::string_view identifier);
std::string to_upper_snake(std::string_view identifier);

/**
 * @brief Ordered, duplicate-free probe list; front() is the identifier
 * @throws std::invalid_argument for an empty identifier
 */
std::vector<std::string> probe_list(std::string_view identifier);

/**
 * @brief Remove spellings shared between sibling identifiers
 *
 * A derived spelling (any entry but the first) that also appears in a
 * sibling's probe list is removed, so neither field claims it. Exact
 * spellings always stay.
 *
 * @return The removed spellings, for diagnostics
 */
std::vector<std::string> remove_collisions(std::vector<std::vector<std::string>>& lists);

enum class LookupStatus : uint8_t {
    FOUND,
    ABSENT,
    AMBIGUOUS
};

struct KeyLookup {
    LookupStatus status = LookupStatus::ABSENT;
    std::string key;                      ///< Matched key when FOUND
    std::vector<std::string> conflicts;   ///< Present spellings when AMBIGUOUS
};

/**
 * @brief Find the key of object matching a probe list
 *
 * The exact spelling wins when present. Otherwise exactly one present
 * spelling is a match, several are ambiguous. Null values count as absent.
 */
KeyLookup lookup_key(const ConfigNode& object, const std::vector<std::string>& probes);

/**
 * @brief Missing error for an ambiguous lookup of identifier at path
 */
Error ambiguity_error(std::string_view path, std::string_view identifier,
                      const KeyLookup& lookup);

}  // namespace configs::decoder::naming
