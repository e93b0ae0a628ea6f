#pragma once

/**
 * @file derivation.hpp
 * @brief Non-template support shared by the product and bean builders
 */

#include <configs/decoder/config_node.hpp>
#include <configs/decoder/naming.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace configs::decoder::detail {

/// Probe lists of the fields of one candidate or bean, in declaration order
using ProbeTable = std::vector<std::vector<std::string>>;

/**
 * @brief Validate field names and compute their collision-free probe lists
 *
 * @param owner  "Type" or "Type#2", for messages and logs
 * @throws std::invalid_argument on an empty or duplicated name
 */
ProbeTable build_probe_table(std::string_view owner, const std::vector<std::string>& names);

/**
 * @brief Attempt order of secondary candidates: descending arity, stable
 */
std::vector<size_t> order_by_arity(const std::vector<size_t>& arities);

/**
 * @brief Choose the error surfaced when every candidate failed
 *
 * errors and arities are in attempt order. The first candidate's error
 * is surfaced, except when it is Missing and so is every other one: then
 * the error of the highest-arity candidate is surfaced. The surfaced error
 * records its candidate index and carries the others as suppressed.
 */
Error select_candidate_failure(std::vector<Error> errors, const std::vector<size_t>& arities);

/**
 * @brief Error for every key of object not claimed by a probe list
 *
 * A key that is a derived spelling of several of names is Missing and
 * lists those fields; any other key is BadPath. Several unknown keys
 * produce an Aggregate.
 */
std::optional<Error> check_unknown_keys(const ConfigNode& object, std::string_view path,
                                        std::string_view owner, const ProbeTable& probes,
                                        const std::vector<std::string>& names);

/**
 * @brief Missing error for an absent field without default
 */
Error missing_field(std::string_view path, std::string_view name);

void log_product_built(std::string_view type_name, const std::vector<size_t>& arities);

void log_bean_built(std::string_view type_name, size_t property_count);

}  // namespace configs::decoder::detail
