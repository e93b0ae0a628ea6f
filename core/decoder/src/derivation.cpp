#include <configs/decoder/derivation.hpp>

#include <configs/common/debug.hpp>

#include <algorithm>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace configs::decoder::detail {

using common::debug::category::DERIVE;

ProbeTable build_probe_table(std::string_view owner, const std::vector<std::string>& names) {
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i].empty()) {
            throw std::invalid_argument(std::string(owner) + ": field " + std::to_string(i) +
                                        " has an empty name");
        }
        for (size_t j = 0; j < i; ++j) {
            if (names[i] == names[j]) {
                throw std::invalid_argument(std::string(owner) + ": duplicate field name '" +
                                            names[i] + "'");
            }
        }
    }

    ProbeTable table;
    table.reserve(names.size());
    for (const auto& name : names) {
        table.push_back(naming::probe_list(name));
    }

    auto removed = naming::remove_collisions(table);
    if (!removed.empty()) {
        CONFIGS_LOG_DEBUG(DERIVE, owner << ": " << removed.size()
                                        << " colliding spelling(s) dropped, first '"
                                        << removed.front() << "'");
    }
    return table;
}

std::vector<size_t> order_by_arity(const std::vector<size_t>& arities) {
    std::vector<size_t> order(arities.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return arities[a] > arities[b]; });
    return order;
}

Error select_candidate_failure(std::vector<Error> errors, const std::vector<size_t>& arities) {
    if (errors.empty()) {
        throw std::invalid_argument("select_candidate_failure requires at least one error");
    }

    size_t chosen    = 0;
    bool all_missing = std::all_of(errors.begin(), errors.end(), [](const Error& e) {
        return e.kind() == ErrorKind::MISSING;
    });
    if (all_missing) {
        for (size_t i = 1; i < errors.size(); ++i) {
            if (arities[i] > arities[chosen]) {
                chosen = i;
            }
        }
    }

    Error surfaced = errors[chosen];
    surfaced.with_context("candidate", std::to_string(chosen));
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i != chosen) {
            surfaced.with_suppressed(std::move(errors[i]));
        }
    }
    return surfaced;
}

std::optional<Error> check_unknown_keys(const ConfigNode& object, std::string_view path,
                                        std::string_view owner, const ProbeTable& probes,
                                        const std::vector<std::string>& names) {
    std::vector<Error> unknown;
    for (const auto& [key, _] : object.fields()) {
        bool claimed = std::any_of(probes.begin(), probes.end(), [&](const auto& list) {
            return std::find(list.begin(), list.end(), key) != list.end();
        });
        if (claimed) {
            continue;
        }

        // A spelling dropped by collision removal still belongs to its fields
        std::vector<std::string> owners;
        for (const auto& name : names) {
            auto spellings = naming::probe_list(name);
            if (std::find(spellings.begin(), spellings.end(), key) != spellings.end()) {
                owners.push_back(name);
            }
        }
        if (owners.size() > 1) {
            std::string message = "'" + key + "' is a spelling of several properties of " +
                                  std::string(owner) + ", use an exact name:";
            for (const auto& name : owners) {
                message += ' ';
                message += name;
            }
            unknown.push_back(Error::missing(join_path(path, key), std::move(message)));
        } else {
            unknown.push_back(Error::bad_path(join_path(path, key), "'" + key +
                                                                     "' is not a property of " +
                                                                     std::string(owner)));
        }
    }
    if (unknown.empty()) {
        return std::nullopt;
    }
    return Error::aggregate(std::move(unknown));
}

Error missing_field(std::string_view path, std::string_view name) {
    return Error::missing(join_path(path, name),
                          "No configuration setting found for key '" + std::string(name) + "'");
}

void log_product_built(std::string_view type_name, const std::vector<size_t>& arities) {
    if (!CONFIGS_LOG_ENABLED(DEBUG, DERIVE)) {
        return;
    }
    std::ostringstream shape;
    for (size_t i = 0; i < arities.size(); ++i) {
        shape << (i == 0 ? "" : ", ") << arities[i];
    }
    CONFIGS_LOG_DEBUG(DERIVE, "Built decoder for " << type_name << ": " << arities.size()
                                                   << " candidate(s), arities [" << shape.str()
                                                   << "]");
}

void log_bean_built(std::string_view type_name, size_t property_count) {
    CONFIGS_LOG_DEBUG(DERIVE, "Built bean decoder for " << type_name << " with " << property_count
                                                        << " properties");
}

}  // namespace configs::decoder::detail
