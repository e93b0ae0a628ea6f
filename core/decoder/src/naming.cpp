#include <configs/decoder/naming.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace configs::decoder::naming {

namespace {

bool is_upper(char c) noexcept {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool is_lower(char c) noexcept {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) noexcept {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

char to_lower(char c) noexcept {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

char to_upper(char c) noexcept {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

std::string join(const std::vector<std::string>& words, char separator, bool upper) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) {
            out += separator;
        }
        for (char c : w) {
            out += upper ? to_upper(c) : c;
        }
    }
    return out;
}

std::string camel(const std::vector<std::string>& words, bool capitalize_first) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        std::string w = words[i];
        if ((i > 0 || capitalize_first) && !w.empty()) {
            w[0] = to_upper(w[0]);
        }
        out += w;
    }
    return out;
}

}  // anonymous namespace

std::vector<std::string> split_words(std::string_view identifier) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&] {
        if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    };

    for (size_t i = 0; i < identifier.size(); ++i) {
        char c = identifier[i];
        if (c == '_' || c == '-') {
            flush();
            continue;
        }
        if (is_upper(c) && !current.empty()) {
            char prev       = identifier[i - 1];
            bool next_lower = i + 1 < identifier.size() && is_lower(identifier[i + 1]);
            // fooBar, v2Api, and the last capital of HTTPServer
            if (is_lower(prev) || is_digit(prev) || (is_upper(prev) && next_lower)) {
                flush();
            }
        }
        current += to_lower(c);
    }
    flush();
    return words;
}

std::string to_lower_hyphen(std::string_view identifier) {
    return join(split_words(identifier), '-', false);
}

std::string to_lower_camel(std::string_view identifier) {
    return camel(split_words(identifier), false);
}

std::string to_upper_camel(std::string_view identifier) {
    return camel(split_words(identifier), true);
}

std::string to_lower_snake(std::string_view identifier) {
    return join(split_words(identifier), '_', false);
}

std::string to_upper_snake(std::string_view identifier) {
    return join(split_words(identifier), '_', true);
}

std::vector<std::string> probe_list(std::string_view identifier) {
    if (identifier.empty()) {
        throw std::invalid_argument("identifier must not be empty");
    }

    std::vector<std::string> probes;
    probes.reserve(6);

    auto add = [&](std::string spelling) {
        if (spelling.empty()) {
            return;
        }
        if (std::find(probes.begin(), probes.end(), spelling) == probes.end()) {
            probes.push_back(std::move(spelling));
        }
    };

    add(std::string(identifier));
    add(to_lower_hyphen(identifier));
    add(to_lower_camel(identifier));
    add(to_upper_camel(identifier));
    add(to_lower_snake(identifier));
    add(to_upper_snake(identifier));
    return probes;
}

std::vector<std::string> remove_collisions(std::vector<std::vector<std::string>>& lists) {
    // Decide against the unmodified lists, then erase
    std::vector<std::vector<bool>> drop(lists.size());
    std::vector<std::string> removed;

    for (size_t i = 0; i < lists.size(); ++i) {
        drop[i].assign(lists[i].size(), false);
        for (size_t k = 1; k < lists[i].size(); ++k) {
            const auto& spelling = lists[i][k];
            for (size_t j = 0; j < lists.size(); ++j) {
                if (j == i) continue;
                if (std::find(lists[j].begin(), lists[j].end(), spelling) != lists[j].end()) {
                    drop[i][k] = true;
                    break;
                }
            }
        }
    }

    for (size_t i = 0; i < lists.size(); ++i) {
        std::vector<std::string> kept;
        kept.reserve(lists[i].size());
        for (size_t k = 0; k < lists[i].size(); ++k) {
            if (drop[i][k]) {
                if (std::find(removed.begin(), removed.end(), lists[i][k]) == removed.end()) {
                    removed.push_back(lists[i][k]);
                }
            } else {
                kept.push_back(std::move(lists[i][k]));
            }
        }
        lists[i] = std::move(kept);
    }
    return removed;
}

KeyLookup lookup_key(const ConfigNode& object, const std::vector<std::string>& probes) {
    KeyLookup result;
    if (probes.empty()) {
        return result;
    }

    auto present = [&](const std::string& key) {
        const ConfigNode* node = object.find(key);
        return node != nullptr && !node->is_null();
    };

    if (present(probes.front())) {
        result.status = LookupStatus::FOUND;
        result.key    = probes.front();
        return result;
    }

    std::vector<std::string> found;
    for (size_t i = 1; i < probes.size(); ++i) {
        if (present(probes[i])) {
            found.push_back(probes[i]);
        }
    }

    if (found.size() == 1) {
        result.status = LookupStatus::FOUND;
        result.key    = std::move(found.front());
    } else if (found.size() > 1) {
        result.status    = LookupStatus::AMBIGUOUS;
        result.conflicts = std::move(found);
    }
    return result;
}

Error ambiguity_error(std::string_view path, std::string_view identifier,
                      const KeyLookup& lookup) {
    std::string message = "ambiguous keys for '" + std::string(identifier) + "' (canonical '" +
                          to_lower_hyphen(identifier) + "'):";
    for (const auto& key : lookup.conflicts) {
        message += ' ';
        message += key;
    }
    return Error::missing(join_path(path, identifier), std::move(message));
}

}  // namespace configs::decoder::naming
