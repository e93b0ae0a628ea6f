#include <configs/common/error.hpp>

#include <sstream>

namespace configs::common {

namespace {

// Replace a leading path segment; nullopt when the path is not under `from`
std::optional<std::string> rebase_path(const std::string& path, std::string_view from,
                                       std::string_view to) {
    if (path.compare(0, from.size(), from) != 0) {
        return std::nullopt;
    }
    if (path.size() == from.size()) {
        return std::string(to);
    }
    char next = path[from.size()];
    if (next == '[') {
        return std::string(to) + path.substr(from.size());
    }
    if (next == '.') {
        // "from.rest" rebased to the root is just "rest"
        if (to.empty()) {
            return path.substr(from.size() + 1);
        }
        return std::string(to) + path.substr(from.size());
    }
    return std::nullopt;
}

void append_indented(std::ostringstream& oss, const std::string& text, std::string_view indent) {
    std::istringstream lines(text);
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (!first) {
            oss << '\n' << indent;
        }
        oss << line;
        first = false;
    }
}

}  // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Error::Error(ErrorKind kind, std::string path, std::string message, SourceLocation loc)
    : kind_(kind), path_(std::move(path)), message_(std::move(message)), location_(loc) {}

Error Error::missing(std::string path, std::string message, SourceLocation loc) {
    if (message.empty()) {
        message = "No configuration setting found";
    }
    return Error(ErrorKind::MISSING, std::move(path), std::move(message), loc);
}

Error Error::wrong_type(std::string path, std::string expected, std::string actual,
                        SourceLocation loc) {
    std::string message = "expected " + expected + ", found " + actual;
    Error error(ErrorKind::WRONG_TYPE, std::move(path), std::move(message), loc);
    error.expected_ = std::move(expected);
    error.actual_   = std::move(actual);
    return error;
}

Error Error::bad_path(std::string path, std::string reason, SourceLocation loc) {
    return Error(ErrorKind::BAD_PATH, std::move(path), std::move(reason), loc);
}

Error Error::bad_value(std::string path, std::string reason, SourceLocation loc) {
    return Error(ErrorKind::BAD_VALUE, std::move(path), std::move(reason), loc);
}

Error Error::aggregate(std::vector<Error> errors) {
    if (errors.empty()) {
        throw std::invalid_argument("Error::aggregate requires at least one error");
    }
    if (errors.size() == 1) {
        return std::move(errors.front());
    }

    std::vector<Error> flat;
    flat.reserve(errors.size());
    for (auto& e : errors) {
        if (e.kind_ == ErrorKind::AGGREGATE && e.context_.empty() && e.suppressed_.empty()) {
            for (auto& child : e.children_) {
                flat.push_back(std::move(child));
            }
        } else {
            flat.push_back(std::move(e));
        }
    }

    Error result(ErrorKind::AGGREGATE, flat.front().path_,
                 std::to_string(flat.size()) + " errors", flat.front().location_);
    result.children_ = std::move(flat);
    return result;
}

Error Error::concat(Error first, Error second) {
    std::vector<Error> errors;
    errors.reserve(2);
    errors.push_back(std::move(first));
    errors.push_back(std::move(second));
    return aggregate(std::move(errors));
}

Error::Error(const Error& other)
    : kind_(other.kind_)
    , path_(other.path_)
    , message_(other.message_)
    , expected_(other.expected_)
    , actual_(other.actual_)
    , location_(other.location_)
    , cause_(other.cause_ ? std::make_unique<Error>(*other.cause_) : nullptr)
    , context_(other.context_)
    , children_(other.children_)
    , suppressed_(other.suppressed_) {}

Error& Error::operator=(const Error& other) {
    if (this != &other) {
        Error copy(other);
        *this = std::move(copy);
    }
    return *this;
}

// ============================================================================
// Decoration
// ============================================================================

Error& Error::with_cause(Error cause) {
    cause_ = std::make_unique<Error>(std::move(cause));
    return *this;
}

Error& Error::with_context(std::string_view key, std::string_view value) {
    context_.emplace_back(std::string(key), std::string(value));
    return *this;
}

Error& Error::with_suppressed(Error other) {
    suppressed_.push_back(std::move(other));
    return *this;
}

std::optional<std::string> Error::context_value(std::string_view key) const {
    for (const auto& [k, v] : context_) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

Error Error::rebased(std::string_view from, std::string_view to) const {
    Error copy(*this);
    if (auto p = rebase_path(copy.path_, from, to)) {
        copy.path_ = std::move(*p);
    }
    for (auto& child : copy.children_) {
        child = child.rebased(from, to);
    }
    for (auto& s : copy.suppressed_) {
        s = s.rebased(from, to);
    }
    if (copy.cause_) {
        copy.cause_ = std::make_unique<Error>(copy.cause_->rebased(from, to));
    }
    return copy;
}

// ============================================================================
// Formatting
// ============================================================================

std::string Error::summary() const {
    std::string out;
    out.reserve(path_.size() + message_.size() + 2);
    out += path_.empty() ? "<root>" : path_;
    out += ": ";
    out += message_;
    return out;
}

std::string Error::to_string() const {
    std::ostringstream oss;

    // Format: [Kind] path: message
    oss << "[" << kind_name(kind_) << "] " << summary();

    if (location_.is_valid()) {
        oss << "\n    at " << location_.file << ":" << location_.line;
    }

    for (const auto& [key, value] : context_) {
        oss << "\n    " << key << ": " << value;
    }

    for (const auto& child : children_) {
        oss << "\n  - ";
        append_indented(oss, child.to_string(), "    ");
    }

    for (const auto& s : suppressed_) {
        oss << "\n  Suppressed: ";
        append_indented(oss, s.to_string(), "    ");
    }

    if (cause_) {
        oss << "\n  Caused by: " << cause_->to_string();
    }

    return oss.str();
}

}  // namespace configs::common
