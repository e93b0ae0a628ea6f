#pragma once

/**
 * @file debug.hpp
 * @brief Logging for the configs library
 *
 * Features:
 * - Hierarchical log levels
 * - Category-based filtering
 * - Automatic source location capture
 * - Pluggable sinks (console, callback)
 * - Zero formatting cost when a level is disabled
 *
 * Decoding itself never logs; builders and the tree loader do.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace configs::common::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    TRACE = 0,  // Finest granularity, very verbose
    DEBUG = 1,  // Debugging information
    INFO  = 2,  // Informational messages
    WARN  = 3,  // Warning conditions
    ERROR = 4,  // Error conditions
    OFF   = 5   // Logging disabled
};

constexpr std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

constexpr char level_char(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return 'T';
        case LogLevel::DEBUG:
            return 'D';
        case LogLevel::INFO:
            return 'I';
        case LogLevel::WARN:
            return 'W';
        case LogLevel::ERROR:
            return 'E';
        default:
            return '?';
    }
}

/**
 * @brief Parse log level from string (case-insensitive, INFO if unknown)
 */
CONFIGS_API LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LOG CATEGORIES
// ============================================================================

namespace category {
constexpr std::string_view GENERAL = "general";
constexpr std::string_view DERIVE  = "derive";
constexpr std::string_view LOADER  = "loader";
}  // namespace category

// ============================================================================
// LOG RECORD
// ============================================================================

/**
 * @brief A single log entry
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id = 0;
};

// ============================================================================
// LOG SINKS
// ============================================================================

/**
 * @brief Interface for log output destinations
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;

    virtual bool is_ready() const noexcept = 0;
};

/**
 * @brief Console log sink with optional color support
 */
class CONFIGS_API ConsoleSink : public ILogSink {
public:
    struct Config {
        bool use_colors        = true;
        bool use_stderr        = true;  // Warnings and errors go to stderr
        bool include_timestamp = true;
        bool include_thread_id = false;
        bool include_location  = true;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * @brief Callback-based sink for custom handling (and tests)
 */
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    void write(const LogRecord& record) override {
        if (callback_)
            callback_(record);
    }

    void flush() override {}
    bool is_ready() const noexcept override { return callback_ != nullptr; }

private:
    Callback callback_;
};

// ============================================================================
// LOG FILTER
// ============================================================================

class CONFIGS_API LogFilter {
public:
    LogFilter() = default;

    void set_level(LogLevel level) noexcept { global_level_ = level; }
    LogLevel level() const noexcept { return global_level_.load(std::memory_order_relaxed); }

    /**
     * @brief Set level for specific category
     */
    void set_category_level(std::string_view category, LogLevel level);

    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /**
     * @brief Reset all filters to defaults
     */
    void reset() noexcept;

private:
    std::atomic<LogLevel> global_level_{LogLevel::INFO};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LogLevel> category_levels_;
};

// ============================================================================
// LOGGER
// ============================================================================

/**
 * @brief Thread-safe logger with multiple sinks
 */
class CONFIGS_API Logger {
public:
    static Logger& instance() noexcept;

    void add_sink(std::shared_ptr<ILogSink> sink);

    void clear_sinks();

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }

    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = CONFIGS_CURRENT_LOCATION);

    void flush();

private:
    Logger();
    ~Logger();

    void dispatch(const LogRecord& record);

    LogFilter filter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define CONFIGS_LOG_ENABLED(level, cat) \
    ::configs::common::debug::Logger::instance().is_enabled(::configs::common::debug::LogLevel::level, cat)

// Core logging macro
#define CONFIGS_LOG_IMPL(level, category, ...)                                                    \
    do {                                                                                          \
        auto& _configs_logger = ::configs::common::debug::Logger::instance();                     \
        if (_configs_logger.is_enabled(::configs::common::debug::LogLevel::level, category)) {    \
            std::ostringstream _configs_oss;                                                      \
            _configs_oss << __VA_ARGS__;                                                          \
            _configs_logger.log(::configs::common::debug::LogLevel::level, category,              \
                                _configs_oss.str(), CONFIGS_CURRENT_LOCATION);                    \
        }                                                                                         \
    } while (0)

#define CONFIGS_LOG_TRACE(cat, ...) CONFIGS_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define CONFIGS_LOG_DEBUG(cat, ...) CONFIGS_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define CONFIGS_LOG_INFO(cat, ...)  CONFIGS_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define CONFIGS_LOG_WARN(cat, ...)  CONFIGS_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define CONFIGS_LOG_ERROR(cat, ...) CONFIGS_LOG_IMPL(ERROR, cat, __VA_ARGS__)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Set the global level
 */
CONFIGS_API void init_logging(LogLevel level = LogLevel::INFO);

/**
 * @brief Apply a level list such as "warn,derive=debug,loader=trace"
 *
 * A bare level sets the global level and category=level entries set
 * category levels. Earlier category levels are cleared first. Entries
 * naming no known level are ignored.
 * @return The global level in effect, @p fallback if none was given
 */
CONFIGS_API LogLevel configure_logging(std::string_view settings,
                                       LogLevel fallback = LogLevel::INFO);

/**
 * @brief configure_logging() with the CONFIGS_LOG_LEVEL environment variable
 */
CONFIGS_API LogLevel init_logging_from_env(LogLevel fallback = LogLevel::INFO);

/**
 * @brief Flush and drop all sinks
 */
CONFIGS_API void shutdown_logging();

}  // namespace configs::common::debug
