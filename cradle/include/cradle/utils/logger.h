#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cradle {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

[[nodiscard]] std::string to_string(LogLevel level);

/**
 * @brief Parse a configured log level
 *
 * Accepts trace, debug, info, warn/warning, error, fatal and panic
 * (panic maps to FATAL). Case-insensitive.
 */
[[nodiscard]] std::optional<LogLevel> log_level_from_string(const std::string& level_str);

// ============================================================================
// Log Message
// ============================================================================

struct LogMessage {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;

    LogMessage() = default;
    LogMessage(LogLevel lvl, std::string comp, std::string msg,
               std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());
};

// ============================================================================
// Formatters
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogMessage& message) = 0;
};

class TextFormatter : public ILogFormatter {
public:
    explicit TextFormatter(bool include_thread_id = false);
    std::string format(const LogMessage& message) override;

private:
    bool include_thread_id_;
};

class JsonFormatter : public ILogFormatter {
public:
    explicit JsonFormatter(bool pretty_print = false);
    std::string format(const LogMessage& message) override;

private:
    bool pretty_print_;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const std::string& formatted_message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes to stderr so stdout stays clean for printed configuration
 */
class ConsoleSink : public ILogSink {
public:
    ConsoleSink() = default;
    void write(const std::string& formatted_message) override;
    void flush() override;

private:
    std::mutex mutex_;
};

class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    void write(const std::string& formatted_message) override;
    void flush() override;

private:
    std::string filename_;
    std::ofstream file_;
    std::mutex mutex_;
};

/**
 * @brief Keeps formatted lines in memory
 */
class MemorySink : public ILogSink {
public:
    void write(const std::string& formatted_message) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] bool contains(const std::string& needle) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string component);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level() const;
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void flush();

    [[nodiscard]] const std::string& component() const;

private:
    std::string component_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::shared_ptr<ILogFormatter> formatter_;
    mutable std::mutex config_mutex_;

    void do_log(LogLevel level, const std::string& message);
};

// ============================================================================
// Global Logger Registry
// ============================================================================

class LoggerFactory {
public:
    static Logger& get_default();
    static Logger& get_logger(const std::string& component);

    /**
     * @brief Apply a level to every existing and future logger
     */
    static void set_global_level(LogLevel level);

    /**
     * @brief Replace the sinks of every existing and future logger
     */
    static void set_default_sink(std::shared_ptr<ILogSink> sink);
    static void set_default_formatter(std::shared_ptr<ILogFormatter> formatter);

    /**
     * @brief Only emit messages matching the expression; nullopt clears it
     */
    static void set_message_filter(std::optional<std::regex> filter);
    [[nodiscard]] static bool passes_filter(const std::string& message);

    static void flush_all();

private:
    static std::mutex& registry_mutex();
    static std::unordered_map<std::string, std::unique_ptr<Logger>>& loggers();
};

} // namespace cradle

// ============================================================================
// Convenience macros (skip message construction when the level is off)
// ============================================================================

#define CRADLE_TRACE(logger, msg) \
    do { if ((logger).is_enabled(::cradle::LogLevel::TRACE)) (logger).trace(msg); } while (0)

#define CRADLE_DEBUG(logger, msg) \
    do { if ((logger).is_enabled(::cradle::LogLevel::DEBUG)) (logger).debug(msg); } while (0)
