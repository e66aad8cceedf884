#include "cradle/utils/logger.h"

#include "cradle/utils/string_utils.h"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace cradle {

namespace {

struct GlobalLogState {
    std::shared_ptr<ILogSink> default_sink;
    std::shared_ptr<ILogFormatter> default_formatter;
    LogLevel level = LogLevel::INFO;
    std::shared_ptr<const std::regex> filter;
};

GlobalLogState& global_state() {
    static GlobalLogState state;
    return state;
}

std::mutex& filter_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// LogLevel
// ============================================================================

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> log_level_from_string(const std::string& level_str) {
    std::string lower = to_lower(trim(level_str));

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal" || lower == "panic") return LogLevel::FATAL;

    return std::nullopt;
}

// ============================================================================
// LogMessage
// ============================================================================

LogMessage::LogMessage(LogLevel lvl, std::string comp, std::string msg,
                       std::chrono::system_clock::time_point ts)
    : level(lvl)
    , component(std::move(comp))
    , message(std::move(msg))
    , timestamp(ts)
    , thread_id(std::this_thread::get_id()) {
}

// ============================================================================
// TextFormatter
// ============================================================================

TextFormatter::TextFormatter(bool include_thread_id)
    : include_thread_id_(include_thread_id) {
}

std::string TextFormatter::format(const LogMessage& message) {
    std::ostringstream oss;

    oss << "[" << format_timestamp(message.timestamp) << "] ";
    oss << "[" << std::setw(5) << std::left << to_string(message.level) << "] ";

    if (!message.component.empty()) {
        oss << "[" << message.component << "] ";
    }

    if (include_thread_id_) {
        oss << "[thread=" << message.thread_id << "] ";
    }

    oss << message.message;
    return oss.str();
}

// ============================================================================
// JsonFormatter
// ============================================================================

JsonFormatter::JsonFormatter(bool pretty_print)
    : pretty_print_(pretty_print) {
}

std::string JsonFormatter::format(const LogMessage& message) {
    std::ostringstream thread;
    thread << message.thread_id;

    nlohmann::json j;
    j["timestamp"] = format_timestamp(message.timestamp);
    j["level"] = to_string(message.level);
    if (!message.component.empty()) {
        j["component"] = message.component;
    }
    j["thread_id"] = thread.str();
    j["message"] = message.message;

    return pretty_print_ ? j.dump(2) : j.dump();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << formatted_message << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

FileSink::FileSink(const std::string& filename, bool append)
    : filename_(filename) {
    auto parent_path = std::filesystem::path(filename).parent_path();
    if (!parent_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent_path, ec);
    }

    auto mode = append ? std::ios::out | std::ios::app : std::ios::out;
    file_.open(filename_, mode);

    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename_);
    }
}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) return;
    file_ << formatted_message << "\n";
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void MemorySink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(formatted_message);
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

bool MemorySink::contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& line : lines_) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , formatter_(std::make_shared<TextFormatter>()) {
    add_sink(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }
    if (!LoggerFactory::passes_filter(message)) {
        return;
    }

    do_log(level, message);
}

void Logger::set_level(LogLevel level) {
    min_level_ = level;
}

LogLevel Logger::get_level() const {
    return min_level_.load();
}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::OFF && level >= min_level_.load();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    sinks_.clear();
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;

    std::lock_guard<std::mutex> lock(config_mutex_);
    formatter_ = std::move(formatter);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& sink : sinks_) {
        if (sink) {
            sink->flush();
        }
    }
}

const std::string& Logger::component() const {
    return component_;
}

void Logger::do_log(LogLevel level, const std::string& message) {
    LogMessage log_msg(level, component_, message);

    // Snapshot under the lock, write outside it
    std::vector<std::shared_ptr<ILogSink>> sinks;
    std::shared_ptr<ILogFormatter> formatter;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        sinks = sinks_;
        formatter = formatter_;
    }

    std::string formatted_message = formatter ? formatter->format(log_msg) : message;

    for (auto& sink : sinks) {
        if (sink) {
            sink->write(formatted_message);
        }
    }
}

// ============================================================================
// LoggerFactory
// ============================================================================

std::mutex& LoggerFactory::registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::unordered_map<std::string, std::unique_ptr<Logger>>& LoggerFactory::loggers() {
    static std::unordered_map<std::string, std::unique_ptr<Logger>> registry;
    return registry;
}

Logger& LoggerFactory::get_default() {
    return get_logger("cradle");
}

Logger& LoggerFactory::get_logger(const std::string& component) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    auto& registry = loggers();
    auto it = registry.find(component);
    if (it != registry.end()) {
        return *it->second;
    }

    auto logger = std::make_unique<Logger>(component);
    auto& state = global_state();
    logger->set_level(state.level);

    if (state.default_sink) {
        logger->clear_sinks();
        logger->add_sink(state.default_sink);
    }

    if (state.default_formatter) {
        logger->set_formatter(state.default_formatter);
    }

    Logger& logger_ref = *logger;
    registry[component] = std::move(logger);

    return logger_ref;
}

void LoggerFactory::set_global_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    global_state().level = level;

    for (auto& [name, logger] : loggers()) {
        logger->set_level(level);
    }
}

void LoggerFactory::set_default_sink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    global_state().default_sink = sink;

    for (auto& [name, logger] : loggers()) {
        logger->clear_sinks();
        logger->add_sink(sink ? sink : std::make_shared<ConsoleSink>());
    }
}

void LoggerFactory::set_default_formatter(std::shared_ptr<ILogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    global_state().default_formatter = formatter;

    for (auto& [name, logger] : loggers()) {
        logger->set_formatter(formatter);
    }
}

void LoggerFactory::set_message_filter(std::optional<std::regex> filter) {
    std::lock_guard<std::mutex> lock(filter_mutex());
    if (filter) {
        global_state().filter = std::make_shared<const std::regex>(std::move(*filter));
    } else {
        global_state().filter.reset();
    }
}

bool LoggerFactory::passes_filter(const std::string& message) {
    std::shared_ptr<const std::regex> filter;
    {
        std::lock_guard<std::mutex> lock(filter_mutex());
        filter = global_state().filter;
    }
    return !filter || std::regex_search(message, *filter);
}

void LoggerFactory::flush_all() {
    std::lock_guard<std::mutex> lock(registry_mutex());
    for (auto& [name, logger] : loggers()) {
        logger->flush();
    }
}

} // namespace cradle
