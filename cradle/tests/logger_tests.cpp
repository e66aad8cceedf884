#include "test_support.h"

#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>
#include <sstream>

using namespace cradle;
using cradle::testing::TempDir;
using cradle::testing::capture_logs;
using cradle::testing::fail;

/// Put the process-wide logging state back the way each case expects it.
static void reset_logging() {
    LoggerFactory::set_message_filter(std::nullopt);
    LoggerFactory::set_global_level(LogLevel::INFO);
    LoggerFactory::set_default_formatter(std::make_shared<TextFormatter>());
    LoggerFactory::set_default_sink(nullptr);
}

static int test_level_names() {
    CRADLE_EXPECT(to_string(LogLevel::WARN) == "WARN", "warn name");
    CRADLE_EXPECT(to_string(LogLevel::FATAL) == "FATAL", "fatal name");

    CRADLE_EXPECT(log_level_from_string("info") == LogLevel::INFO, "info");
    CRADLE_EXPECT(log_level_from_string(" DEBUG ") == LogLevel::DEBUG, "case and whitespace ignored");
    CRADLE_EXPECT(log_level_from_string("warning") == LogLevel::WARN, "warning alias");
    CRADLE_EXPECT(log_level_from_string("warn") == LogLevel::WARN, "warn");
    CRADLE_EXPECT(log_level_from_string("panic") == LogLevel::FATAL, "panic maps to fatal");
    CRADLE_EXPECT(!log_level_from_string("verbose").has_value(), "unknown level");
    CRADLE_EXPECT(!log_level_from_string("").has_value(), "empty level");
    return 0;
}

static int test_level_gate() {
    auto sink = capture_logs();
    LoggerFactory::set_global_level(LogLevel::WARN);

    auto& logger = LoggerFactory::get_logger("cradle.test.gate");
    logger.info("quiet message");
    logger.warn("loud message");
    CRADLE_DEBUG(logger, "debug message");

    CRADLE_EXPECT(!sink->contains("quiet message"), "info is below the gate");
    CRADLE_EXPECT(!sink->contains("debug message"), "debug is below the gate");
    CRADLE_EXPECT(sink->contains("loud message"), "warn passes");
    CRADLE_EXPECT(sink->lines().size() == 1, "exactly one line emitted");
    CRADLE_EXPECT(!logger.is_enabled(LogLevel::INFO) && logger.is_enabled(LogLevel::ERROR), "is_enabled follows level");

    auto& late = LoggerFactory::get_logger("cradle.test.gate.late");
    CRADLE_EXPECT(late.get_level() == LogLevel::WARN, "new loggers inherit the global level");

    reset_logging();
    return 0;
}

static int test_text_format() {
    auto sink = capture_logs();
    auto& logger = LoggerFactory::get_logger("cradle.test.text");
    logger.warn("handler dropped");

    auto lines = sink->lines();
    CRADLE_EXPECT(lines.size() == 1, "one line");
    const auto& line = lines.front();
    CRADLE_EXPECT(line.front() == '[' && line.find("Z] ") != std::string::npos, "timestamp prefix");
    CRADLE_EXPECT(line.find("[WARN ] [cradle.test.text] handler dropped") != std::string::npos,
                  "padded level, component, message");

    TextFormatter with_thread(true);
    LogMessage message(LogLevel::ERROR, "", "bare");
    auto formatted = with_thread.format(message);
    CRADLE_EXPECT(formatted.find("[ERROR] [thread=") != std::string::npos, "thread id included");
    CRADLE_EXPECT(formatted.size() >= 4 && formatted.compare(formatted.size() - 4, 4, "bare") == 0,
                  "message last");

    reset_logging();
    return 0;
}

static int test_json_format() {
    auto sink = capture_logs();
    LoggerFactory::set_default_formatter(std::make_shared<JsonFormatter>());

    auto& logger = LoggerFactory::get_logger("cradle.test.json");
    logger.error("monitor \"conmon\" missing");

    auto lines = sink->lines();
    CRADLE_EXPECT(lines.size() == 1, "one line");
    auto parsed = nlohmann::json::parse(lines.front(), nullptr, false);
    CRADLE_EXPECT(!parsed.is_discarded(), "line is valid JSON");
    CRADLE_EXPECT(parsed.value("level", "") == "ERROR", "level key");
    CRADLE_EXPECT(parsed.value("component", "") == "cradle.test.json", "component key");
    CRADLE_EXPECT(parsed.value("message", "") == "monitor \"conmon\" missing", "message survives escaping");
    CRADLE_EXPECT(parsed.contains("timestamp") && parsed.contains("thread_id"), "timestamp and thread keys");

    JsonFormatter pretty(true);
    auto text = pretty.format(LogMessage(LogLevel::INFO, "", "x"));
    CRADLE_EXPECT(text.find('\n') != std::string::npos, "pretty output spans lines");
    CRADLE_EXPECT(!nlohmann::json::parse(text).contains("component"), "empty component omitted");

    reset_logging();
    return 0;
}

static int test_message_filter() {
    auto sink = capture_logs();
    LoggerFactory::set_message_filter(std::regex("^sandbox"));

    CRADLE_EXPECT(LoggerFactory::passes_filter("sandbox created"), "matching message passes");
    CRADLE_EXPECT(!LoggerFactory::passes_filter("image pulled"), "other message blocked");

    auto& logger = LoggerFactory::get_logger("cradle.test.filter");
    logger.info("sandbox created");
    logger.info("image pulled");
    CRADLE_EXPECT(sink->contains("sandbox created"), "filtered in");
    CRADLE_EXPECT(!sink->contains("image pulled"), "filtered out");

    LoggerFactory::set_message_filter(std::nullopt);
    logger.info("image pulled");
    CRADLE_EXPECT(sink->contains("image pulled"), "cleared filter lets everything through");

    reset_logging();
    return 0;
}

static int test_sink_management() {
    auto sink = capture_logs();
    auto extra = std::make_shared<MemorySink>();

    auto& logger = LoggerFactory::get_logger("cradle.test.sinks");
    logger.add_sink(extra);
    logger.info("fan out");
    CRADLE_EXPECT(sink->contains("fan out") && extra->contains("fan out"), "every sink receives the line");

    logger.clear_sinks();
    logger.info("nowhere");
    CRADLE_EXPECT(!sink->contains("nowhere") && !extra->contains("nowhere"), "no sinks, no output");

    extra->clear();
    CRADLE_EXPECT(extra->lines().empty(), "clear empties the sink");

    logger.add_sink(extra);
    logger.set_formatter(nullptr);
    logger.info("formatter kept");
    CRADLE_EXPECT(extra->contains("[INFO ] [cradle.test.sinks] formatter kept"), "null formatter ignored");

    reset_logging();
    return 0;
}

static int test_file_sink() {
    TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");
    auto path = dir.path() + "/logs/cradle.log";

    {
        FileSink sink(path, false);
        sink.write("first");
        sink.write("second");
        sink.flush();
    }

    std::ifstream in(path);
    CRADLE_EXPECT(in.is_open(), "log file created with its directory");
    std::stringstream content;
    content << in.rdbuf();
    CRADLE_EXPECT(content.str() == "first\nsecond\n", "one line per message");
    return 0;
}

static int run_named_test(const char* name) {
    if (std::strcmp(name, "level_names") == 0) return test_level_names();
    if (std::strcmp(name, "level_gate") == 0) return test_level_gate();
    if (std::strcmp(name, "text_format") == 0) return test_text_format();
    if (std::strcmp(name, "json_format") == 0) return test_json_format();
    if (std::strcmp(name, "message_filter") == 0) return test_message_filter();
    if (std::strcmp(name, "sink_management") == 0) return test_sink_management();
    if (std::strcmp(name, "file_sink") == 0) return test_file_sink();
    return fail(std::string("unknown test name: ") + name);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        static const char* const all[] = {
            "level_names", "level_gate", "text_format", "json_format",
            "message_filter", "sink_management", "file_sink",
        };
        int rc = 0;
        for (const char* name : all) {
            rc |= run_named_test(name);
        }
        return rc;
    }
    return run_named_test(argv[1]);
}
