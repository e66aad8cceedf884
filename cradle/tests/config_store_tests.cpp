#include "test_support.h"

#include "cradle/config/config_store.h"

#include <cstring>

using namespace cradle;
using cradle::testing::FakeHost;
using cradle::testing::TempDir;
using cradle::testing::capture_logs;
using cradle::testing::fail;
using cradle::testing::static_context;

static void reset_logging() {
    LoggerFactory::set_message_filter(std::nullopt);
    LoggerFactory::set_global_level(LogLevel::INFO);
    LoggerFactory::set_default_sink(nullptr);
}

/// Sources rooted in dir that never look at the real node.
static ConfigSources isolated_sources(const TempDir& dir) {
    ConfigSources sources;
    sources.config_file = dir.path() + "/cradle.conf";
    sources.config_dir = dir.path() + "/cradle.conf.d";
    sources.storage_conf = dir.path() + "/storage.conf";
    sources.apply_environment = false;
    return sources;
}

static std::string listen_file(const std::string& socket) {
    return "[cradle.api]\nlisten = \"" + socket + "\"\n";
}

static int test_sources_layered() {
    TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");

    dir.write("storage.conf",
              "[storage]\n"
              "driver = \"overlay\"\n"
              "graphroot = \"/data/graph\"\n"
              "runroot = \"/run/graph\"\n"
              "[storage.options.overlay]\n"
              "mountopt = \"nodev\"\n");
    dir.write("cradle.conf",
              "[cradle.api]\nlisten = \"/run/primary.sock\"\n"
              "[cradle.runtime]\nlog_level = \"warn\"\n");
    dir.write("cradle.conf.d/10-listen.conf", listen_file("/run/drop-in.sock"));

    auto config = load_configuration(isolated_sources(dir));
    if (!config) {
        return fail("sources should load: " + config.error().message);
    }
    CRADLE_EXPECT(config->root.root == "/data/graph" && config->root.runroot == "/run/graph",
                  "storage.conf supplies the storage locations");
    CRADLE_EXPECT(config->root.storage_driver == "overlay", "storage.conf supplies the driver");
    CRADLE_EXPECT((config->root.storage_option == std::vector<std::string>{"overlay.mountopt=nodev"}),
                  "storage.conf driver options");
    CRADLE_EXPECT(config->runtime.log_level == "warn", "primary file applied");
    CRADLE_EXPECT(config->api.listen == "/run/drop-in.sock", "drop-in directory wins over the primary file");
    CRADLE_EXPECT(config->single_config_path() == dir.path() + "/cradle.conf", "primary file remembered");
    CRADLE_EXPECT(config->drop_in_config_dir() == dir.path() + "/cradle.conf.d", "drop-in dir remembered");
    return 0;
}

static int test_source_errors() {
    TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");
    auto sources = isolated_sources(dir);

    auto missing = load_configuration(sources);
    CRADLE_EXPECT(!missing && missing.error().is(ErrorCode::NOT_FOUND), "named primary file must exist");

    sources.config_file.clear();
    auto defaults = load_configuration(sources);
    CRADLE_EXPECT(defaults && defaults->root.root == DEFAULT_GRAPH_ROOT, "no files means built-in defaults");

    dir.write("storage.conf", "[storage\ndriver = ");
    auto broken = load_configuration(sources);
    CRADLE_EXPECT(!broken && broken.error().is(ErrorCode::PARSE_ERROR), "broken storage.conf");
    return 0;
}

static int test_load_publishes_snapshot() {
    TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");
    dir.write("cradle.conf", listen_file("/run/first.sock"));

    ConfigStore store(isolated_sources(dir), static_context(std::make_shared<FakeHost>()));
    CRADLE_EXPECT(store.current() == nullptr, "nothing published before load");

    auto status = store.load();
    if (!status) {
        return fail("load should succeed: " + status.error().message);
    }
    auto snapshot = store.current();
    CRADLE_EXPECT(snapshot != nullptr, "snapshot published");
    CRADLE_EXPECT(snapshot->api().listen == "/run/first.sock", "snapshot carries the file's values");
    CRADLE_EXPECT(snapshot->mode() == ValidationMode::STATIC, "context mode used");

    reset_logging();
    return 0;
}

static int test_reload_swaps_snapshot() {
    TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");
    dir.write("cradle.conf", listen_file("/run/first.sock"));

    ConfigStore store(isolated_sources(dir), static_context(std::make_shared<FakeHost>()));
    CRADLE_EXPECT(store.load().has_value(), "initial load");
    auto before = store.current();

    dir.write("cradle.conf", listen_file("/run/second.sock"));
    dir.write("cradle.conf.d/20-runtime.conf", "[cradle.runtime]\nctr_stop_timeout = 60\n");
    auto status = store.reload();
    if (!status) {
        return fail("reload should succeed: " + status.error().message);
    }

    auto after = store.current();
    CRADLE_EXPECT(after != before, "a new snapshot is published");
    CRADLE_EXPECT(after->api().listen == "/run/second.sock", "changed file picked up");
    CRADLE_EXPECT(after->runtime().ctr_stop_timeout == 60, "new drop-in picked up");
    CRADLE_EXPECT(before->api().listen == "/run/first.sock", "earlier readers keep their snapshot");

    reset_logging();
    return 0;
}

static int test_failed_reload_keeps_snapshot() {
    TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");
    dir.write("cradle.conf", listen_file("/run/first.sock"));

    ConfigStore store(isolated_sources(dir), static_context(std::make_shared<FakeHost>()));
    CRADLE_EXPECT(store.load().has_value(), "initial load");
    auto before = store.current();

    auto sink = capture_logs();
    dir.write("cradle.conf", "[cradle.api\nlisten = ");
    auto status = store.reload();
    CRADLE_EXPECT(!status.has_value(), "malformed file fails the reload");
    CRADLE_EXPECT(store.current() == before, "snapshot unchanged after a parse failure");
    CRADLE_EXPECT(sink->contains("Configuration reload failed"), "failure logged");

    dir.write("cradle.conf", "[cradle.runtime]\nlog_level = \"loud\"\n");
    status = store.reload();
    CRADLE_EXPECT(!status && status.error().is(ErrorCode::INVALID_ARGUMENT), "invalid value fails the reload");
    CRADLE_EXPECT(store.current() == before, "snapshot unchanged after a validation failure");

    reset_logging();
    return 0;
}

static int test_logging_settings_applied() {
    TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");
    dir.write("cradle.conf", "[cradle.runtime]\nlog_level = \"debug\"\nlog_filter = \"^keep\"\n");

    ConfigStore store(isolated_sources(dir), static_context(std::make_shared<FakeHost>()));
    auto status = store.load();
    if (!status) {
        return fail("load should succeed: " + status.error().message);
    }

    auto& logger = LoggerFactory::get_logger("cradle.test.store");
    CRADLE_EXPECT(logger.is_enabled(LogLevel::DEBUG), "configured level installed");
    CRADLE_EXPECT(LoggerFactory::passes_filter("keep this"), "filter lets matches through");
    CRADLE_EXPECT(!LoggerFactory::passes_filter("drop this"), "filter installed");

    reset_logging();
    return 0;
}

static int test_apply_logging_settings() {
    reset_logging();

    RuntimeConfig runtime;
    runtime.log_level = "error";
    runtime.log_filter = "([";
    auto status = apply_logging_settings(runtime);
    CRADLE_EXPECT(!status && status.error().is(ErrorCode::INVALID_ARGUMENT), "bad filter rejected");
    CRADLE_EXPECT(LoggerFactory::get_default().get_level() == LogLevel::INFO, "level untouched on failure");

    runtime.log_level = "chatty";
    runtime.log_filter.clear();
    status = apply_logging_settings(runtime);
    CRADLE_EXPECT(!status && status.error().message == "invalid log_level \"chatty\"", "bad level rejected");

    runtime.log_level = "error";
    CRADLE_EXPECT(apply_logging_settings(runtime).has_value(), "valid settings applied");
    CRADLE_EXPECT(LoggerFactory::get_default().get_level() == LogLevel::ERROR, "level installed");
    CRADLE_EXPECT(LoggerFactory::passes_filter("anything"), "empty filter clears filtering");

    reset_logging();
    return 0;
}

static int run_named_test(const char* name) {
    if (std::strcmp(name, "sources_layered") == 0) return test_sources_layered();
    if (std::strcmp(name, "source_errors") == 0) return test_source_errors();
    if (std::strcmp(name, "load_publishes_snapshot") == 0) return test_load_publishes_snapshot();
    if (std::strcmp(name, "reload_swaps_snapshot") == 0) return test_reload_swaps_snapshot();
    if (std::strcmp(name, "failed_reload_keeps_snapshot") == 0) return test_failed_reload_keeps_snapshot();
    if (std::strcmp(name, "logging_settings_applied") == 0) return test_logging_settings_applied();
    if (std::strcmp(name, "apply_logging_settings") == 0) return test_apply_logging_settings();
    return fail(std::string("unknown test name: ") + name);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        static const char* const all[] = {
            "sources_layered", "source_errors", "load_publishes_snapshot", "reload_swaps_snapshot",
            "failed_reload_keeps_snapshot", "logging_settings_applied", "apply_logging_settings",
        };
        int rc = 0;
        for (const char* name : all) {
            rc |= run_named_test(name);
        }
        return rc;
    }
    return run_named_test(argv[1]);
}
