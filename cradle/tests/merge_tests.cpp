#include "test_support.h"

#include "cradle/config/config.h"

#include <cstdlib>
#include <cstring>

using namespace cradle;
using cradle::testing::fail;

static Configuration base_config() {
    StorageDefaults storage;
    storage.graph_root = "/r";
    storage.run_root = "/run";
    storage.driver = "overlay";
    storage.driver_options = {"a", "b"};
    return Configuration::defaults(storage);
}

static int test_storage_options_fold_duplicates() {
    auto config = base_config();

    auto status = config.update_from_string("[cradle]\nstorage_option = [\"c\", \"a\"]\n", "fragment.conf");
    CRADLE_EXPECT(status.has_value(), "fragment should merge");
    CRADLE_EXPECT((config.root.storage_option == std::vector<std::string>{"b", "c", "a"}),
                  "duplicates should fold onto their last occurrence");

    status = config.update_from_string("[cradle]\nstorage_option = [\"c\", \"a\"]\n", "fragment.conf");
    CRADLE_EXPECT(status.has_value(), "fragment should merge again");
    CRADLE_EXPECT((config.root.storage_option == std::vector<std::string>{"b", "c", "a"}),
                  "merging the same fragment twice should be idempotent");

    status = config.update_from_string("[cradle.runtime]\nlog_level = \"debug\"\n", "other.conf");
    CRADLE_EXPECT(status.has_value(), "unrelated fragment should merge");
    CRADLE_EXPECT((config.root.storage_option == std::vector<std::string>{"b", "c", "a"}),
                  "a fragment without storage_option keeps the list");
    return 0;
}

static int test_remove_dup_storage_opts() {
    CRADLE_EXPECT(remove_dup_storage_opts({}).empty(), "empty list stays empty");
    CRADLE_EXPECT((remove_dup_storage_opts({"x", "y", "x", "z", "y"}) == std::vector<std::string>{"x", "z", "y"}),
                  "last occurrences kept in order");
    return 0;
}

static int test_storage_locations_inherit() {
    auto config = base_config();

    auto status = config.update_from_string("[cradle]\nstorage_driver = \"vfs\"\n", "driver.conf");
    CRADLE_EXPECT(status.has_value(), "fragment should merge");
    CRADLE_EXPECT(config.root.root == "/r", "root should be inherited");
    CRADLE_EXPECT(config.root.runroot == "/run", "runroot should be inherited");
    CRADLE_EXPECT(config.root.storage_driver == "vfs", "driver should be overridden");

    status = config.update_from_string("[cradle]\nroot = \"\"\nrunroot = \"/other\"\n", "roots.conf");
    CRADLE_EXPECT(status.has_value(), "second fragment should merge");
    CRADLE_EXPECT(config.root.root == "/r", "an empty root inherits instead of clearing");
    CRADLE_EXPECT(config.root.runroot == "/other", "a later fragment may still override");
    CRADLE_EXPECT(config.root.storage_driver == "vfs", "driver from the earlier fragment stays");
    return 0;
}

static int test_handler_tables_merge_by_field() {
    auto config = base_config();

    auto status = config.update_from_string(R"(
[cradle.runtime.runtimes.runc]
runtime_path = "/opt/bin/runc"

[cradle.runtime.runtimes.kata]
runtime_type = "vm"
runtime_path = "/usr/bin/containerd-shim-kata-v2"
)", "handlers.conf");
    CRADLE_EXPECT(status.has_value(), "handler fragment should merge");

    const auto& runc = config.runtime.runtimes.at("runc");
    CRADLE_EXPECT(runc.runtime_path == "/opt/bin/runc", "runtime_path should be set");
    CRADLE_EXPECT(runc.runtime_root == "/run/runc", "runtime_root should survive the merge");
    CRADLE_EXPECT(runc.allowed_annotations.size() == 2, "allowed annotations should survive the merge");

    CRADLE_EXPECT(config.runtime.runtimes.contains("kata"), "new handler should be added");
    CRADLE_EXPECT(config.runtime.runtimes.at("kata").runtime_type == "vm", "new handler type");
    CRADLE_EXPECT(config.runtime.runtimes.at("kata").runtime_root.empty(), "new handler starts empty");
    return 0;
}

static int test_unknown_keys_ignored() {
    auto config = base_config();
    auto status = config.update_from_string(R"(
[cradle]
future_option = true

[cradle.runtime]
future_knob = 3
log_level = "warn"

[elsewhere]
value = "x"
)", "future.conf");
    CRADLE_EXPECT(status.has_value(), "unknown keys should be tolerated");
    CRADLE_EXPECT(config.runtime.log_level == "warn", "known keys should still apply");
    return 0;
}

static int test_wrong_type_names_key_and_source() {
    auto config = base_config();
    auto before = config;

    auto status = config.update_from_string("[cradle.runtime]\nlog_size_max = \"big\"\n", "/etc/cradle/bad.conf");
    CRADLE_EXPECT(!status.has_value(), "a wrongly typed key should fail");
    CRADLE_EXPECT(status.error().is(ErrorCode::PARSE_ERROR), "error should be a parse error");
    CRADLE_EXPECT(status.error().message.find("log_size_max") != std::string::npos, "error should name the key");
    CRADLE_EXPECT(status.error().message.find("/etc/cradle/bad.conf") != std::string::npos,
                  "error should name the source");
    CRADLE_EXPECT(config == before, "a failed fragment should leave the configuration untouched");

    status = config.update_from_string("[cradle.runtime\nbroken", "syntax.conf");
    CRADLE_EXPECT(!status.has_value(), "malformed TOML should fail");
    CRADLE_EXPECT(config == before, "malformed TOML should leave the configuration untouched");
    return 0;
}

static int test_registries_dropped_with_warning() {
    auto sink = cradle::testing::capture_logs();
    auto config = base_config();

    auto status = config.update_from_string("[cradle.image]\nregistries = [\"quay.io\"]\n", "legacy.conf");
    CRADLE_EXPECT(status.has_value(), "legacy registries should not be an error");
    CRADLE_EXPECT(sink->contains("'registries' option has been dropped"), "a warning should be logged");
    CRADLE_EXPECT(sink->contains("legacy.conf"), "the warning should name the file");
    CRADLE_EXPECT(config.to_toml().find("\nregistries =") == std::string::npos, "registries are never emitted");
    return 0;
}

static int test_drop_in_directory_order() {
    cradle::testing::TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");

    dir.write("conf.d/10-first.conf", "[cradle.runtime]\nlog_level = \"debug\"\npids_limit = 10\n");
    dir.write("conf.d/20-nested/inner.conf", "[cradle.runtime]\nlog_level = \"warn\"\n[cradle.image]\npause_command = \"/nested\"\n");
    dir.write("conf.d/30-last.conf", "[cradle.runtime]\nlog_level = \"error\"\n");

    auto config = base_config();
    auto status = config.update_from_path(dir.path() + "/conf.d");
    CRADLE_EXPECT(status.has_value(), "directory should merge");
    CRADLE_EXPECT(config.runtime.log_level == "error", "the last file in path order wins");
    CRADLE_EXPECT(config.runtime.pids_limit == 10, "earlier files still contribute");
    CRADLE_EXPECT(config.image.pause_command == "/nested", "nested directories are visited");
    CRADLE_EXPECT(config.drop_in_config_dir() == dir.path() + "/conf.d", "drop-in directory is remembered");
    return 0;
}

static int test_drop_in_directory_is_atomic() {
    cradle::testing::TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");

    dir.write("conf.d/10-good.conf", "[cradle.runtime]\nlog_level = \"debug\"\n");
    dir.write("conf.d/20-bad.conf", "[cradle.runtime]\nlog_level = [\n");

    auto config = base_config();
    auto status = config.update_from_path(dir.path() + "/conf.d");
    CRADLE_EXPECT(!status.has_value(), "a bad fragment should fail the merge");
    CRADLE_EXPECT(status.error().message.find("20-bad.conf") != std::string::npos, "error should name the file");
    CRADLE_EXPECT(config.runtime.log_level == "info", "no fragment should have been applied");
    CRADLE_EXPECT(config.drop_in_config_dir().empty(), "the directory should not be remembered");
    return 0;
}

static int test_missing_sources() {
    auto config = base_config();

    auto status = config.update_from_path("/nonexistent/cradle/conf.d");
    CRADLE_EXPECT(status.has_value(), "a missing drop-in directory is not an error");

    status = config.update_from_file("/nonexistent/cradle/cradle.conf");
    CRADLE_EXPECT(!status.has_value(), "a missing primary file is an error");
    CRADLE_EXPECT(status.error().is(ErrorCode::NOT_FOUND), "missing file should be NOT_FOUND");
    CRADLE_EXPECT(config.single_config_path().empty(), "a failed file should not be remembered");
    return 0;
}

static int test_primary_file_remembered() {
    cradle::testing::TempDir dir;
    CRADLE_EXPECT(dir.valid(), "temp dir");
    auto path = dir.write("cradle.conf", "[cradle.api]\nlisten = \"/tmp/cradle-test.sock\"\n");

    auto config = base_config();
    auto status = config.update_from_file(path);
    CRADLE_EXPECT(status.has_value(), "primary file should merge");
    CRADLE_EXPECT(config.api.listen == "/tmp/cradle-test.sock", "listen should be set");
    CRADLE_EXPECT(config.single_config_path() == path, "primary file should be remembered");
    return 0;
}

static int test_environment_overrides() {
    ::setenv("CRADLE_LISTEN", "/run/env/cradle.sock", 1);
    ::setenv("CRADLE_DEFAULT_RUNTIME", "crun", 1);
    ::setenv("CRADLE_ROOT", "", 1);
    ::setenv("CRADLE_LOG_LEVEL", "debug", 1);

    auto config = base_config();
    config.apply_environment_overrides();

    ::unsetenv("CRADLE_LISTEN");
    ::unsetenv("CRADLE_DEFAULT_RUNTIME");
    ::unsetenv("CRADLE_ROOT");
    ::unsetenv("CRADLE_LOG_LEVEL");

    CRADLE_EXPECT(config.api.listen == "/run/env/cradle.sock", "CRADLE_LISTEN applies");
    CRADLE_EXPECT(config.runtime.default_runtime == "crun", "CRADLE_DEFAULT_RUNTIME applies");
    CRADLE_EXPECT(config.runtime.log_level == "debug", "CRADLE_LOG_LEVEL applies");
    CRADLE_EXPECT(config.root.root == "/r", "empty values are ignored");
    return 0;
}

static int test_defaults() {
    auto config = Configuration::defaults();
    CRADLE_EXPECT(config.root.root == DEFAULT_GRAPH_ROOT, "graph root default");
    CRADLE_EXPECT(config.root.runroot == DEFAULT_RUN_ROOT, "run root default");
    CRADLE_EXPECT(config.runtime.default_runtime == "runc", "default runtime");
    CRADLE_EXPECT(config.runtime.runtimes.size() == 1, "one built-in handler");
    CRADLE_EXPECT(config.runtime.runtimes.at("runc") == RuntimeHandler::defaults(), "built-in handler");
    CRADLE_EXPECT(config.runtime.default_capabilities.size() == 9, "default capabilities");
    CRADLE_EXPECT(config.runtime.ctr_stop_timeout == 30, "stop timeout default");
    CRADLE_EXPECT(config.image.image_volumes == "mkdir", "image volumes default");
    CRADLE_EXPECT(config.api.grpc_max_send_msg_size == 80 * 1024 * 1024, "message size default");
    CRADLE_EXPECT(config.metrics.metrics_collectors == MetricsConfig::all_collectors(), "all collectors by default");
    CRADLE_EXPECT(config.root.clean_shutdown_supported_file_name() == "/var/lib/cradle/clean.shutdown.supported",
                  "clean shutdown marker name");
    return 0;
}

static int run_named_test(const char* name) {
    if (std::strcmp(name, "storage_options_fold_duplicates") == 0) return test_storage_options_fold_duplicates();
    if (std::strcmp(name, "remove_dup_storage_opts") == 0) return test_remove_dup_storage_opts();
    if (std::strcmp(name, "storage_locations_inherit") == 0) return test_storage_locations_inherit();
    if (std::strcmp(name, "handler_tables_merge_by_field") == 0) return test_handler_tables_merge_by_field();
    if (std::strcmp(name, "unknown_keys_ignored") == 0) return test_unknown_keys_ignored();
    if (std::strcmp(name, "wrong_type_names_key_and_source") == 0) return test_wrong_type_names_key_and_source();
    if (std::strcmp(name, "registries_dropped_with_warning") == 0) return test_registries_dropped_with_warning();
    if (std::strcmp(name, "drop_in_directory_order") == 0) return test_drop_in_directory_order();
    if (std::strcmp(name, "drop_in_directory_is_atomic") == 0) return test_drop_in_directory_is_atomic();
    if (std::strcmp(name, "missing_sources") == 0) return test_missing_sources();
    if (std::strcmp(name, "primary_file_remembered") == 0) return test_primary_file_remembered();
    if (std::strcmp(name, "environment_overrides") == 0) return test_environment_overrides();
    if (std::strcmp(name, "defaults") == 0) return test_defaults();
    return fail(std::string("unknown test name: ") + name);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        int rc = 0;
        rc |= test_storage_options_fold_duplicates();
        rc |= test_remove_dup_storage_opts();
        rc |= test_storage_locations_inherit();
        rc |= test_handler_tables_merge_by_field();
        rc |= test_unknown_keys_ignored();
        rc |= test_wrong_type_names_key_and_source();
        rc |= test_registries_dropped_with_warning();
        rc |= test_drop_in_directory_order();
        rc |= test_drop_in_directory_is_atomic();
        rc |= test_missing_sources();
        rc |= test_primary_file_remembered();
        rc |= test_environment_overrides();
        rc |= test_defaults();
        return rc;
    }
    return run_named_test(argv[1]);
}
