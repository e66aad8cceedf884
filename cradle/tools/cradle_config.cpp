// cradle-config: assemble, validate and print the node configuration.

#include "cradle/config/config_store.h"
#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

#include <cstring>
#include <iostream>
#include <string>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

void print_usage() {
    std::cerr << "usage: cradle-config [--config FILE] [--config-dir DIR] [--storage-conf FILE] <print|validate|check>\n"
              << "\n"
              << "  print     merge and statically validate, then print the configuration as TOML\n"
              << "  validate  merge and statically validate, then print OK or the error\n"
              << "  check     merge and validate against this host, then print a summary\n";
}

void print_summary(const cradle::ResolvedConfig& resolved) {
    const auto& config = resolved.config();
    const auto& subsystems = resolved.subsystems();

    std::cout << "default runtime: " << config.runtime.default_runtime << "\n";
    for (const auto& [name, handler] : config.runtime.runtimes) {
        std::cout << "runtime " << name << ": " << handler.runtime_path
                  << " (" << cradle::to_string(handler.type()) << ")";
        if (auto monitor = resolved.monitor_for(name)) {
            std::cout << ", monitor " << monitor->path() << " " << monitor->version().to_string();
        }
        std::cout << ", features " << (handler.features ? "probed" : "unavailable")
                  << ", idmap " << (handler.supports_idmap() ? "yes" : "no") << "\n";
    }

    std::cout << "storage: " << config.root.storage_driver << " at " << config.root.root
              << " (run root " << config.root.runroot << ")\n";
    if (subsystems.cgroup_manager) {
        std::cout << "cgroup manager: " << subsystems.cgroup_manager->name() << "\n";
    }
    if (subsystems.seccomp) {
        std::cout << "seccomp: " << (subsystems.seccomp->is_default_profile() ? "default profile"
                                                                              : subsystems.seccomp->profile_path())
                  << ", " << subsystems.seccomp->syscall_rule_count() << " rules\n";
    }
    if (subsystems.apparmor) {
        std::cout << "apparmor: "
                  << (subsystems.apparmor->is_enabled() ? subsystems.apparmor->profile() : std::string("disabled"))
                  << "\n";
    }
    if (subsystems.capabilities) {
        std::cout << "capabilities: " << subsystems.capabilities->names().size() << " default\n";
    }
    if (subsystems.infra_ctr_cpuset) {
        std::cout << "infra cpuset: " << subsystems.infra_ctr_cpuset->to_string() << "\n";
    }
    if (auto network = resolved.network_ready_or_error(); network) {
        std::cout << "network: ready\n";
    } else {
        std::cout << "network: " << network.error().message << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    cradle::ConfigSources sources;
    std::string command;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            sources.config_file = argv[++i];
        } else if (std::strcmp(arg, "--config-dir") == 0 && i + 1 < argc) {
            sources.config_dir = argv[++i];
        } else if (std::strcmp(arg, "--storage-conf") == 0 && i + 1 < argc) {
            sources.storage_conf = argv[++i];
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_usage();
            return EXIT_OK;
        } else if (arg[0] != '-' && command.empty()) {
            command = arg;
        } else {
            print_usage();
            return EXIT_USAGE;
        }
    }

    if (command != "print" && command != "validate" && command != "check") {
        print_usage();
        return EXIT_USAGE;
    }

    auto host = cradle::make_linux_host();

    cradle::ValidationContext ctx;
    ctx.host = host;
    if (command == "check") {
        ctx.mode = cradle::ValidationMode::EXECUTION;
        ctx.store = std::make_shared<cradle::LocalStore>(host);
    }

    cradle::ConfigStore store(sources, ctx);
    if (auto status = store.load(); !status) {
        std::cerr << "invalid configuration: " << status.error().message << "\n";
        return EXIT_INVALID;
    }
    auto resolved = store.current();

    if (command == "print") {
        std::cout << resolved->config().to_toml();
    } else if (command == "validate") {
        std::cout << "OK\n";
    } else {
        print_summary(*resolved);
    }

    cradle::LoggerFactory::flush_all();
    return EXIT_OK;
}
