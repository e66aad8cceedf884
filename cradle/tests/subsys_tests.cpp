#include "test_support.h"

#include "cradle/subsys/apparmor.h"
#include "cradle/subsys/blockio.h"
#include "cradle/subsys/capabilities.h"
#include "cradle/subsys/cgroup_manager.h"
#include "cradle/subsys/cni_manager.h"
#include "cradle/subsys/cpuset.h"
#include "cradle/subsys/image_reference.h"
#include "cradle/subsys/monitor_manager.h"
#include "cradle/subsys/namespace_manager.h"
#include "cradle/subsys/rdt.h"
#include "cradle/subsys/resources.h"
#include "cradle/subsys/seccomp.h"
#include "cradle/utils/string_utils.h"

#include <cstring>
#include <thread>

using namespace cradle;
using cradle::testing::FakeHost;
using cradle::testing::fail;

static bool has(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// ============================================================================
// Parsed lists
// ============================================================================

static int test_capabilities() {
    auto caps = Capabilities::parse({"chown", "CAP_NET_RAW", " sys_admin ", "cap_chown"});
    if (!caps) {
        return fail("capabilities should parse: " + caps.error().message);
    }
    CRADLE_EXPECT((caps->names() == std::vector<std::string>{"CAP_CHOWN", "CAP_NET_RAW", "CAP_SYS_ADMIN"}),
                  "names normalized, order kept, duplicates folded");
    CRADLE_EXPECT(caps->contains("CAP_SYS_ADMIN"), "contains normalized name");

    auto unknown = Capabilities::parse({"KILL", "FLY"});
    CRADLE_EXPECT(!unknown, "unknown capability rejected");
    CRADLE_EXPECT(unknown.error().message == "unknown capability \"FLY\"", "error names the capability");

    auto defaults = Capabilities::parse(Capabilities::defaults());
    CRADLE_EXPECT(defaults && defaults->names().size() == Capabilities::defaults().size(), "defaults are valid");
    return 0;
}

static int test_ulimits() {
    auto nofile = parse_ulimit("nofile=1024:2048");
    CRADLE_EXPECT(nofile && nofile->name == "nofile" && nofile->soft == 1024 && nofile->hard == 2048,
                  "soft and hard parsed");

    auto prefixed = parse_ulimit("RLIMIT_NPROC=-1");
    CRADLE_EXPECT(prefixed && prefixed->name == "nproc" && prefixed->soft == -1 && prefixed->hard == -1,
                  "prefix stripped and single value applied to both");

    auto as = parse_ulimit("as=100:-1");
    CRADLE_EXPECT(as && as->hard == -1, "unlimited hard limit");

    CRADLE_EXPECT(!parse_ulimit("nofile"), "missing value");
    CRADLE_EXPECT(!parse_ulimit("nofile=2048:1024"), "soft above hard");
    CRADLE_EXPECT(!parse_ulimit("nofile=-1:1024"), "unlimited soft with finite hard");
    CRADLE_EXPECT(!parse_ulimit("nofile=many"), "non-numeric value");
    auto bogus = parse_ulimit("bogus=1");
    CRADLE_EXPECT(!bogus && bogus.error().message == "invalid ulimit type: bogus", "unknown type");

    UlimitsConfig config;
    auto status = config.load({"nofile=10:20", "core=0"});
    CRADLE_EXPECT(status.has_value() && config.ulimits().size() == 2, "ulimits loaded");
    status = config.load({"core=0", "bad"});
    CRADLE_EXPECT(!status && has(status.error().message, "unrecognized ulimit bad"), "load names the entry");
    return 0;
}

static int test_devices() {
    auto plain = parse_device("/dev/fuse");
    CRADLE_EXPECT(plain && plain->destination == "/dev/fuse" && plain->permissions == "rwm", "source only");

    auto perms = parse_device("/dev/sda:rw");
    CRADLE_EXPECT(perms && perms->destination == "/dev/sda" && perms->permissions == "rw", "permissions only");

    auto full = parse_device("/dev/sdc:/dev/xvdc:r");
    CRADLE_EXPECT(full && full->destination == "/dev/xvdc" && full->permissions == "r", "all three fields");

    CRADLE_EXPECT(!parse_device("dev/sda"), "relative source");
    CRADLE_EXPECT(!parse_device("/dev/sda:/dev/xvda:rx"), "bad permissions");
    CRADLE_EXPECT(!parse_device("/dev/sda:/dev/xvda:rw:extra"), "too many fields");
    CRADLE_EXPECT(!parse_device("/dev/sda:/dev/xvda:rrw"), "repeated permission");
    return 0;
}

static int test_sysctls() {
    auto parsed = parse_sysctls({"net.ipv4.ip_forward = 1", "kernel.msgmax=65536"});
    CRADLE_EXPECT(parsed && parsed->size() == 2, "sysctls parsed");
    CRADLE_EXPECT((*parsed)[0].key == "net.ipv4.ip_forward" && (*parsed)[0].value == "1", "whitespace trimmed");

    CRADLE_EXPECT(!parse_sysctl("kernel.msgmax"), "missing value");
    CRADLE_EXPECT(!parse_sysctl("=1"), "missing key");
    CRADLE_EXPECT(!parse_sysctl("kernel msgmax=1"), "space in key");
    return 0;
}

static int test_cpuset() {
    auto set = CpuSet::parse("7, 0-2,4");
    if (!set) {
        return fail("cpuset should parse: " + set.error().message);
    }
    CRADLE_EXPECT(set->size() == 5, "five cpus");
    CRADLE_EXPECT(set->contains(4) && !set->contains(3), "membership");
    CRADLE_EXPECT(set->max_cpu() == 7, "highest cpu");
    CRADLE_EXPECT(set->to_string() == "0-2,4,7", "canonical form");

    auto empty = CpuSet::parse("  ");
    CRADLE_EXPECT(empty && empty->empty() && empty->max_cpu() == -1, "blank list is empty");

    CRADLE_EXPECT(!CpuSet::parse("3-1"), "reversed range");
    CRADLE_EXPECT(!CpuSet::parse("a"), "non-numeric");
    CRADLE_EXPECT(!CpuSet::parse("-1"), "negative cpu");
    CRADLE_EXPECT(!CpuSet::parse("1,,2"), "empty field");
    return 0;
}

// ============================================================================
// Image references
// ============================================================================

static int test_image_reference() {
    auto pause = parse_image_reference("busybox");
    CRADLE_EXPECT(pause && pause->to_string() == "docker.io/library/busybox:latest", "short name normalized");

    auto tagged = parse_image_reference("registry.k8s.io/pause:3.9");
    CRADLE_EXPECT(tagged && tagged->domain == "registry.k8s.io" && tagged->path == "pause" && tagged->tag == "3.9",
                  "domain, path and tag split");

    auto port = parse_image_reference("localhost:5000/team/app");
    CRADLE_EXPECT(port && port->domain == "localhost:5000" && port->path == "team/app" && port->tag == "latest",
                  "registry port is not a tag");

    auto legacy = parse_image_reference("index.docker.io/library/alpine:3");
    CRADLE_EXPECT(legacy && legacy->name() == "docker.io/library/alpine", "legacy docker domain folded");

    std::string digest = "sha256:" + std::string(64, 'a');
    auto pinned = parse_image_reference("quay.io/app@" + digest);
    CRADLE_EXPECT(pinned && pinned->tag.empty() && pinned->digest == digest, "digest only");

    auto upper = parse_image_reference("Busybox");
    CRADLE_EXPECT(!upper && has(upper.error().message, "repository name must be lowercase"), "uppercase name");

    CRADLE_EXPECT(!parse_image_reference(""), "empty reference");
    CRADLE_EXPECT(!parse_image_reference(" busybox"), "leading whitespace");
    CRADLE_EXPECT(!parse_image_reference("busybox:bad tag"), "bad tag");
    CRADLE_EXPECT(!parse_image_reference("quay.io/app@sha256:short"), "short digest");
    return 0;
}

// ============================================================================
// Cgroup managers and monitor
// ============================================================================

static int test_cgroup_managers() {
    auto systemd = CgroupManager::create("systemd");
    CRADLE_EXPECT(systemd && (*systemd)->is_systemd() && (*systemd)->name() == "systemd", "systemd manager");
    CRADLE_EXPECT((*systemd)->validate_monitor_cgroup("pod").has_value(), "pod accepted by systemd");
    CRADLE_EXPECT((*systemd)->validate_monitor_cgroup("system.slice").has_value(), "slice accepted by systemd");
    CRADLE_EXPECT(!(*systemd)->validate_monitor_cgroup("").has_value(), "empty rejected by systemd");

    auto cgroupfs = CgroupManager::create("cgroupfs");
    CRADLE_EXPECT(cgroupfs && !(*cgroupfs)->is_systemd(), "cgroupfs manager");
    CRADLE_EXPECT((*cgroupfs)->validate_monitor_cgroup("").has_value(), "empty accepted by cgroupfs");
    CRADLE_EXPECT((*cgroupfs)->validate_monitor_cgroup("pod").has_value(), "pod accepted by cgroupfs");
    CRADLE_EXPECT(!(*cgroupfs)->validate_monitor_cgroup("system.slice").has_value(), "slice rejected by cgroupfs");

    CRADLE_EXPECT(!CgroupManager::create("lxcfs"), "unknown manager");
    CRADLE_EXPECT(!CgroupManager::is_valid_name("Systemd"), "names are case sensitive");
    return 0;
}

static int test_monitor_version() {
    auto version = parse_monitor_version("conmon version 2.1.10\ncommit: abc\n");
    CRADLE_EXPECT(version && version->to_string() == "2.1.10", "version parsed");

    auto old = parse_monitor_version("conmon version 2.0.2");
    CRADLE_EXPECT(old && *old < *version, "versions ordered");
    CRADLE_EXPECT(!parse_monitor_version("conmon 2.1"), "missing version keyword");

    MonitorManager legacy("/usr/bin/conmon", MonitorVersion{2, 0, 18});
    CRADLE_EXPECT(!legacy.supports_sync(), "sync needs 2.0.19");
    MonitorManager current("/usr/bin/conmon", MonitorVersion{2, 1, 2});
    CRADLE_EXPECT(current.supports_sync() && current.supports_log_global_size_max(), "feature gates");

    FakeHost host;
    host.add_executable("conmon", "/usr/bin/conmon");
    host.set_command("/usr/bin/conmon", {"--version"}, 0, "conmon version 2.1.12\n");
    auto created = MonitorManager::create("/usr/bin/conmon", host);
    CRADLE_EXPECT(created && created->version().to_string() == "2.1.12", "created from --version");

    host.set_command("/usr/bin/conmon", {"--version"}, 1, "");
    auto failed = MonitorManager::create("/usr/bin/conmon", host);
    CRADLE_EXPECT(!failed && failed.error().is(ErrorCode::IO_ERROR), "non-zero exit fails");
    return 0;
}

// ============================================================================
// Security profiles
// ============================================================================

static int test_seccomp() {
    FakeHost host;
    SeccompConfig config;
    CRADLE_EXPECT(config.is_default_profile(), "starts with the default profile");
    CRADLE_EXPECT(config.default_action() == "SCMP_ACT_ERRNO", "default action");
    CRADLE_EXPECT(config.syscall_rule_count() == 2, "default rules");

    auto missing = config.load_profile("/etc/missing.json", host);
    CRADLE_EXPECT(!missing && missing.error().is(ErrorCode::NOT_FOUND), "missing file is NOT_FOUND");
    CRADLE_EXPECT(config.is_default_profile(), "missing file leaves the profile");

    host.add_file("/etc/no-action.json", R"({"syscalls": []})");
    auto no_action = config.load_profile("/etc/no-action.json", host);
    CRADLE_EXPECT(!no_action && has(no_action.error().message, "no defaultAction"), "defaultAction required");

    host.add_file("/etc/bad-rule.json", R"({"defaultAction": "SCMP_ACT_ALLOW", "syscalls": [{"action": "SCMP_ACT_LOG"}]})");
    auto bad_rule = config.load_profile("/etc/bad-rule.json", host);
    CRADLE_EXPECT(!bad_rule && has(bad_rule.error().message, "names no syscalls"), "rule needs names");

    host.add_file("/etc/custom.json", R"({"defaultAction": "SCMP_ACT_LOG"})");
    auto custom = config.load_profile("/etc/custom.json", host);
    CRADLE_EXPECT(custom.has_value() && config.profile_path() == "/etc/custom.json", "custom profile loaded");
    CRADLE_EXPECT(config.default_action() == "SCMP_ACT_LOG" && config.syscall_rule_count() == 0, "custom content");

    config.load_default_profile();
    CRADLE_EXPECT(config.is_default_profile() && config.default_action() == "SCMP_ACT_ERRNO", "default restored");
    return 0;
}

static int test_apparmor() {
    FakeHost host;
    AppArmorConfig config;

    auto status = config.load_profile("anything", host);
    CRADLE_EXPECT(status.has_value() && !config.is_enabled(), "disabled host accepts any name");

    host.set_apparmor(true, {"loaded-profile"});
    status = config.load_profile("", host);
    CRADLE_EXPECT(status.has_value() && config.is_unconfined(), "empty name means unconfined");

    status = config.load_profile("cradle-default", host);
    CRADLE_EXPECT(status.has_value() && config.profile() == "cradle-default", "built-in profile");

    status = config.load_profile("loaded-profile", host);
    CRADLE_EXPECT(status.has_value() && config.is_enabled(), "loaded profile");

    status = config.load_profile("missing-profile", host);
    CRADLE_EXPECT(!status && status.error().is(ErrorCode::NOT_FOUND), "unloaded profile");
    return 0;
}

// ============================================================================
// Block I/O and RDT
// ============================================================================

static int test_blockio() {
    FakeHost host;
    BlockIOConfig config;

    CRADLE_EXPECT(config.load("", host).has_value() && !config.enabled(), "empty path disables");

    host.add_file("/etc/blockio.json", R"({
        "slowreads": [{"devices": ["/dev/sda", "/dev/sdb"], "throttlereadbps": "10M", "throttlereadiops": 500}],
        "lowprio": [{"devices": ["/dev/sda"], "weight": 80}]
    })");
    auto status = config.load("/etc/blockio.json", host);
    if (!status) {
        return fail("blockio config should load: " + status.error().message);
    }
    CRADLE_EXPECT(config.enabled(), "enabled");
    CRADLE_EXPECT((config.class_names() == std::vector<std::string>{"lowprio", "slowreads"}), "class names");
    const auto* slow = config.find_class("slowreads");
    CRADLE_EXPECT(slow && slow->size() == 1 && (*slow)[0].devices.size() == 2, "devices");
    CRADLE_EXPECT((*slow)[0].throttle_read_bps == std::optional<std::string>("10M"), "string throttle");
    CRADLE_EXPECT((*slow)[0].throttle_read_iops == std::optional<std::string>("500"), "numeric throttle");
    CRADLE_EXPECT(!(*slow)[0].throttle_write_bps.has_value(), "absent throttle");
    CRADLE_EXPECT(config.find_class("missing") == nullptr, "unknown class");

    host.add_file("/etc/heavy.json", R"({"heavy": [{"devices": ["/dev/sda"], "weight": 5000}]})");
    status = config.load("/etc/heavy.json", host);
    CRADLE_EXPECT(!status && has(status.error().message, "out of range"), "weight range");
    CRADLE_EXPECT(!config.enabled(), "failed load leaves block I/O disabled");

    CRADLE_EXPECT(!config.load("/etc/missing.json", host), "missing file");
    return 0;
}

static int test_rdt() {
    FakeHost host;
    host.set_resctrl_mounted(true);
    RdtConfig config;

    CRADLE_EXPECT(config.load("", host).has_value() && !config.enabled(), "empty path disables");

    host.add_file("/etc/rdt.json", R"({
        "partitions": {"default": {"classes": {"gold": {}, "silver": null}}},
        "classes": {"gold": {}, "bronze": {}}
    })");
    auto status = config.load("/etc/rdt.json", host);
    if (!status) {
        return fail("rdt config should load: " + status.error().message);
    }
    CRADLE_EXPECT(config.enabled(), "enabled");
    CRADLE_EXPECT((config.partitions() == std::vector<std::string>{"default"}), "partitions");
    CRADLE_EXPECT(config.classes().size() == 3, "classes merged without duplicates");

    host.add_file("/etc/empty-rdt.json", "{}");
    status = config.load("/etc/empty-rdt.json", host);
    CRADLE_EXPECT(!status && has(status.error().message, "defines neither partitions nor classes"), "empty document");

    host.set_resctrl_mounted(false);
    status = config.load("/etc/rdt.json", host);
    CRADLE_EXPECT(!status && status.error().is(ErrorCode::UNAVAILABLE), "resctrl must be mounted");
    return 0;
}

// ============================================================================
// Namespaces and CNI
// ============================================================================

static int test_namespace_manager() {
    auto host = std::make_shared<FakeHost>();
    NamespaceManager manager("/var/run", "/usr/bin/pinns", host);

    auto status = manager.initialize();
    CRADLE_EXPECT(status.has_value(), "directories created");
    for (const auto& type : NamespaceManager::managed_types()) {
        CRADLE_EXPECT(host->is_directory("/var/run/" + type + "ns"), "directory for " + type);
    }
    CRADLE_EXPECT(manager.directory_for("net") == "/var/run/netns", "directory naming");

    host->fail_mkdir("/var/run/utsns");
    status = manager.initialize();
    CRADLE_EXPECT(!status && status.error().is(ErrorCode::PERMISSION_DENIED), "mkdir failure reported");
    return 0;
}

static int test_cni_default_network() {
    auto host = std::make_shared<FakeHost>();
    host->add_file("/etc/cni/net.d/05-broken.conf", "{not json");
    host->add_file("/etc/cni/net.d/10-alpha.conf", R"({"name": "alpha"})");
    host->add_file("/etc/cni/net.d/20-beta.conflist", R"({"name": "beta", "plugins": []})");
    host->add_file("/etc/cni/net.d/README", R"({"name": "ignored"})");

    CniManager any("", "/etc/cni/net.d", {"/opt/cni/bin"}, host);
    any.start();
    CRADLE_EXPECT(any.ready_or_error().has_value(), "ready with any network");
    CRADLE_EXPECT(any.active_network() == "alpha", "first valid file wins");

    CniManager named("beta", "/etc/cni/net.d", {"/opt/cni/bin"}, host);
    named.start();
    CRADLE_EXPECT(named.active_network() == "beta", "default network selected by name");

    CniManager missing("gamma", "/etc/cni/net.d", {"/opt/cni/bin"}, host, std::chrono::milliseconds(10));
    missing.start();
    auto status = missing.ready_or_error();
    CRADLE_EXPECT(!status && has(status.error().message, "default network \"gamma\" not found"),
                  "missing default network explained");
    missing.shutdown();
    return 0;
}

static int test_cni_watcher() {
    auto host = std::make_shared<FakeHost>();
    host->add_dir("/etc/cni/net.d");

    CniManager manager("", "/etc/cni/net.d", {"/opt/cni/bin"}, host, std::chrono::milliseconds(10));
    manager.start();
    auto status = manager.ready_or_error();
    CRADLE_EXPECT(!status && has(status.error().message, "Has your network provider started?"), "not ready yet");

    auto watcher = manager.add_watcher();
    CRADLE_EXPECT(!watcher->try_receive().has_value(), "nothing received yet");

    host->add_file("/etc/cni/net.d/10-bridge.conflist", R"({"name": "bridge"})");
    auto ready = watcher->wait_for(std::chrono::seconds(5));
    CRADLE_EXPECT(ready.has_value() && *ready, "watcher notified once a network appears");
    CRADLE_EXPECT(manager.ready_or_error().has_value(), "manager ready");
    CRADLE_EXPECT(manager.active_network() == "bridge", "network recorded");

    auto late = manager.add_watcher();
    CRADLE_EXPECT(late->try_receive() == std::optional<bool>(true), "late watcher notified immediately");
    manager.shutdown();
    return 0;
}

static int test_cni_shutdown_while_waiting() {
    auto host = std::make_shared<FakeHost>();
    host->add_dir("/etc/cni/net.d");

    auto manager = std::make_unique<CniManager>("", "/etc/cni/net.d", std::vector<std::string>{}, host,
                                                std::chrono::seconds(60));
    manager->start();
    auto watcher = manager->add_watcher();
    manager.reset();
    CRADLE_EXPECT(!watcher->try_receive().has_value(), "no readiness after shutdown");
    return 0;
}

static int test_cni_concurrent_shutdown() {
    auto host = std::make_shared<FakeHost>();
    host->add_dir("/etc/cni/net.d");

    CniManager manager("", "/etc/cni/net.d", std::vector<std::string>{}, host, std::chrono::seconds(60));
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&manager, i] {
            if (i % 2 == 0) {
                manager.start();
            }
            manager.shutdown();
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    manager.start();
    manager.shutdown();
    CRADLE_EXPECT(!manager.ready_or_error().has_value(), "no network without a config file");
    auto watcher = manager.add_watcher();
    CRADLE_EXPECT(!watcher->try_receive().has_value(), "no readiness after shutdown");
    return 0;
}

// ============================================================================
// Utilities
// ============================================================================

static int test_string_utils() {
    CRADLE_EXPECT(parse_duration("150ms") == std::chrono::milliseconds(150), "milliseconds");
    CRADLE_EXPECT(parse_duration("2min") == std::chrono::milliseconds(120000), "minutes");
    CRADLE_EXPECT(parse_duration("1h") == std::chrono::milliseconds(3600000), "hours");
    CRADLE_EXPECT(parse_duration("1.5s") == std::chrono::milliseconds(1500), "fractions");
    CRADLE_EXPECT(parse_duration("1m30s") == std::chrono::milliseconds(90000), "compound minutes and seconds");
    CRADLE_EXPECT(parse_duration("2h45m") == std::chrono::milliseconds(9900000), "compound hours and minutes");
    CRADLE_EXPECT(parse_duration("1h30m") == std::chrono::milliseconds(5400000), "compound hours and minutes");
    CRADLE_EXPECT(parse_duration("0") == std::chrono::milliseconds(0), "bare zero");
    CRADLE_EXPECT(parse_duration("500us") == std::chrono::milliseconds(0), "sub-millisecond truncated");
    CRADLE_EXPECT(!parse_duration("9999999999999999h"), "overflow rejected");
    CRADLE_EXPECT(!parse_duration("99999999999999999999s"), "oversized number rejected");
    CRADLE_EXPECT(!parse_duration(""), "empty rejected");
    CRADLE_EXPECT(!parse_duration("1s2"), "trailing number rejected");
    CRADLE_EXPECT(!parse_duration("1.s"), "empty fraction rejected");
    CRADLE_EXPECT(!parse_duration("-1s"), "negative rejected");
    CRADLE_EXPECT(!parse_duration("5"), "unit required");

    CRADLE_EXPECT(parse_int("+42") == 42LL && !parse_int("42x") && !parse_int(""), "integers");
    CRADLE_EXPECT(parse_bool("Yes") == true && parse_bool("off") == false && !parse_bool("maybe"), "booleans");
    CRADLE_EXPECT((split("a::b", ':') == std::vector<std::string>{"a", "", "b"}), "split keeps empty fields");
    CRADLE_EXPECT(join({"a", "b"}, ", ") == "a, b", "join");
    CRADLE_EXPECT(trim("\t x \n") == "x", "trim");

    Error error(ErrorCode::NOT_FOUND, "missing");
    auto wrapped = error.wrap("outer").wrap("");
    CRADLE_EXPECT(wrapped.message == "outer: missing" && wrapped.is(ErrorCode::NOT_FOUND), "wrap keeps the code");
    CRADLE_EXPECT(wrapped.to_string() == "[not_found] outer: missing", "error rendering");
    return 0;
}

static int run_named_test(const char* name) {
    if (std::strcmp(name, "capabilities") == 0) return test_capabilities();
    if (std::strcmp(name, "ulimits") == 0) return test_ulimits();
    if (std::strcmp(name, "devices") == 0) return test_devices();
    if (std::strcmp(name, "sysctls") == 0) return test_sysctls();
    if (std::strcmp(name, "cpuset") == 0) return test_cpuset();
    if (std::strcmp(name, "image_reference") == 0) return test_image_reference();
    if (std::strcmp(name, "cgroup_managers") == 0) return test_cgroup_managers();
    if (std::strcmp(name, "monitor_version") == 0) return test_monitor_version();
    if (std::strcmp(name, "seccomp") == 0) return test_seccomp();
    if (std::strcmp(name, "apparmor") == 0) return test_apparmor();
    if (std::strcmp(name, "blockio") == 0) return test_blockio();
    if (std::strcmp(name, "rdt") == 0) return test_rdt();
    if (std::strcmp(name, "namespace_manager") == 0) return test_namespace_manager();
    if (std::strcmp(name, "cni_default_network") == 0) return test_cni_default_network();
    if (std::strcmp(name, "cni_watcher") == 0) return test_cni_watcher();
    if (std::strcmp(name, "cni_shutdown_while_waiting") == 0) return test_cni_shutdown_while_waiting();
    if (std::strcmp(name, "cni_concurrent_shutdown") == 0) return test_cni_concurrent_shutdown();
    if (std::strcmp(name, "string_utils") == 0) return test_string_utils();
    return fail(std::string("unknown test name: ") + name);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        static const char* const all[] = {
            "capabilities", "ulimits", "devices", "sysctls", "cpuset", "image_reference",
            "cgroup_managers", "monitor_version", "seccomp", "apparmor", "blockio", "rdt",
            "namespace_manager", "cni_default_network", "cni_watcher", "cni_shutdown_while_waiting",
            "cni_concurrent_shutdown", "string_utils",
        };
        int rc = 0;
        for (const char* name : all) {
            rc |= run_named_test(name);
        }
        return rc;
    }
    return run_named_test(argv[1]);
}
