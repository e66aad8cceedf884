#include "cradle/subsys/namespace_manager.h"

#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

namespace cradle {

NamespaceManager::NamespaceManager(std::string namespaces_dir, std::string pinns_path,
                                   std::shared_ptr<HostEnvironment> host)
    : namespaces_dir_(std::move(namespaces_dir))
    , pinns_path_(std::move(pinns_path))
    , host_(std::move(host)) {
}

Status NamespaceManager::initialize() {
    auto& logger = LoggerFactory::get_logger("cradle.nsmgr");

    for (const auto& ns_type : managed_types()) {
        auto dir = directory_for(ns_type);
        if (auto status = host_->mkdir_all(dir, 0755); !status) {
            return wrap_error(status.error(), "invalid namespaces_dir");
        }
        CRADLE_DEBUG(logger, "Namespace directory ready: " + dir);
    }
    return {};
}

std::string NamespaceManager::directory_for(const std::string& ns_type) const {
    return namespaces_dir_ + "/" + ns_type + "ns";
}

const std::vector<std::string>& NamespaceManager::managed_types() {
    static const std::vector<std::string> types = {"ipc", "net", "uts", "user", "pid"};
    return types;
}

} // namespace cradle
