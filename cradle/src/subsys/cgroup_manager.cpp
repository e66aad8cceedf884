#include "cradle/subsys/cgroup_manager.h"

#include "cradle/config/constants.h"

namespace cradle {

Result<std::shared_ptr<const CgroupManager>> CgroupManager::create(const std::string& name) {
    if (name == CGROUP_MANAGER_SYSTEMD) {
        return std::make_shared<const SystemdCgroupManager>();
    }
    if (name == CGROUP_MANAGER_CGROUPFS) {
        return std::make_shared<const CgroupfsCgroupManager>();
    }
    return make_error(ErrorCode::INVALID_ARGUMENT, "invalid cgroup manager: " + name);
}

bool CgroupManager::is_valid_name(const std::string& name) {
    return name == CGROUP_MANAGER_SYSTEMD || name == CGROUP_MANAGER_CGROUPFS;
}

std::string SystemdCgroupManager::name() const {
    return std::string(CGROUP_MANAGER_SYSTEMD);
}

Status SystemdCgroupManager::validate_monitor_cgroup(const std::string& cgroup) const {
    if (cgroup == POD_CGROUP_TOKEN || cgroup.ends_with(SYSTEMD_SLICE_SUFFIX)) {
        return {};
    }
    return make_error(ErrorCode::INVALID_ARGUMENT, "monitor cgroup should be 'pod' or a systemd slice");
}

std::string CgroupfsCgroupManager::name() const {
    return std::string(CGROUP_MANAGER_CGROUPFS);
}

Status CgroupfsCgroupManager::validate_monitor_cgroup(const std::string& cgroup) const {
    if (cgroup == POD_CGROUP_TOKEN || cgroup.empty()) {
        return {};
    }
    return make_error(ErrorCode::INVALID_ARGUMENT, "cgroupfs manager monitor cgroup should be 'pod' or empty");
}

} // namespace cradle
