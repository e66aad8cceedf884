#pragma once

#include "cradle/utils/error.h"

#include <memory>
#include <string>

namespace cradle {

/**
 * @brief Cgroup placement strategy selected by cgroup_manager
 */
class CgroupManager {
public:
    virtual ~CgroupManager() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual bool is_systemd() const = 0;

    /**
     * @brief Check where a handler's monitor process may be placed
     */
    [[nodiscard]] virtual Status validate_monitor_cgroup(const std::string& cgroup) const = 0;

    /**
     * @brief Build the manager named by cgroup_manager ("systemd" or "cgroupfs")
     */
    [[nodiscard]] static Result<std::shared_ptr<const CgroupManager>> create(const std::string& name);

    [[nodiscard]] static bool is_valid_name(const std::string& name);
};

class SystemdCgroupManager : public CgroupManager {
public:
    [[nodiscard]] std::string name() const override;
    [[nodiscard]] bool is_systemd() const override { return true; }
    [[nodiscard]] Status validate_monitor_cgroup(const std::string& cgroup) const override;
};

class CgroupfsCgroupManager : public CgroupManager {
public:
    [[nodiscard]] std::string name() const override;
    [[nodiscard]] bool is_systemd() const override { return false; }
    [[nodiscard]] Status validate_monitor_cgroup(const std::string& cgroup) const override;
};

} // namespace cradle
