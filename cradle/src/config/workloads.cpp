#include "cradle/config/workloads.h"

#include "cradle/config/annotations.h"
#include "cradle/subsys/cpuset.h"

namespace cradle {

Status WorkloadConfig::validate(const std::string& name) {
    if (activation_annotation.empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "annotation shouldn't be empty for workload \"" + name + "\"");
    }

    auto disallowed = disallowed_annotations_for(allowed_annotations);
    if (!disallowed) {
        return std::unexpected(disallowed.error());
    }

    if (auto cpuset = CpuSet::parse(resources.cpuset); !cpuset) {
        return wrap_error(cpuset.error(), "invalid cpuset for workload \"" + name + "\"");
    }
    if (resources.cpushares < 0 || resources.cpuquota < -1 || resources.cpuperiod < 0) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "negative cpu resources for workload \"" + name + "\"");
    }

    disallowed_annotations = std::move(*disallowed);
    return {};
}

bool WorkloadConfig::operator==(const WorkloadConfig& other) const {
    return activation_annotation == other.activation_annotation &&
           annotation_prefix == other.annotation_prefix &&
           allowed_annotations == other.allowed_annotations &&
           resources == other.resources;
}

Status validate_workloads(Workloads& workloads) {
    for (auto& [name, workload] : workloads) {
        if (auto status = workload.validate(name); !status) {
            return status;
        }
    }
    return {};
}

const WorkloadConfig* workload_for_pod(const Workloads& workloads,
                                       const std::map<std::string, std::string>& pod_annotations) {
    for (const auto& [name, workload] : workloads) {
        if (pod_annotations.contains(workload.activation_annotation)) {
            return &workload;
        }
    }
    return nullptr;
}

} // namespace cradle
