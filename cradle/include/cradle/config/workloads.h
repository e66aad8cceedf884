#pragma once

#include "cradle/utils/error.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cradle {

/**
 * @brief Default resources applied to containers of a workload
 */
struct WorkloadResources {
    int64_t cpushares = 0;
    int64_t cpuquota = 0;
    int64_t cpuperiod = 0;
    std::string cpuset;

    bool operator==(const WorkloadResources&) const = default;
};

/**
 * @brief Workload selected by an activation annotation on the pod
 */
struct WorkloadConfig {
    std::string activation_annotation;
    std::string annotation_prefix;
    std::vector<std::string> allowed_annotations;
    WorkloadResources resources;

    // Derived during validation, never serialized
    std::vector<std::string> disallowed_annotations;

    Status validate(const std::string& name);

    /// Compares serialized fields only.
    bool operator==(const WorkloadConfig& other) const;
};

using Workloads = std::map<std::string, WorkloadConfig>;

/**
 * @brief Validate every workload, naming the failing one
 */
Status validate_workloads(Workloads& workloads);

/**
 * @brief Workload whose activation annotation appears in a pod's annotations
 */
[[nodiscard]] const WorkloadConfig* workload_for_pod(const Workloads& workloads,
                                                     const std::map<std::string, std::string>& pod_annotations);

} // namespace cradle
