#pragma once

#include "cradle/utils/error.h"

#include <string>
#include <vector>

namespace cradle {

// ============================================================================
// Recognized Annotations
// ============================================================================

inline constexpr const char* ANNOTATION_USERNS_MODE = "io.kubernetes.cri-o.userns-mode";
inline constexpr const char* ANNOTATION_CGROUP2_RW = "io.kubernetes.cri-o.cgroup2-mount-hierarchy-rw";
inline constexpr const char* ANNOTATION_UNIFIED_CGROUP = "io.kubernetes.cri-o.UnifiedCgroup";
inline constexpr const char* ANNOTATION_SHM_SIZE = "io.kubernetes.cri-o.ShmSize";
inline constexpr const char* ANNOTATION_OCI_SECCOMP_BPF_HOOK = "io.containers.trace-syscall";
inline constexpr const char* ANNOTATION_RDT_CLASS = "io.kubernetes.cri.rdt-class";
inline constexpr const char* ANNOTATION_TRY_SKIP_SELINUX_LABEL = "io.kubernetes.cri-o.TrySkipVolumeSELinuxLabel";
inline constexpr const char* ANNOTATION_CDI_PREFIX = "cdi.k8s.io";
inline constexpr const char* ANNOTATION_SECCOMP_NOTIFIER_ACTION = "io.kubernetes.cri-o.seccompNotifierAction";
inline constexpr const char* ANNOTATION_CPU_QUOTA = "cpu-quota.crio.io";
inline constexpr const char* ANNOTATION_IRQ_LOAD_BALANCING = "irq-load-balancing.crio.io";
inline constexpr const char* ANNOTATION_CPU_LOAD_BALANCING = "cpu-load-balancing.crio.io";
inline constexpr const char* ANNOTATION_CPU_C_STATES = "cpu-c-states.crio.io";
inline constexpr const char* ANNOTATION_CPU_FREQ_GOVERNOR = "cpu-freq-governor.crio.io";
inline constexpr const char* ANNOTATION_POD_LINUX_OVERHEAD = "io.kubernetes.cri-o.PodLinuxOverhead";
inline constexpr const char* ANNOTATION_POD_LINUX_RESOURCES = "io.kubernetes.cri-o.PodLinuxResources";
inline constexpr const char* ANNOTATION_LINK_LOGS = "io.kubernetes.cri-o.LinkLogs";
inline constexpr const char* ANNOTATION_CPU_SHARED = "cpu-shared.crio.io";
inline constexpr const char* ANNOTATION_SECCOMP_PROFILE = "seccomp-profile.kubernetes.cri-o.io";
inline constexpr const char* ANNOTATION_DEVICES = "io.kubernetes.cri-o.Devices";

/**
 * @brief Every annotation a runtime handler or workload may allow
 */
[[nodiscard]] const std::vector<std::string>& all_allowed_annotations();

[[nodiscard]] bool is_known_annotation(const std::string& annotation);

/**
 * @brief Check every entry against the recognized set; repeats are invalid too
 */
[[nodiscard]] Status validate_allowed_annotations(const std::vector<std::string>& allowed);

/**
 * @brief Recognized annotations not present in the allowed list, sorted
 *
 * Fails on the first allowed entry that is not recognized or is repeated.
 */
[[nodiscard]] Result<std::vector<std::string>> disallowed_annotations_for(const std::vector<std::string>& allowed);

} // namespace cradle
