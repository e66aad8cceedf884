#include "cradle/config/annotations.h"

#include <algorithm>
#include <set>

namespace cradle {

const std::vector<std::string>& all_allowed_annotations() {
    static const std::vector<std::string> annotations = {
        ANNOTATION_USERNS_MODE,
        ANNOTATION_CGROUP2_RW,
        ANNOTATION_UNIFIED_CGROUP,
        ANNOTATION_SHM_SIZE,
        ANNOTATION_OCI_SECCOMP_BPF_HOOK,
        ANNOTATION_RDT_CLASS,
        ANNOTATION_TRY_SKIP_SELINUX_LABEL,
        ANNOTATION_CDI_PREFIX,
        ANNOTATION_SECCOMP_NOTIFIER_ACTION,
        ANNOTATION_CPU_QUOTA,
        ANNOTATION_IRQ_LOAD_BALANCING,
        ANNOTATION_CPU_LOAD_BALANCING,
        ANNOTATION_CPU_C_STATES,
        ANNOTATION_CPU_FREQ_GOVERNOR,
        ANNOTATION_POD_LINUX_OVERHEAD,
        ANNOTATION_POD_LINUX_RESOURCES,
        ANNOTATION_LINK_LOGS,
        ANNOTATION_CPU_SHARED,
        ANNOTATION_SECCOMP_PROFILE,
        ANNOTATION_DEVICES,
    };
    return annotations;
}

bool is_known_annotation(const std::string& annotation) {
    const auto& known = all_allowed_annotations();
    return std::find(known.begin(), known.end(), annotation) != known.end();
}

Status validate_allowed_annotations(const std::vector<std::string>& allowed) {
    // A repeated entry is rejected like an unknown one.
    std::set<std::string> seen;
    for (const auto& annotation : allowed) {
        if (!is_known_annotation(annotation) || !seen.insert(annotation).second) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "invalid allowed_annotation: " + annotation);
        }
    }
    return {};
}

Result<std::vector<std::string>> disallowed_annotations_for(const std::vector<std::string>& allowed) {
    if (auto status = validate_allowed_annotations(allowed); !status) {
        return std::unexpected(status.error());
    }

    std::set<std::string> allowed_set(allowed.begin(), allowed.end());
    std::vector<std::string> disallowed;
    for (const auto& annotation : all_allowed_annotations()) {
        if (!allowed_set.contains(annotation)) {
            disallowed.push_back(annotation);
        }
    }
    std::sort(disallowed.begin(), disallowed.end());
    return disallowed;
}

} // namespace cradle
