#pragma once

#include "cradle/utils/error.h"

#include <memory>
#include <string>
#include <vector>

namespace cradle {

class HostEnvironment;

/**
 * @brief Owns the directories that pinned pod namespaces are bind-mounted into
 */
class NamespaceManager {
public:
    NamespaceManager(std::string namespaces_dir, std::string pinns_path,
                     std::shared_ptr<HostEnvironment> host);

    /**
     * @brief Create <namespaces_dir>/<type>ns for every managed namespace type
     */
    Status initialize();

    [[nodiscard]] const std::string& namespaces_dir() const { return namespaces_dir_; }
    [[nodiscard]] const std::string& pinns_path() const { return pinns_path_; }
    [[nodiscard]] std::string directory_for(const std::string& ns_type) const;

    [[nodiscard]] static const std::vector<std::string>& managed_types();

private:
    std::string namespaces_dir_;
    std::string pinns_path_;
    std::shared_ptr<HostEnvironment> host_;
};

} // namespace cradle
