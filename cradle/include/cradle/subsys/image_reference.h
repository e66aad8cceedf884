#pragma once

#include "cradle/utils/error.h"

#include <string>

namespace cradle {

inline constexpr const char* DEFAULT_REGISTRY_DOMAIN = "docker.io";
inline constexpr const char* OFFICIAL_REPOSITORY_PREFIX = "library/";
inline constexpr const char* DEFAULT_TAG = "latest";

/**
 * @brief Fully qualified registry image reference
 */
struct ImageReference {
    std::string domain;   ///< Registry host, optionally with port
    std::string path;     ///< Repository path below the domain
    std::string tag;      ///< Empty when only a digest was given
    std::string digest;   ///< "<algorithm>:<hex>", or empty

    /// domain/path
    [[nodiscard]] std::string name() const;

    /// name[:tag][@digest]
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ImageReference&) const = default;
};

/**
 * @brief Parse and normalize a reference the way the docker CLI does
 *
 * "busybox" becomes "docker.io/library/busybox:latest"; a reference with
 * neither tag nor digest gets the "latest" tag.
 */
[[nodiscard]] Result<ImageReference> parse_image_reference(const std::string& reference);

} // namespace cradle
