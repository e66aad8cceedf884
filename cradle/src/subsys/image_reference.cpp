#include "cradle/subsys/image_reference.h"

#include "cradle/utils/string_utils.h"

#include <regex>

namespace cradle {

namespace {

constexpr size_t MAX_NAME_LENGTH = 255;

const std::regex& domain_regex() {
    static const std::regex re(
        R"(^(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])(?:\.(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9]))*(?::[0-9]+)?$)");
    return re;
}

const std::regex& path_component_regex() {
    static const std::regex re(R"(^[a-z0-9]+(?:(?:[._]|__|[-]+)[a-z0-9]+)*$)");
    return re;
}

const std::regex& tag_regex() {
    static const std::regex re(R"(^[\w][\w.-]{0,127}$)");
    return re;
}

const std::regex& digest_regex() {
    static const std::regex re(R"(^[a-z0-9]+(?:[.+_-][a-z0-9]+)*:[a-fA-F0-9]{32,}$)");
    return re;
}

bool looks_like_domain(const std::string& component) {
    return component.find('.') != std::string::npos ||
           component.find(':') != std::string::npos ||
           component == "localhost";
}

} // anonymous namespace

std::string ImageReference::name() const {
    return domain + "/" + path;
}

std::string ImageReference::to_string() const {
    std::string out = name();
    if (!tag.empty()) {
        out += ":" + tag;
    }
    if (!digest.empty()) {
        out += "@" + digest;
    }
    return out;
}

Result<ImageReference> parse_image_reference(const std::string& reference) {
    if (reference.empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid reference format: empty reference");
    }
    if (trim(reference) != reference) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid reference format: " + reference);
    }

    ImageReference ref;
    std::string remainder = reference;

    if (auto at = remainder.find('@'); at != std::string::npos) {
        ref.digest = remainder.substr(at + 1);
        remainder = remainder.substr(0, at);
        if (!std::regex_match(ref.digest, digest_regex())) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "invalid digest in reference: " + reference);
        }
    }

    auto last_slash = remainder.rfind('/');
    auto tag_colon = remainder.rfind(':');
    if (tag_colon != std::string::npos && (last_slash == std::string::npos || tag_colon > last_slash)) {
        ref.tag = remainder.substr(tag_colon + 1);
        remainder = remainder.substr(0, tag_colon);
        if (!std::regex_match(ref.tag, tag_regex())) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "invalid tag in reference: " + reference);
        }
    }

    auto first_slash = remainder.find('/');
    if (first_slash != std::string::npos && looks_like_domain(remainder.substr(0, first_slash))) {
        ref.domain = remainder.substr(0, first_slash);
        ref.path = remainder.substr(first_slash + 1);
    } else {
        ref.domain = DEFAULT_REGISTRY_DOMAIN;
        ref.path = remainder;
    }

    if (ref.domain == "index.docker.io") {
        ref.domain = DEFAULT_REGISTRY_DOMAIN;
    }
    if (ref.domain == DEFAULT_REGISTRY_DOMAIN && ref.path.find('/') == std::string::npos) {
        ref.path = OFFICIAL_REPOSITORY_PREFIX + ref.path;
    }

    if (!std::regex_match(ref.domain, domain_regex())) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid domain in reference: " + reference);
    }

    if (ref.path.empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid reference format: " + reference);
    }
    for (const auto& component : split(ref.path, '/')) {
        if (!std::regex_match(component, path_component_regex())) {
            if (to_lower(component) != component) {
                return make_error(ErrorCode::INVALID_ARGUMENT,
                                  "invalid reference format: repository name must be lowercase: " + reference);
            }
            return make_error(ErrorCode::INVALID_ARGUMENT, "invalid reference format: " + reference);
        }
    }

    if (ref.name().size() > MAX_NAME_LENGTH) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "repository name must not be more than 255 characters: " + reference);
    }

    if (ref.tag.empty() && ref.digest.empty()) {
        ref.tag = DEFAULT_TAG;
    }
    return ref;
}

} // namespace cradle
