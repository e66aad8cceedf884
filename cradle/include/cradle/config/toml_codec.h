#pragma once

#include "cradle/utils/error.h"

#include <string>

namespace cradle {

class Configuration;

/**
 * @brief Fold TOML content onto a configuration
 *
 * Only keys present in the content are written; unknown keys are ignored.
 * A key holding the wrong TOML type fails with PARSE_ERROR naming the key
 * and the source. The configuration may be partially written on failure,
 * so callers decode into a copy.
 */
Status decode_toml(const std::string& content, const std::string& source, Configuration& config);

/**
 * @brief Render every serialized field of a configuration
 *
 * Handler and workload tables come out in key order; derived fields
 * (disallowed annotations, feature records) are never written.
 */
[[nodiscard]] std::string encode_toml(const Configuration& config);

/**
 * @brief TOML basic string literal, quoted and escaped
 */
[[nodiscard]] std::string quote_toml_string(const std::string& value);

/**
 * @brief Key as written in a table header or assignment; quoted unless bare
 */
[[nodiscard]] std::string toml_key(const std::string& key);

} // namespace cradle
