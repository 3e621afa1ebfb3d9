#pragma once

#include <model/descriptors.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace arazzo {

/**
 * @brief Builds and validates a document from a parsed JSON tree.
 *
 * Throws a DocumentException subclass describing the first problem found.
 */
model::Description parse_document(nlohmann::ordered_json const &tree);

/**
 * @brief Builds and validates a document from a parsed YAML tree.
 *
 * Throws a DocumentException subclass describing the first problem found.
 */
model::Description parse_document(YAML::Node const &tree);

} // namespace arazzo
