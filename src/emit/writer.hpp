#pragma once

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <string>

namespace arazzo::emit {

std::string write_json(nlohmann::ordered_json const &tree, int indent = 2);

/**
 * @brief Renders a yaml-cpp tree as block style YAML text.
 *
 * String scalars whose plain text would read back as null, bool or a number
 * are double quoted so the text parses into the same tree.
 */
std::string write_yaml(YAML::Node const &tree);

} // namespace arazzo::emit
