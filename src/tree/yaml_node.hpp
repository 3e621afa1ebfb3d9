#pragma once

#include <model/descriptors.hpp>
#include <tree/kind.hpp>
#include <tree/path.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arazzo::tree {

/**
 * @brief Read-only view of a yaml-cpp node.
 *
 * Plain scalars are typed with the YAML 1.2 core schema (null, bool, int,
 * float, otherwise string). Quoted or `!!str` tagged scalars are always
 * strings. Any scalar, typed or not, can be read back as its text via
 * as_string() since YAML string fields are not required to be quoted.
 */
class YamlNode {
    YAML::Node node_;
    Path path_;

public:
    explicit YamlNode(YAML::Node const &node, Path const &path = {});

    Path const &path() const {
        return path_;
    }

    NodeKind kind() const;

    std::optional<YamlNode> find(std::string const &key) const;
    std::vector<std::pair<std::string, YamlNode>> entries() const;
    std::vector<YamlNode> elements() const;

    std::optional<std::string> as_string() const;
    std::optional<bool> as_bool() const;
    std::optional<std::int64_t> as_integer() const;
    std::optional<double> as_number() const;

    model::any_value_t to_value() const;
};

/**
 * @brief Converts an opaque value back into a yaml-cpp node.
 *
 * String scalars are tagged non-specific (`!`) so that YamlNode reads them
 * back as strings even when their text looks like a number, bool or null.
 */
YAML::Node to_yaml(model::any_value_t const &value);

} // namespace arazzo::tree
