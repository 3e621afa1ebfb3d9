#pragma once

#include <model/descriptors.hpp>
#include <tree/kind.hpp>
#include <tree/path.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arazzo::tree {

/**
 * @brief Read-only view of a nlohmann::ordered_json value.
 *
 * Does not own the value; the tree must outlive every node taken from it.
 * Map and sequence accessors throw ShapeMismatch when used on the wrong kind.
 */
class JsonNode {
    nlohmann::ordered_json const *value_;
    Path path_;

public:
    explicit JsonNode(nlohmann::ordered_json const &value, Path const &path = {});

    Path const &path() const {
        return path_;
    }

    NodeKind kind() const;

    std::optional<JsonNode> find(std::string const &key) const;
    std::vector<std::pair<std::string, JsonNode>> entries() const;
    std::vector<JsonNode> elements() const;

    std::optional<std::string> as_string() const;
    std::optional<bool> as_bool() const;
    std::optional<std::int64_t> as_integer() const;
    std::optional<double> as_number() const;

    model::any_value_t to_value() const;
};

} // namespace arazzo::tree
