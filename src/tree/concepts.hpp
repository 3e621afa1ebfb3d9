#pragma once

#include <model/descriptors.hpp>
#include <tree/kind.hpp>
#include <tree/path.hpp>

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arazzo::tree {

// clang-format off
template <typename T>
concept TreeNode = requires(T const n, std::string const &key) {
    { n.path() } -> std::convertible_to<Path>;
    { n.kind() } -> std::same_as<NodeKind>;
    { n.find(key) } -> std::same_as<std::optional<T>>;
    { n.entries() } -> std::same_as<std::vector<std::pair<std::string, T>>>;
    { n.elements() } -> std::same_as<std::vector<T>>;
    { n.as_string() } -> std::same_as<std::optional<std::string>>;
    { n.as_bool() } -> std::same_as<std::optional<bool>>;
    { n.as_integer() } -> std::same_as<std::optional<std::int64_t>>;
    { n.as_number() } -> std::same_as<std::optional<double>>;
    { n.to_value() } -> std::same_as<model::any_value_t>;
};
// clang-format on

} // namespace arazzo::tree
