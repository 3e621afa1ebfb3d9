#pragma once

#include <model/descriptors.hpp>
#include <model/exceptions.hpp>
#include <model/literals.hpp>
#include <tree/concepts.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arazzo::parse {

template <tree::TreeNode NodeType>
NodeType const &expect_map(NodeType const &node) {
    if(node.kind() != NodeKind::MAP)
        throw ShapeMismatch(node.path(), NodeKind::MAP, node.kind());
    return node;
}

template <tree::TreeNode NodeType>
std::vector<NodeType> expect_sequence(NodeType const &node) {
    if(node.kind() != NodeKind::SEQUENCE)
        throw ShapeMismatch(node.path(), NodeKind::SEQUENCE, node.kind());
    return node.elements();
}

template <tree::TreeNode NodeType>
NodeType required_field(NodeType const &node, std::string const &key) {
    auto field = node.find(key);
    if(not field)
        throw MissingField(node.path() / key, key);
    return *field;
}

template <tree::TreeNode NodeType>
std::string required_string(NodeType const &node, std::string const &key) {
    auto field = required_field(node, key);
    auto value = field.as_string();
    if(not value)
        throw TypeMismatch(field.path(), key, NodeKind::STRING, field.kind());
    return *value;
}

// required and must not be the empty string
template <tree::TreeNode NodeType>
std::string required_text(NodeType const &node, std::string const &key) {
    auto value = required_string(node, key);
    if(value.empty())
        throw InvalidValue(node.path() / key, key, "must not be empty");
    return value;
}

template <tree::TreeNode NodeType>
std::optional<std::string> optional_string(NodeType const &node, std::string const &key) {
    auto field = node.find(key);
    if(not field)
        return std::nullopt;

    auto value = field->as_string();
    if(not value)
        throw TypeMismatch(field->path(), key, NodeKind::STRING, field->kind());
    return value;
}

template <tree::TreeNode NodeType>
std::optional<double> optional_number(NodeType const &node, std::string const &key) {
    auto field = node.find(key);
    if(not field)
        return std::nullopt;

    auto value = field->as_number();
    if(not value)
        throw TypeMismatch(field->path(), key, NodeKind::NUMBER, field->kind());
    return value;
}

template <tree::TreeNode NodeType>
std::optional<std::int64_t> optional_integer(NodeType const &node, std::string const &key) {
    auto field = node.find(key);
    if(not field)
        return std::nullopt;

    auto value = field->as_integer();
    if(not value)
        throw TypeMismatch(field->path(), key, NodeKind::NUMBER, field->kind());
    return value;
}

template <tree::TreeNode NodeType>
std::optional<bool> optional_bool(NodeType const &node, std::string const &key) {
    auto field = node.find(key);
    if(not field)
        return std::nullopt;

    auto value = field->as_bool();
    if(not value)
        throw TypeMismatch(field->path(), key, NodeKind::BOOLEAN, field->kind());
    return value;
}

template <typename EnumType, tree::TreeNode NodeType>
std::optional<EnumType> optional_enum(NodeType const &node, std::string const &key) {
    auto text = optional_string(node, key);
    if(not text)
        return std::nullopt;

    auto value = model::from_string<EnumType>(*text);
    if(not value)
        throw InvalidValue(node.path() / key, key, "unknown value '" + *text + "'");
    return value;
}

template <typename EnumType, tree::TreeNode NodeType>
EnumType required_enum(NodeType const &node, std::string const &key) {
    if(not node.find(key))
        throw MissingField(node.path() / key, key);
    return *optional_enum<EnumType>(node, key);
}

template <tree::TreeNode NodeType>
std::vector<std::string> optional_string_list(NodeType const &node, std::string const &key) {
    std::vector<std::string> result;
    auto field = node.find(key);
    if(not field)
        return result;

    for(auto const &element : expect_sequence(*field)) {
        auto value = element.as_string();
        if(not value)
            throw TypeMismatch(element.path(), key, NodeKind::STRING, element.kind());
        result.push_back(*value);
    }
    return result;
}

/**
 * @brief Builds every element of an optional sequence field.
 *
 * A missing key yields an empty list; a present key must hold a sequence.
 */
template <tree::TreeNode NodeType, typename BuilderType>
auto optional_list(NodeType const &node, std::string const &key, BuilderType &&builder) {
    using item_t = decltype(builder(std::declval<NodeType const &>()));
    std::vector<item_t> result;

    auto field = node.find(key);
    if(not field)
        return result;

    for(auto const &element : expect_sequence(*field))
        result.push_back(builder(element));
    return result;
}

// same as optional_list but the key must be present and the list non-empty
template <tree::TreeNode NodeType, typename BuilderType>
auto required_list(NodeType const &node, std::string const &key, BuilderType &&builder) {
    auto field = required_field(node, key);
    if(expect_sequence(field).empty())
        throw InvalidValue(field.path(), key, "at least one entry is required");
    return optional_list(node, key, std::forward<BuilderType>(builder));
}

/**
 * @brief Collects the vendor extensions of a map node.
 *
 * Every entry whose key carries the `x-` prefix and was not consumed by the
 * entity itself is kept, in document order. Other unknown keys are ignored.
 */
template <tree::TreeNode NodeType>
model::extensions_t extensions(NodeType const &node, std::initializer_list<std::string_view> consumed_keys) {
    model::extensions_t result;
    for(auto const &[key, value] : expect_map(node).entries()) {
        if(not model::is_extension_key(key))
            continue;
        if(std::find(std::begin(consumed_keys), std::end(consumed_keys), key) != std::end(consumed_keys))
            continue;
        result.emplace(key, value.to_value());
    }
    return result;
}

} // namespace arazzo::parse
