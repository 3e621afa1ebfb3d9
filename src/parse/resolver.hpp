#pragma once

#include <model/descriptors.hpp>
#include <model/exceptions.hpp>
#include <model/literals.hpp>
#include <parse/extract.hpp>
#include <tree/concepts.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arazzo::parse {

// key whose presence turns any map into a reusable object
inline std::string const REFERENCE_KEY = "reference";

enum class FieldShape {
    TEXT,
    MAP,
    SEQUENCE,
    ANY,
};

/**
 * @brief One alternative of a polymorphic field.
 *
 * The signature lists the keys that must all be present, with the shape
 * each must have, for the alternative to be selected.
 */
struct Candidate {
    std::string name;
    std::vector<std::pair<std::string, FieldShape>> signature;
};

namespace detail {

template <tree::TreeNode NodeType>
bool has_shape(NodeType const &node, FieldShape shape) {
    switch(shape) {
    case FieldShape::TEXT:
        return node.as_string().has_value();
    case FieldShape::MAP:
        return node.kind() == NodeKind::MAP;
    case FieldShape::SEQUENCE:
        return node.kind() == NodeKind::SEQUENCE;
    case FieldShape::ANY:
        return true;
    }
    return false;
}

template <tree::TreeNode NodeType>
bool matches(NodeType const &node, Candidate const &candidate) {
    for(auto const &[key, shape] : candidate.signature) {
        auto field = node.find(key);
        if(not field or not has_shape(*field, shape))
            return false;
    }
    return true;
}

inline std::vector<std::string> names_of(std::vector<Candidate> const &candidates) {
    std::vector<std::string> names;
    for(auto const &candidate : candidates)
        names.push_back(candidate.name);
    return names;
}

} // namespace detail

template <tree::TreeNode NodeType>
bool is_reusable(NodeType const &node) {
    return node.kind() == NodeKind::MAP and node.find(REFERENCE_KEY).has_value();
}

/**
 * @brief Picks the single matching candidate of a mutually exclusive set.
 *
 * Returns nullopt when nothing matches and `required` is false. Matching more
 * than one candidate, or none when required, is an AmbiguousOrInvalidUnion.
 */
template <tree::TreeNode NodeType>
std::optional<std::size_t> resolve_exclusive(NodeType const &node, std::vector<Candidate> const &candidates, bool required = true) {
    expect_map(node);

    std::vector<std::string> matched;
    std::optional<std::size_t> selected;
    for(std::size_t i = 0; i < candidates.size(); ++i) {
        if(detail::matches(node, candidates[i])) {
            matched.push_back(candidates[i].name);
            selected = i;
        }
    }

    if(matched.size() > 1)
        throw AmbiguousOrInvalidUnion(node.path(), matched, "alternatives are mutually exclusive");
    if(not selected and required)
        throw AmbiguousOrInvalidUnion(node.path(), detail::names_of(candidates), "exactly one alternative is required");
    return selected;
}

// a string starting with `$` is a runtime expression, anything else is a literal
template <tree::TreeNode NodeType>
model::Value resolve_value(NodeType const &node) {
    if(node.kind() == NodeKind::STRING) {
        auto text = *node.as_string();
        if(model::is_expression(text))
            return model::Expression{ text };
        return model::any_value_t(text);
    }
    return node.to_value();
}

template <tree::TreeNode NodeType>
model::Payload resolve_payload(NodeType const &node) {
    switch(node.kind()) {
    case NodeKind::MAP:
    case NodeKind::SEQUENCE:
        return model::StructuredPayload{ node.to_value() };
    case NodeKind::STRING: {
        auto text = *node.as_string();
        if(model::is_expression(text))
            return model::Expression{ text };
        return model::ScalarPayload{ model::any_value_t(text) };
    }
    default:
        return model::ScalarPayload{ node.to_value() };
    }
}

} // namespace arazzo::parse
