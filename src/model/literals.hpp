#pragma once

#include <model/descriptors.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace arazzo::model {

inline constexpr std::string_view EXTENSION_PREFIX  = "x-";
inline constexpr std::string_view EXPRESSION_PREFIX = "$";

inline constexpr std::string_view COMPONENTS_PREFIX          = "$components.";
inline constexpr std::string_view SOURCE_DESCRIPTIONS_PREFIX = "$sourceDescriptions.";

inline constexpr std::string_view SUPPORTED_VERSION_PREFIX = "1.0.";

// supported version lines as reported to the user, e.g. "1.0.x"
std::vector<std::string> const &supported_versions();

// any 1.0 patch release: `1.0.<digits>`
bool is_supported_version(std::string_view version);

std::string_view to_string(SourceType type);
std::string_view to_string(ParameterLocation location);
std::string_view to_string(CriterionType type);
std::string_view to_string(ActionType type);
std::string_view to_string(ReferenceKind kind);

// the `$components.<section>.` prefix a reusable reference of this kind must carry
std::string_view components_section(ReferenceKind kind);

template <typename EnumType>
std::optional<EnumType> from_string(std::string_view text);

template <>
std::optional<SourceType> from_string<SourceType>(std::string_view text);
template <>
std::optional<ParameterLocation> from_string<ParameterLocation>(std::string_view text);
template <>
std::optional<CriterionType> from_string<CriterionType>(std::string_view text);
template <>
std::optional<ActionType> from_string<ActionType>(std::string_view text);

bool is_extension_key(std::string_view key);
bool is_expression(std::string_view text);

// component names and output keys: ^[a-zA-Z0-9.\-_]+$
bool is_valid_component_key(std::string_view key);

} // namespace arazzo::model
