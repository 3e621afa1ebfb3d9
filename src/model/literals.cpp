#include <model/literals.hpp>

#include <algorithm>
#include <cctype>

namespace arazzo::model {

std::vector<std::string> const &supported_versions() {
    static std::vector<std::string> const versions{ std::string{ SUPPORTED_VERSION_PREFIX } + "x" };
    return versions;
}

bool is_supported_version(std::string_view version) {
    if(not version.starts_with(SUPPORTED_VERSION_PREFIX))
        return false;

    auto patch = version.substr(SUPPORTED_VERSION_PREFIX.size());
    return not patch.empty() and std::all_of(std::begin(patch), std::end(patch), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

std::string_view to_string(SourceType type) {
    switch(type) {
    case SourceType::OPENAPI:
        return "openapi";
    case SourceType::ARAZZO:
        return "arazzo";
    }
    return "";
}

std::string_view to_string(ParameterLocation location) {
    switch(location) {
    case ParameterLocation::PATH:
        return "path";
    case ParameterLocation::QUERY:
        return "query";
    case ParameterLocation::HEADER:
        return "header";
    case ParameterLocation::COOKIE:
        return "cookie";
    }
    return "";
}

std::string_view to_string(CriterionType type) {
    switch(type) {
    case CriterionType::SIMPLE:
        return "simple";
    case CriterionType::REGEX:
        return "regex";
    case CriterionType::JSONPATH:
        return "jsonpath";
    case CriterionType::XPATH:
        return "xpath";
    }
    return "";
}

std::string_view to_string(ActionType type) {
    switch(type) {
    case ActionType::END:
        return "end";
    case ActionType::GOTO:
        return "goto";
    case ActionType::RETRY:
        return "retry";
    }
    return "";
}

std::string_view to_string(ReferenceKind kind) {
    switch(kind) {
    case ReferenceKind::PARAMETER:
        return "parameter";
    case ReferenceKind::SUCCESS_ACTION:
        return "success-action";
    case ReferenceKind::FAILURE_ACTION:
        return "failure-action";
    case ReferenceKind::WORKFLOW:
        return "workflow";
    case ReferenceKind::STEP:
        return "step";
    }
    return "";
}

std::string_view components_section(ReferenceKind kind) {
    switch(kind) {
    case ReferenceKind::PARAMETER:
        return "$components.parameters.";
    case ReferenceKind::SUCCESS_ACTION:
        return "$components.successActions.";
    case ReferenceKind::FAILURE_ACTION:
        return "$components.failureActions.";
    default:
        return "";
    }
}

template <>
std::optional<SourceType> from_string<SourceType>(std::string_view text) {
    if(text == "openapi")
        return SourceType::OPENAPI;
    if(text == "arazzo")
        return SourceType::ARAZZO;
    return std::nullopt;
}

template <>
std::optional<ParameterLocation> from_string<ParameterLocation>(std::string_view text) {
    if(text == "path")
        return ParameterLocation::PATH;
    if(text == "query")
        return ParameterLocation::QUERY;
    if(text == "header")
        return ParameterLocation::HEADER;
    if(text == "cookie")
        return ParameterLocation::COOKIE;
    return std::nullopt;
}

template <>
std::optional<CriterionType> from_string<CriterionType>(std::string_view text) {
    if(text == "simple")
        return CriterionType::SIMPLE;
    if(text == "regex")
        return CriterionType::REGEX;
    if(text == "jsonpath")
        return CriterionType::JSONPATH;
    if(text == "xpath")
        return CriterionType::XPATH;
    return std::nullopt;
}

template <>
std::optional<ActionType> from_string<ActionType>(std::string_view text) {
    if(text == "end")
        return ActionType::END;
    if(text == "goto")
        return ActionType::GOTO;
    if(text == "retry")
        return ActionType::RETRY;
    return std::nullopt;
}

bool is_extension_key(std::string_view key) {
    return key.starts_with(EXTENSION_PREFIX);
}

bool is_expression(std::string_view text) {
    return text.starts_with(EXPRESSION_PREFIX);
}

bool is_valid_component_key(std::string_view key) {
    if(key.empty())
        return false;
    return std::all_of(std::begin(key), std::end(key), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) or c == '.' or c == '-' or c == '_';
    });
}

} // namespace arazzo::model
