#pragma once

#include <model/descriptors.hpp>
#include <model/exceptions.hpp>
#include <model/literals.hpp>
#include <parse/extract.hpp>
#include <parse/resolver.hpp>
#include <tree/concepts.hpp>

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace arazzo::parse {

namespace detail {

inline std::vector<Candidate> const &operation_candidates() {
    static std::vector<Candidate> const candidates{
        { "operationId", { { "operationId", FieldShape::ANY } } },
        { "operationPath", { { "operationPath", FieldShape::ANY } } },
        { "workflowId", { { "workflowId", FieldShape::ANY } } },
    };
    return candidates;
}

inline std::vector<Candidate> const &target_candidates() {
    static std::vector<Candidate> const candidates{
        { "stepId", { { "stepId", FieldShape::ANY } } },
        { "workflowId", { { "workflowId", FieldShape::ANY } } },
    };
    return candidates;
}

/**
 * @brief Throws DuplicateIdentifier on the second item sharing a key.
 *
 * `key_of` returns an optional key; items without one (reusable references)
 * take no part in the check.
 */
template <typename ItemType, typename KeyFn>
void ensure_unique(std::vector<ItemType> const &items, Path const &list_path, std::string const &field, KeyFn &&key_of) {
    std::set<std::string> seen;
    for(std::size_t i = 0; i < items.size(); ++i) {
        std::optional<std::string> key = key_of(items[i]);
        if(not key)
            continue;
        if(not seen.insert(*key).second)
            throw DuplicateIdentifier(list_path / i / field, *key);
    }
}

template <typename ActionType>
std::optional<std::string> action_name(std::variant<ActionType, model::ReusableObject> const &item) {
    if(auto const *action = std::get_if<ActionType>(&item))
        return action->name;
    return std::nullopt;
}

inline std::optional<std::string> parameter_key(model::ParameterOrReference const &item) {
    auto const *param = std::get_if<model::Parameter>(&item);
    if(not param)
        return std::nullopt;
    if(param->in)
        return param->name + " (" + std::string{ model::to_string(*param->in) } + ")";
    return param->name;
}

} // namespace detail

template <tree::TreeNode NodeType>
model::Info build_info(NodeType const &node) {
    expect_map(node);

    model::Info info;
    info.title       = required_text(node, "title");
    info.summary     = optional_string(node, "summary");
    info.description = optional_string(node, "description");
    info.version     = required_text(node, "version");
    info.extensions  = extensions(node, { "title", "summary", "description", "version" });
    return info;
}

template <tree::TreeNode NodeType>
model::SourceDescription build_source_description(NodeType const &node) {
    expect_map(node);

    model::SourceDescription source;
    source.name       = required_text(node, "name");
    source.url        = required_text(node, "url");
    source.type       = optional_enum<model::SourceType>(node, "type");
    source.extensions = extensions(node, { "name", "url", "type" });
    return source;
}

/**
 * @brief Builds a reusable object in place of an inline entity.
 *
 * `inline_keys` are the keys of the inline alternative; none of them may
 * appear next to `reference`. Only parameter references take a `value`.
 */
template <tree::TreeNode NodeType>
model::ReusableObject build_reusable(NodeType const &node, model::ReferenceKind kind, std::vector<std::string> const &inline_keys) {
    expect_map(node);

    for(auto const &key : inline_keys) {
        if(node.find(key))
            throw AmbiguousOrInvalidUnion(node.path(), { "reusable-object", std::string{ model::to_string(kind) } },
                "'" + REFERENCE_KEY + "' cannot be combined with '" + key + "'");
    }

    model::ReusableObject reusable;
    reusable.reference = required_text(node, REFERENCE_KEY);
    reusable.kind      = kind;
    if(not reusable.reference.starts_with(model::COMPONENTS_PREFIX))
        throw InvalidValue(node.path() / REFERENCE_KEY, REFERENCE_KEY, "must be a '$components.' expression");

    if(auto value = node.find("value"); value) {
        if(kind != model::ReferenceKind::PARAMETER)
            throw InvalidValue(value->path(), "value", "only parameter references accept a value");
        reusable.value = resolve_value(*value);
    }
    return reusable;
}

template <tree::TreeNode NodeType>
model::Parameter build_parameter(NodeType const &node) {
    expect_map(node);

    model::Parameter param;
    param.name       = required_text(node, "name");
    param.in         = optional_enum<model::ParameterLocation>(node, "in");
    param.value      = resolve_value(required_field(node, "value"));
    param.extensions = extensions(node, { "name", "in", "value" });
    return param;
}

template <tree::TreeNode NodeType>
model::ParameterOrReference build_parameter_or_reference(NodeType const &node) {
    if(is_reusable(expect_map(node)))
        return build_reusable(node, model::ReferenceKind::PARAMETER, { "name", "in" });
    return build_parameter(node);
}

template <tree::TreeNode NodeType>
model::PayloadReplacement build_payload_replacement(NodeType const &node) {
    expect_map(node);

    model::PayloadReplacement replacement;
    replacement.target     = required_text(node, "target");
    replacement.value      = resolve_value(required_field(node, "value"));
    replacement.extensions = extensions(node, { "target", "value" });
    return replacement;
}

template <tree::TreeNode NodeType>
model::RequestBody build_request_body(NodeType const &node) {
    expect_map(node);

    model::RequestBody body;
    body.content_type = optional_string(node, "contentType");
    if(body.content_type and body.content_type->empty())
        throw InvalidValue(node.path() / "contentType", "contentType", "must not be empty");

    if(auto payload = node.find("payload"); payload)
        body.payload = resolve_payload(*payload);

    body.replacements = optional_list(node, "replacements", [](NodeType const &item) {
        return build_payload_replacement(item);
    });
    body.extensions = extensions(node, { "contentType", "payload", "replacements" });
    return body;
}

template <tree::TreeNode NodeType>
model::CriterionExpressionType build_criterion_expression_type(NodeType const &node) {
    expect_map(node);

    model::CriterionExpressionType expression_type;
    expression_type.type    = required_enum<model::CriterionType>(node, "type");
    expression_type.version = required_text(node, "version");

    auto const &version = expression_type.version;
    switch(expression_type.type) {
    case model::CriterionType::JSONPATH:
        if(version != "draft-goessner-dispatch-jsonpath-00")
            throw InvalidValue(node.path() / "version", "version", "unknown jsonpath version '" + version + "'");
        break;
    case model::CriterionType::XPATH:
        if(version != "xpath-30" and version != "xpath-20" and version != "xpath-10")
            throw InvalidValue(node.path() / "version", "version", "unknown xpath version '" + version + "'");
        break;
    default:
        throw InvalidValue(node.path() / "type", "type", "expression types are only defined for jsonpath and xpath");
    }

    expression_type.extensions = extensions(node, { "type", "version" });
    return expression_type;
}

// `type` is either a plain type name or a Criterion Expression Type object
template <tree::TreeNode NodeType>
model::CriterionTypeSpec build_criterion_type(NodeType const &node) {
    if(node.kind() == NodeKind::MAP)
        return build_criterion_expression_type(node);

    if(auto text = node.as_string(); text and node.kind() != NodeKind::NULL_VALUE) {
        auto type = model::from_string<model::CriterionType>(*text);
        if(not type)
            throw InvalidValue(node.path(), "type", "unknown criterion type '" + *text + "'");
        return *type;
    }

    throw AmbiguousOrInvalidUnion(node.path(), { "criterion-type", "criterion-expression-type" },
        "expected a type name or an expression type object");
}

template <tree::TreeNode NodeType>
model::Criterion build_criterion(NodeType const &node) {
    expect_map(node);

    model::Criterion criterion;
    criterion.context   = optional_string(node, "context");
    criterion.condition = required_text(node, "condition");
    if(auto type = node.find("type"); type)
        criterion.type = build_criterion_type(*type);

    auto const effective = criterion.effective_type();
    if((effective == model::CriterionType::JSONPATH or effective == model::CriterionType::XPATH) and not criterion.context)
        throw MissingField(node.path() / "context", "context");

    criterion.extensions = extensions(node, { "context", "condition", "type" });
    return criterion;
}

/**
 * @brief Resolves the stepId/workflowId target of an action.
 *
 * Required for goto, optional for retry, rejected for end.
 */
template <tree::TreeNode NodeType>
std::optional<model::ActionTarget> build_action_target(NodeType const &node, model::ActionType type) {
    auto selected = resolve_exclusive(node, detail::target_candidates(), type == model::ActionType::GOTO);
    if(not selected)
        return std::nullopt;

    auto const &key = detail::target_candidates()[*selected].name;
    if(type == model::ActionType::END)
        throw InvalidValue(node.path() / key, key, "'end' actions take no target");

    if(*selected == 0)
        return model::StepTarget{ required_text(node, "stepId") };
    return model::WorkflowTarget{ required_text(node, "workflowId") };
}

template <tree::TreeNode NodeType>
model::SuccessAction build_success_action(NodeType const &node) {
    expect_map(node);

    model::SuccessAction action;
    action.name = required_text(node, "name");
    action.type = required_enum<model::ActionType>(node, "type");
    if(action.type == model::ActionType::RETRY)
        throw InvalidValue(node.path() / "type", "type", "'retry' is only valid for failure actions");

    action.target   = build_action_target(node, action.type);
    action.criteria = optional_list(node, "criteria", [](NodeType const &item) {
        return build_criterion(item);
    });
    action.extensions = extensions(node, { "name", "type", "workflowId", "stepId", "criteria" });
    return action;
}

template <tree::TreeNode NodeType>
model::FailureAction build_failure_action(NodeType const &node) {
    expect_map(node);

    model::FailureAction action;
    action.name   = required_text(node, "name");
    action.type   = required_enum<model::ActionType>(node, "type");
    action.target = build_action_target(node, action.type);

    auto retry_after = optional_number(node, "retryAfter");
    auto retry_limit = optional_integer(node, "retryLimit");
    if(action.type == model::ActionType::RETRY) {
        if(not retry_after)
            throw MissingField(node.path() / "retryAfter", "retryAfter");
        if(not retry_limit)
            throw MissingField(node.path() / "retryLimit", "retryLimit");
        if(*retry_after < 0)
            throw InvalidValue(node.path() / "retryAfter", "retryAfter", "must not be negative");
        if(*retry_limit < 0)
            throw InvalidValue(node.path() / "retryLimit", "retryLimit", "must not be negative");

        action.retry = model::RetryPolicy{ *retry_after, static_cast<std::uint64_t>(*retry_limit) };
    } else {
        if(retry_after)
            throw InvalidValue(node.path() / "retryAfter", "retryAfter", "only allowed for 'retry' actions");
        if(retry_limit)
            throw InvalidValue(node.path() / "retryLimit", "retryLimit", "only allowed for 'retry' actions");
    }

    action.criteria = optional_list(node, "criteria", [](NodeType const &item) {
        return build_criterion(item);
    });
    action.extensions = extensions(node, { "name", "type", "workflowId", "stepId", "retryAfter", "retryLimit", "criteria" });
    return action;
}

template <tree::TreeNode NodeType>
model::SuccessActionOrReference build_success_action_or_reference(NodeType const &node) {
    if(is_reusable(expect_map(node)))
        return build_reusable(node, model::ReferenceKind::SUCCESS_ACTION, { "name", "type", "workflowId", "stepId", "criteria" });
    return build_success_action(node);
}

template <tree::TreeNode NodeType>
model::FailureActionOrReference build_failure_action_or_reference(NodeType const &node) {
    if(is_reusable(expect_map(node)))
        return build_reusable(node, model::ReferenceKind::FAILURE_ACTION,
            { "name", "type", "workflowId", "stepId", "retryAfter", "retryLimit", "criteria" });
    return build_failure_action(node);
}

// name -> runtime expression; names follow the component key format
template <tree::TreeNode NodeType>
model::outputs_t build_outputs(NodeType const &node, std::string const &key) {
    model::outputs_t outputs;
    auto field = node.find(key);
    if(not field)
        return outputs;

    for(auto const &[name, value] : expect_map(*field).entries()) {
        if(not model::is_valid_component_key(name))
            throw InvalidValue(value.path(), name, "output names must match ^[a-zA-Z0-9.\\-_]+$");
        if(outputs.find(name) != outputs.end())
            throw DuplicateIdentifier(value.path(), name);

        auto text = value.as_string();
        if(not text)
            throw TypeMismatch(value.path(), name, NodeKind::STRING, value.kind());
        outputs.emplace(name, std::string{ *text });
    }
    return outputs;
}

template <tree::TreeNode NodeType>
model::Step build_step(NodeType const &node) {
    expect_map(node);

    model::Step step;
    step.step_id     = required_text(node, "stepId");
    step.description = optional_string(node, "description");

    switch(*resolve_exclusive(node, detail::operation_candidates())) {
    case 0:
        step.operation = model::OperationId{ required_text(node, "operationId") };
        break;
    case 1:
        step.operation = model::OperationPath{ required_text(node, "operationPath") };
        break;
    default:
        step.operation = model::WorkflowId{ required_text(node, "workflowId") };
        break;
    }

    step.parameters = optional_list(node, "parameters", [](NodeType const &item) {
        return build_parameter_or_reference(item);
    });

    // parameters of an operation call must say where they go
    auto const parameters_path = node.path() / "parameters";
    if(not std::holds_alternative<model::WorkflowId>(step.operation)) {
        for(std::size_t i = 0; i < step.parameters.size(); ++i) {
            auto const *param = std::get_if<model::Parameter>(&step.parameters[i]);
            if(param and not param->in)
                throw MissingField(parameters_path / i / "in", "in");
        }
    }
    detail::ensure_unique(step.parameters, parameters_path, "name", detail::parameter_key);

    if(auto body = node.find("requestBody"); body)
        step.request_body = build_request_body(*body);

    step.success_criteria = optional_list(node, "successCriteria", [](NodeType const &item) {
        return build_criterion(item);
    });

    step.on_success = optional_list(node, "onSuccess", [](NodeType const &item) {
        return build_success_action_or_reference(item);
    });
    detail::ensure_unique(step.on_success, node.path() / "onSuccess", "name", detail::action_name<model::SuccessAction>);

    step.on_failure = optional_list(node, "onFailure", [](NodeType const &item) {
        return build_failure_action_or_reference(item);
    });
    detail::ensure_unique(step.on_failure, node.path() / "onFailure", "name", detail::action_name<model::FailureAction>);

    step.outputs    = build_outputs(node, "outputs");
    step.extensions = extensions(node, { "stepId", "description", "operationId", "operationPath", "workflowId", "parameters",
                                           "requestBody", "successCriteria", "onSuccess", "onFailure", "outputs" });
    return step;
}

template <tree::TreeNode NodeType>
model::Workflow build_workflow(NodeType const &node) {
    expect_map(node);

    model::Workflow workflow;
    workflow.workflow_id = required_text(node, "workflowId");
    workflow.summary     = optional_string(node, "summary");
    workflow.description = optional_string(node, "description");
    if(auto inputs = node.find("inputs"); inputs)
        workflow.inputs = expect_map(*inputs).to_value();
    workflow.depends_on = optional_string_list(node, "dependsOn");

    workflow.steps = required_list(node, "steps", [](NodeType const &item) {
        return build_step(item);
    });
    detail::ensure_unique(workflow.steps, node.path() / "steps", "stepId", [](model::Step const &step) {
        return std::optional<std::string>{ step.step_id };
    });

    workflow.success_actions = optional_list(node, "successActions", [](NodeType const &item) {
        return build_success_action_or_reference(item);
    });
    detail::ensure_unique(workflow.success_actions, node.path() / "successActions", "name", detail::action_name<model::SuccessAction>);

    workflow.failure_actions = optional_list(node, "failureActions", [](NodeType const &item) {
        return build_failure_action_or_reference(item);
    });
    detail::ensure_unique(workflow.failure_actions, node.path() / "failureActions", "name", detail::action_name<model::FailureAction>);

    workflow.outputs    = build_outputs(node, "outputs");
    workflow.parameters = optional_list(node, "parameters", [](NodeType const &item) {
        return build_parameter_or_reference(item);
    });
    detail::ensure_unique(workflow.parameters, node.path() / "parameters", "name", detail::parameter_key);

    workflow.extensions = extensions(node, { "workflowId", "summary", "description", "inputs", "dependsOn", "steps",
                                               "successActions", "failureActions", "outputs", "parameters" });
    return workflow;
}

/**
 * @brief Builds one named mapping of the components section.
 *
 * Keys must follow the component key format and be unique (YAML maps may
 * repeat a key, JSON parsers usually keep the last one).
 */
template <tree::TreeNode NodeType, typename BuilderType>
auto build_named(NodeType const &node, std::string const &key, BuilderType &&builder) {
    using item_t = decltype(builder(std::declval<NodeType const &>()));
    nlohmann::ordered_map<std::string, item_t> result;

    auto field = node.find(key);
    if(not field)
        return result;

    for(auto const &[name, value] : expect_map(*field).entries()) {
        if(not model::is_valid_component_key(name))
            throw InvalidValue(value.path(), name, "component names must match ^[a-zA-Z0-9.\\-_]+$");
        if(result.find(name) != result.end())
            throw DuplicateIdentifier(value.path(), name);
        result.emplace(name, builder(value));
    }
    return result;
}

template <tree::TreeNode NodeType>
model::Components build_components(NodeType const &node) {
    expect_map(node);

    model::Components components;
    components.inputs = build_named(node, "inputs", [](NodeType const &item) {
        return expect_map(item).to_value();
    });
    components.parameters = build_named(node, "parameters", [](NodeType const &item) {
        return build_parameter(item);
    });
    components.success_actions = build_named(node, "successActions", [](NodeType const &item) {
        return build_success_action(item);
    });
    components.failure_actions = build_named(node, "failureActions", [](NodeType const &item) {
        return build_failure_action(item);
    });
    components.extensions = extensions(node, { "inputs", "parameters", "successActions", "failureActions" });
    return components;
}

/**
 * @brief Builds the document root.
 *
 * The version is checked before anything else is looked at. Reusable
 * references are recorded but not resolved here, see resolve_references().
 */
template <tree::TreeNode NodeType>
model::Description build_description(NodeType const &node) {
    expect_map(node);

    model::Description description;
    description.arazzo = required_string(node, "arazzo");

    if(not model::is_supported_version(description.arazzo))
        throw UnsupportedVersion(node.path() / "arazzo", description.arazzo, model::supported_versions());

    description.info = build_info(required_field(node, "info"));

    description.source_descriptions = required_list(node, "sourceDescriptions", [](NodeType const &item) {
        return build_source_description(item);
    });
    detail::ensure_unique(description.source_descriptions, node.path() / "sourceDescriptions", "name",
        [](model::SourceDescription const &source) {
            return std::optional<std::string>{ source.name };
        });

    description.workflows = required_list(node, "workflows", [](NodeType const &item) {
        return build_workflow(item);
    });
    detail::ensure_unique(description.workflows, node.path() / "workflows", "workflowId", [](model::Workflow const &workflow) {
        return std::optional<std::string>{ workflow.workflow_id };
    });

    if(auto components = node.find("components"); components)
        description.components = build_components(*components);

    description.extensions = extensions(node, { "arazzo", "info", "sourceDescriptions", "workflows", "components" });
    return description;
}

} // namespace arazzo::parse
