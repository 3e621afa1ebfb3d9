#include <emit/emitter.hpp>
#include <model/literals.hpp>
#include <tree/yaml_node.hpp>
#include <util/overloaded.hpp>

#include <string>
#include <variant>

namespace arazzo {

namespace emit {

namespace {

using object_t = model::any_value_t;

void put(object_t &object, std::string const &key, std::optional<std::string> const &value) {
    if(value)
        object[key] = *value;
}

void put_extensions(object_t &object, model::extensions_t const &extensions) {
    for(auto const &[key, value] : extensions)
        object[key] = value;
}

void put_outputs(object_t &object, model::outputs_t const &outputs) {
    if(outputs.empty())
        return;

    auto map = object_t::object();
    for(auto const &[name, expression] : outputs)
        map[name] = expression;
    object["outputs"] = std::move(map);
}

template <typename ItemType>
void put_list(object_t &object, std::string const &key, std::vector<ItemType> const &items) {
    if(items.empty())
        return;

    auto list = object_t::array();
    for(auto const &item : items)
        list.push_back(emit(item));
    object[key] = std::move(list);
}

template <typename ItemType>
void put_named(object_t &object, std::string const &key, nlohmann::ordered_map<std::string, ItemType> const &items) {
    if(items.empty())
        return;

    auto map = object_t::object();
    for(auto const &[name, item] : items)
        map[name] = emit(item);
    object[key] = std::move(map);
}

void put_named(object_t &object, std::string const &key, nlohmann::ordered_map<std::string, model::any_value_t> const &items) {
    if(items.empty())
        return;

    auto map = object_t::object();
    for(auto const &[name, item] : items)
        map[name] = item;
    object[key] = std::move(map);
}

object_t emit_value(model::Value const &value) {
    // clang-format off
    return std::visit(util::overloaded {
        [](model::any_value_t const &literal) -> object_t {
            return literal;
        },
        [](model::Expression const &expression) -> object_t {
            return expression.text;
        }},
    value);
    // clang-format on
}

object_t emit_payload(model::Payload const &payload) {
    // clang-format off
    return std::visit(util::overloaded {
        [](model::ScalarPayload const &scalar) -> object_t {
            return scalar.value;
        },
        [](model::StructuredPayload const &structured) -> object_t {
            return structured.value;
        },
        [](model::Expression const &expression) -> object_t {
            return expression.text;
        }},
    payload);
    // clang-format on
}

void put_target(object_t &object, std::optional<model::ActionTarget> const &target) {
    if(not target)
        return;

    // clang-format off
    std::visit(util::overloaded {
        [&object](model::StepTarget const &step) {
            object["stepId"] = step.step_id;
        },
        [&object](model::WorkflowTarget const &workflow) {
            object["workflowId"] = workflow.workflow_id;
        }},
    *target);
    // clang-format on
}

template <typename ActionType>
object_t emit_either(std::variant<ActionType, model::ReusableObject> const &item) {
    return std::visit([](auto const &alternative) {
        return emit(alternative);
    },
        item);
}

template <typename ActionType>
void put_either_list(object_t &object, std::string const &key, std::vector<std::variant<ActionType, model::ReusableObject>> const &items) {
    if(items.empty())
        return;

    auto list = object_t::array();
    for(auto const &item : items)
        list.push_back(emit_either(item));
    object[key] = std::move(list);
}

} // namespace

object_t emit(model::Info const &info) {
    auto object     = object_t::object();
    object["title"] = info.title;
    put(object, "summary", info.summary);
    put(object, "description", info.description);
    object["version"] = info.version;
    put_extensions(object, info.extensions);
    return object;
}

object_t emit(model::SourceDescription const &source) {
    auto object    = object_t::object();
    object["name"] = source.name;
    object["url"]  = source.url;
    if(source.type)
        object["type"] = std::string(model::to_string(*source.type));
    put_extensions(object, source.extensions);
    return object;
}

object_t emit(model::ReusableObject const &reusable) {
    auto object         = object_t::object();
    object["reference"] = reusable.reference;
    if(reusable.value)
        object["value"] = emit_value(*reusable.value);
    return object;
}

object_t emit(model::Parameter const &param) {
    auto object    = object_t::object();
    object["name"] = param.name;
    if(param.in)
        object["in"] = std::string(model::to_string(*param.in));
    object["value"] = emit_value(param.value);
    put_extensions(object, param.extensions);
    return object;
}

object_t emit(model::PayloadReplacement const &replacement) {
    auto object      = object_t::object();
    object["target"] = replacement.target;
    object["value"]  = emit_value(replacement.value);
    put_extensions(object, replacement.extensions);
    return object;
}

object_t emit(model::RequestBody const &body) {
    auto object = object_t::object();
    put(object, "contentType", body.content_type);
    if(body.payload)
        object["payload"] = emit_payload(*body.payload);
    put_list(object, "replacements", body.replacements);
    put_extensions(object, body.extensions);
    return object;
}

object_t emit(model::CriterionExpressionType const &expression_type) {
    auto object       = object_t::object();
    object["type"]    = std::string(model::to_string(expression_type.type));
    object["version"] = expression_type.version;
    put_extensions(object, expression_type.extensions);
    return object;
}

object_t emit(model::Criterion const &criterion) {
    auto object = object_t::object();
    put(object, "context", criterion.context);
    object["condition"] = criterion.condition;
    if(criterion.type) {
        // clang-format off
        object["type"] = std::visit(util::overloaded {
            [](model::CriterionType type) -> object_t {
                return std::string(model::to_string(type));
            },
            [](model::CriterionExpressionType const &expression_type) -> object_t {
                return emit(expression_type);
            }},
        *criterion.type);
        // clang-format on
    }
    put_extensions(object, criterion.extensions);
    return object;
}

object_t emit(model::SuccessAction const &action) {
    auto object    = object_t::object();
    object["name"] = action.name;
    object["type"] = std::string(model::to_string(action.type));
    put_target(object, action.target);
    put_list(object, "criteria", action.criteria);
    put_extensions(object, action.extensions);
    return object;
}

object_t emit(model::FailureAction const &action) {
    auto object    = object_t::object();
    object["name"] = action.name;
    object["type"] = std::string(model::to_string(action.type));
    put_target(object, action.target);
    if(action.retry) {
        object["retryAfter"] = action.retry->retry_after;
        object["retryLimit"] = action.retry->retry_limit;
    }
    put_list(object, "criteria", action.criteria);
    put_extensions(object, action.extensions);
    return object;
}

object_t emit(model::Step const &step) {
    auto object      = object_t::object();
    object["stepId"] = step.step_id;
    put(object, "description", step.description);

    // clang-format off
    std::visit(util::overloaded {
        [&object](model::OperationId const &operation) {
            object["operationId"] = operation.value;
        },
        [&object](model::OperationPath const &operation) {
            object["operationPath"] = operation.value;
        },
        [&object](model::WorkflowId const &workflow) {
            object["workflowId"] = workflow.value;
        }},
    step.operation);
    // clang-format on

    put_either_list(object, "parameters", step.parameters);
    if(step.request_body)
        object["requestBody"] = emit(*step.request_body);
    put_list(object, "successCriteria", step.success_criteria);
    put_either_list(object, "onSuccess", step.on_success);
    put_either_list(object, "onFailure", step.on_failure);
    put_outputs(object, step.outputs);
    put_extensions(object, step.extensions);
    return object;
}

object_t emit(model::Workflow const &workflow) {
    auto object          = object_t::object();
    object["workflowId"] = workflow.workflow_id;
    put(object, "summary", workflow.summary);
    put(object, "description", workflow.description);
    if(workflow.inputs)
        object["inputs"] = *workflow.inputs;
    if(not workflow.depends_on.empty())
        object["dependsOn"] = workflow.depends_on;
    put_list(object, "steps", workflow.steps);
    put_either_list(object, "successActions", workflow.success_actions);
    put_either_list(object, "failureActions", workflow.failure_actions);
    put_outputs(object, workflow.outputs);
    put_either_list(object, "parameters", workflow.parameters);
    put_extensions(object, workflow.extensions);
    return object;
}

object_t emit(model::Components const &components) {
    auto object = object_t::object();
    put_named(object, "inputs", components.inputs);
    put_named(object, "parameters", components.parameters);
    put_named(object, "successActions", components.success_actions);
    put_named(object, "failureActions", components.failure_actions);
    put_extensions(object, components.extensions);
    return object;
}

object_t emit(model::Description const &description) {
    auto object      = object_t::object();
    object["arazzo"] = description.arazzo;
    object["info"]   = emit(description.info);
    put_list(object, "sourceDescriptions", description.source_descriptions);
    put_list(object, "workflows", description.workflows);
    if(description.components)
        object["components"] = emit(*description.components);
    put_extensions(object, description.extensions);
    return object;
}

} // namespace emit

nlohmann::ordered_json serialize_document(model::Description const &description) {
    return emit::emit(description);
}

YAML::Node serialize_document_yaml(model::Description const &description) {
    return tree::to_yaml(emit::emit(description));
}

} // namespace arazzo
