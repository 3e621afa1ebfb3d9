#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arazzo::model {

// opaque value-tree fragment (extension values, structured payloads, schemas)
using any_value_t  = nlohmann::ordered_json;
using extensions_t = nlohmann::ordered_map<std::string, any_value_t>;
using outputs_t    = nlohmann::ordered_map<std::string, std::string>;

enum class SourceType {
    OPENAPI,
    ARAZZO,
};

enum class ParameterLocation {
    PATH,
    QUERY,
    HEADER,
    COOKIE,
};

enum class CriterionType {
    SIMPLE,
    REGEX,
    JSONPATH,
    XPATH,
};

enum class ActionType {
    END,
    GOTO,
    RETRY,
};

enum class ReferenceKind {
    PARAMETER,
    SUCCESS_ACTION,
    FAILURE_ACTION,
    WORKFLOW,
    STEP,
};

// runtime expression, stored verbatim and never evaluated
struct Expression {
    std::string text;

    bool operator==(Expression const &) const = default;
};

// literal value or runtime expression
using Value = std::variant<any_value_t, Expression>;

struct ReusableObject {
    std::string reference;
    ReferenceKind kind = ReferenceKind::PARAMETER;
    std::optional<Value> value; // parameter references only

    bool operator==(ReusableObject const &) const = default;
};

struct Info {
    std::string title;
    std::optional<std::string> summary;
    std::optional<std::string> description;
    std::string version;
    extensions_t extensions;

    bool operator==(Info const &) const = default;
};

struct SourceDescription {
    std::string name;
    std::string url;
    std::optional<SourceType> type;
    extensions_t extensions;

    bool operator==(SourceDescription const &) const = default;
};

struct Parameter {
    std::string name;
    std::optional<ParameterLocation> in;
    Value value;
    extensions_t extensions;

    bool operator==(Parameter const &) const = default;
};

using ParameterOrReference = std::variant<Parameter, ReusableObject>;

struct ScalarPayload {
    any_value_t value; // string, number, bool or null
    bool operator==(ScalarPayload const &) const = default;
};

struct StructuredPayload {
    any_value_t value; // map or sequence
    bool operator==(StructuredPayload const &) const = default;
};

using Payload = std::variant<ScalarPayload, StructuredPayload, Expression>;

struct PayloadReplacement {
    std::string target;
    Value value;
    extensions_t extensions;

    bool operator==(PayloadReplacement const &) const = default;
};

struct RequestBody {
    std::optional<std::string> content_type;
    std::optional<Payload> payload;
    std::vector<PayloadReplacement> replacements;
    extensions_t extensions;

    bool operator==(RequestBody const &) const = default;
};

struct CriterionExpressionType {
    CriterionType type = CriterionType::JSONPATH;
    std::string version;
    extensions_t extensions;

    bool operator==(CriterionExpressionType const &) const = default;
};

using CriterionTypeSpec = std::variant<CriterionType, CriterionExpressionType>;

struct Criterion {
    std::optional<std::string> context;
    std::string condition;
    std::optional<CriterionTypeSpec> type;
    extensions_t extensions;

    CriterionType effective_type() const;

    bool operator==(Criterion const &) const = default;
};

struct StepTarget {
    std::string step_id;
    bool operator==(StepTarget const &) const = default;
};

struct WorkflowTarget {
    std::string workflow_id;
    bool operator==(WorkflowTarget const &) const = default;
};

using ActionTarget = std::variant<StepTarget, WorkflowTarget>;

struct RetryPolicy {
    double retry_after = 0.0;  // seconds
    std::uint64_t retry_limit = 0;

    bool operator==(RetryPolicy const &) const = default;
};

struct SuccessAction {
    std::string name;
    ActionType type = ActionType::END;
    std::optional<ActionTarget> target;
    std::vector<Criterion> criteria;
    extensions_t extensions;

    bool operator==(SuccessAction const &) const = default;
};

struct FailureAction {
    std::string name;
    ActionType type = ActionType::END;
    std::optional<ActionTarget> target;
    std::optional<RetryPolicy> retry;
    std::vector<Criterion> criteria;
    extensions_t extensions;

    bool operator==(FailureAction const &) const = default;
};

using SuccessActionOrReference = std::variant<SuccessAction, ReusableObject>;
using FailureActionOrReference = std::variant<FailureAction, ReusableObject>;

struct OperationId {
    std::string value;
    bool operator==(OperationId const &) const = default;
};

struct OperationPath {
    std::string value;
    bool operator==(OperationPath const &) const = default;
};

struct WorkflowId {
    std::string value;
    bool operator==(WorkflowId const &) const = default;
};

using OperationReference = std::variant<OperationId, OperationPath, WorkflowId>;

struct Step {
    std::string step_id;
    std::optional<std::string> description;
    OperationReference operation;
    std::vector<ParameterOrReference> parameters;
    std::optional<RequestBody> request_body;
    std::vector<Criterion> success_criteria;
    std::vector<SuccessActionOrReference> on_success;
    std::vector<FailureActionOrReference> on_failure;
    outputs_t outputs;
    extensions_t extensions;

    bool operator==(Step const &) const = default;
};

struct Workflow {
    std::string workflow_id;
    std::optional<std::string> summary;
    std::optional<std::string> description;
    std::optional<any_value_t> inputs;
    std::vector<std::string> depends_on;
    std::vector<Step> steps;
    std::vector<SuccessActionOrReference> success_actions;
    std::vector<FailureActionOrReference> failure_actions;
    outputs_t outputs;
    std::vector<ParameterOrReference> parameters;
    extensions_t extensions;

    bool operator==(Workflow const &) const = default;
};

struct Components {
    nlohmann::ordered_map<std::string, any_value_t> inputs;
    nlohmann::ordered_map<std::string, Parameter> parameters;
    nlohmann::ordered_map<std::string, SuccessAction> success_actions;
    nlohmann::ordered_map<std::string, FailureAction> failure_actions;
    extensions_t extensions;

    bool operator==(Components const &) const = default;
};

/**
 * @brief Root of an Arazzo document.
 *
 * Owns everything below it. Cross references (reusable objects, goto targets,
 * dependsOn) are names looked up in this tree, never pointers.
 */
struct Description {
    std::string arazzo;
    Info info;
    std::vector<SourceDescription> source_descriptions;
    std::vector<Workflow> workflows;
    std::optional<Components> components;
    extensions_t extensions;

    bool operator==(Description const &) const = default;
};

} // namespace arazzo::model
