#include <model/exceptions.hpp>
#include <model/literals.hpp>
#include <parse/references.hpp>
#include <util/overloaded.hpp>

namespace arazzo::parse {

ReferenceResolver::ReferenceResolver(model::Description const &description)
    : description_{ description } {
    for(auto const &workflow : description_.workflows)
        workflow_ids_.insert(workflow.workflow_id);
    for(auto const &source : description_.source_descriptions)
        source_names_.insert(source.name);
}

void ReferenceResolver::resolve() const {
    auto const workflows_path = Path{} / "workflows";
    for(std::size_t i = 0; i < description_.workflows.size(); ++i)
        check_workflow(description_.workflows[i], workflows_path / i);

    if(description_.components)
        check_components(*description_.components, Path{} / "components");
}

void ReferenceResolver::check_workflow(model::Workflow const &workflow, Path const &path) const {
    for(std::size_t i = 0; i < workflow.depends_on.size(); ++i)
        check_workflow_name(workflow.depends_on[i], path / "dependsOn" / i);

    std::set<std::string> step_ids;
    for(auto const &step : workflow.steps)
        step_ids.insert(step.step_id);

    check_parameters(workflow.parameters, path / "parameters");
    check_actions(workflow.success_actions, path / "successActions", step_ids);
    check_actions(workflow.failure_actions, path / "failureActions", step_ids);

    auto const steps_path = path / "steps";
    for(std::size_t i = 0; i < workflow.steps.size(); ++i) {
        auto const &step     = workflow.steps[i];
        auto const step_path = steps_path / i;

        if(auto const *target = std::get_if<model::WorkflowId>(&step.operation))
            check_workflow_name(target->value, step_path / "workflowId");

        check_parameters(step.parameters, step_path / "parameters");
        check_actions(step.on_success, step_path / "onSuccess", step_ids);
        check_actions(step.on_failure, step_path / "onFailure", step_ids);
    }
}

void ReferenceResolver::check_components(model::Components const &components, Path const &path) const {
    // component actions have no enclosing workflow, only workflow targets can be checked
    for(auto const &[name, action] : components.success_actions)
        check_target(action.target, path / "successActions" / name, nullptr);
    for(auto const &[name, action] : components.failure_actions)
        check_target(action.target, path / "failureActions" / name, nullptr);
}

void ReferenceResolver::check_reusable(model::ReusableObject const &reusable, Path const &path) const {
    auto const reference_path = path / "reference";
    auto const section        = model::components_section(reusable.kind);
    if(section.empty() or not reusable.reference.starts_with(section))
        throw DanglingReference(reference_path, reusable.reference, reusable.kind);

    auto const name       = reusable.reference.substr(section.size());
    auto const &component = description_.components;
    auto const found      = [&]() {
        if(not component)
            return false;

        switch(reusable.kind) {
        case model::ReferenceKind::PARAMETER:
            return component->parameters.find(name) != component->parameters.end();
        case model::ReferenceKind::SUCCESS_ACTION:
            return component->success_actions.find(name) != component->success_actions.end();
        case model::ReferenceKind::FAILURE_ACTION:
            return component->failure_actions.find(name) != component->failure_actions.end();
        default:
            return false;
        }
    }();

    if(not found)
        throw DanglingReference(reference_path, reusable.reference, reusable.kind);
}

void ReferenceResolver::check_parameters(std::vector<model::ParameterOrReference> const &parameters, Path const &path) const {
    for(std::size_t i = 0; i < parameters.size(); ++i) {
        if(auto const *reusable = std::get_if<model::ReusableObject>(&parameters[i]))
            check_reusable(*reusable, path / i);
    }
}

void ReferenceResolver::check_workflow_name(std::string const &name, Path const &path) const {
    if(name.starts_with(model::SOURCE_DESCRIPTIONS_PREFIX)) {
        // $sourceDescriptions.<source>.<workflowId>: only the source can be checked here
        auto const rest   = name.substr(model::SOURCE_DESCRIPTIONS_PREFIX.size());
        auto const source = rest.substr(0, rest.find('.'));
        if(not source_names_.contains(source))
            throw DanglingReference(path, name, model::ReferenceKind::WORKFLOW);
        return;
    }

    if(not workflow_ids_.contains(name))
        throw DanglingReference(path, name, model::ReferenceKind::WORKFLOW);
}

void ReferenceResolver::check_target(std::optional<model::ActionTarget> const &target, Path const &path, std::set<std::string> const *step_ids) const {
    if(not target)
        return;

    // clang-format off
    std::visit(util::overloaded {
        [&](model::StepTarget const &step) {
            if(step_ids and not step_ids->contains(step.step_id))
                throw DanglingReference(path / "stepId", step.step_id, model::ReferenceKind::STEP);
        },
        [&](model::WorkflowTarget const &workflow) {
            check_workflow_name(workflow.workflow_id, path / "workflowId");
        }},
    *target);
    // clang-format on
}

void resolve_references(model::Description const &description) {
    ReferenceResolver{ description }.resolve();
}

} // namespace arazzo::parse
