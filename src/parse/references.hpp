#pragma once

#include <model/descriptors.hpp>
#include <tree/path.hpp>

#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace arazzo::parse {

/**
 * @brief Structural check of every name based link of a built document.
 *
 * Reusable objects must name an existing component of their kind; workflow
 * targets (step workflowId, goto workflowId, dependsOn) must name a workflow
 * of this document unless qualified with `$sourceDescriptions.<name>.`;
 * goto stepId targets must name a step of the enclosing workflow.
 * Nothing is dereferenced, the model is left untouched.
 */
class ReferenceResolver {
    model::Description const &description_;
    std::set<std::string> workflow_ids_;
    std::set<std::string> source_names_;

public:
    explicit ReferenceResolver(model::Description const &description);

    // throws DanglingReference on the first link that does not resolve
    void resolve() const;

private:
    void check_workflow(model::Workflow const &workflow, Path const &path) const;
    void check_components(model::Components const &components, Path const &path) const;

    void check_reusable(model::ReusableObject const &reusable, Path const &path) const;
    void check_parameters(std::vector<model::ParameterOrReference> const &parameters, Path const &path) const;
    void check_workflow_name(std::string const &name, Path const &path) const;
    void check_target(std::optional<model::ActionTarget> const &target, Path const &path, std::set<std::string> const *step_ids) const;

    template <typename ActionType>
    void check_actions(std::vector<std::variant<ActionType, model::ReusableObject>> const &actions, Path const &path, std::set<std::string> const &step_ids) const {
        for(std::size_t i = 0; i < actions.size(); ++i) {
            if(auto const *reusable = std::get_if<model::ReusableObject>(&actions[i]))
                check_reusable(*reusable, path / i);
            else
                check_target(std::get<ActionType>(actions[i]).target, path / i, &step_ids);
        }
    }
};

void resolve_references(model::Description const &description);

} // namespace arazzo::parse
