#pragma once

#include <model/descriptors.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace arazzo {

namespace emit {

// each overload is the inverse of the matching parse::build_* function
model::any_value_t emit(model::Info const &info);
model::any_value_t emit(model::SourceDescription const &source);
model::any_value_t emit(model::ReusableObject const &reusable);
model::any_value_t emit(model::Parameter const &param);
model::any_value_t emit(model::PayloadReplacement const &replacement);
model::any_value_t emit(model::RequestBody const &body);
model::any_value_t emit(model::CriterionExpressionType const &expression_type);
model::any_value_t emit(model::Criterion const &criterion);
model::any_value_t emit(model::SuccessAction const &action);
model::any_value_t emit(model::FailureAction const &action);
model::any_value_t emit(model::Step const &step);
model::any_value_t emit(model::Workflow const &workflow);
model::any_value_t emit(model::Components const &components);
model::any_value_t emit(model::Description const &description);

} // namespace emit

/**
 * @brief Converts a document into a JSON tree.
 *
 * Optional fields that are not set produce no entry. Extensions are written
 * back under their original keys after the fields of their entity.
 */
nlohmann::ordered_json serialize_document(model::Description const &description);

// same tree as serialize_document, as yaml-cpp nodes
YAML::Node serialize_document_yaml(model::Description const &description);

} // namespace arazzo
