#include <parse/builders.hpp>
#include <parse/document.hpp>
#include <parse/references.hpp>
#include <tree/json_node.hpp>
#include <tree/yaml_node.hpp>

namespace arazzo {

namespace {

template <tree::TreeNode NodeType>
model::Description load(NodeType const &root) {
    auto description = parse::build_description(root);
    parse::resolve_references(description);
    return description;
}

} // namespace

model::Description parse_document(nlohmann::ordered_json const &tree) {
    return load(tree::JsonNode{ tree });
}

model::Description parse_document(YAML::Node const &tree) {
    return load(tree::YamlNode{ tree });
}

} // namespace arazzo
