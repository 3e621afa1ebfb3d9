#include <emit/writer.hpp>
#include <tree/yaml_node.hpp>

#include <stdexcept>
#include <string>

namespace arazzo::emit {

namespace {

bool is_string_scalar(YAML::Node const &node) {
    return node.Tag() == "!" or node.Tag() == "tag:yaml.org,2002:str";
}

bool needs_quotes(std::string const &text) {
    return tree::YamlNode{ YAML::Node{ text } }.kind() != NodeKind::STRING;
}

void write(YAML::Emitter &out, YAML::Node const &node) {
    switch(node.Type()) {
    case YAML::NodeType::Map:
        out << YAML::BeginMap;
        for(auto const &entry : node) {
            out << YAML::Key;
            write(out, entry.first);
            out << YAML::Value;
            write(out, entry.second);
        }
        out << YAML::EndMap;
        break;
    case YAML::NodeType::Sequence:
        out << YAML::BeginSeq;
        for(auto const &element : node)
            write(out, element);
        out << YAML::EndSeq;
        break;
    case YAML::NodeType::Scalar:
        if(is_string_scalar(node) and needs_quotes(node.Scalar()))
            out << YAML::DoubleQuoted << node.Scalar();
        else
            out << node.Scalar();
        break;
    default:
        out << YAML::Null;
        break;
    }
}

} // namespace

std::string write_json(nlohmann::ordered_json const &tree, int indent) {
    return tree.dump(indent);
}

std::string write_yaml(YAML::Node const &tree) {
    YAML::Emitter out;
    write(out, tree);
    if(not out.good())
        throw std::runtime_error("failed to render yaml: " + out.GetLastError());
    return std::string{ out.c_str() } + "\n";
}

} // namespace arazzo::emit
