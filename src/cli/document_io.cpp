#include <cli/document_io.hpp>
#include <emit/emitter.hpp>
#include <emit/writer.hpp>
#include <parse/document.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <stdexcept>

namespace arazzo::cli {

std::string to_string(Format format) {
    switch(format) {
    case Format::AUTO:
        return "auto";
    case Format::JSON:
        return "json";
    case Format::YAML:
        return "yaml";
    }
    return "auto";
}

Format format_from_string(std::string const &text) {
    if(text == "auto")
        return Format::AUTO;
    if(text == "json")
        return Format::JSON;
    if(text == "yaml" or text == "yml")
        return Format::YAML;
    throw std::invalid_argument(fmt::format("unknown format '{}', expected auto, json or yaml", text));
}

Format resolve_format(std::filesystem::path const &path, Format requested) {
    if(requested != Format::AUTO)
        return requested;
    if(path.extension() == ".json")
        return Format::JSON;
    return Format::YAML;
}

model::Description load_document(std::filesystem::path const &path, Format format) {
    if(not std::filesystem::exists(path))
        throw std::runtime_error(fmt::format("document '{}' does not exist", path.string()));

    if(resolve_format(path, format) == Format::JSON) {
        std::ifstream stream{ path };
        if(not stream)
            throw std::runtime_error(fmt::format("could not open '{}'", path.string()));
        return parse_document(nlohmann::ordered_json::parse(stream));
    }

    return parse_document(YAML::LoadFile(path.string()));
}

std::string render_document(model::Description const &description, Format format) {
    switch(format) {
    case Format::JSON:
        return emit::write_json(serialize_document(description)) + "\n";
    case Format::YAML:
        return emit::write_yaml(serialize_document_yaml(description));
    default:
        throw std::invalid_argument("an output format must be json or yaml");
    }
}

void save_document(std::string const &text, std::filesystem::path const &path) {
    std::ofstream stream{ path };
    if(not stream)
        throw std::runtime_error(fmt::format("could not write '{}'", path.string()));
    stream << text;
}

} // namespace arazzo::cli
