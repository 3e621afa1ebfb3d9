#pragma once

#include <model/descriptors.hpp>
#include <parse/document.hpp>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace arazzo::fixtures {

// runs `fn` and hands back the exception it was expected to throw
template <typename ExceptionType, typename Fn>
ExceptionType capture(Fn &&fn) {
    try {
        fn();
    } catch(ExceptionType const &e) {
        return e;
    }
    throw std::logic_error("expected exception was not thrown");
}

inline model::Description from_json(std::string const &text) {
    return parse_document(nlohmann::ordered_json::parse(text));
}

inline model::Description from_yaml(std::string const &text) {
    return parse_document(YAML::Load(text));
}

// smallest valid document, tests patch it where they need to
inline nlohmann::ordered_json minimal_document() {
    return nlohmann::ordered_json::parse(R"({
        "arazzo": "1.0.0",
        "info": { "title": "Minimal", "version": "1.0" },
        "sourceDescriptions": [ { "name": "api", "url": "https://example.com/openapi.yaml" } ],
        "workflows": [
            {
                "workflowId": "main",
                "steps": [ { "stepId": "first", "operationId": "getThing" } ]
            }
        ]
    })");
}

inline std::string data_file(std::string const &name) {
    return std::string{ ARAZZO_TEST_DATA_DIR } + "/" + name;
}

} // namespace arazzo::fixtures
