#include <gtest/gtest.h>

#include <model/exceptions.hpp>
#include <parse/references.hpp>

#include "test_util.hpp"

using namespace arazzo;
using arazzo::fixtures::capture;
using arazzo::fixtures::minimal_document;

namespace {

DanglingReference dangling(nlohmann::ordered_json const &document) {
    return capture<DanglingReference>([&] {
        (void)parse_document(document);
    });
}

} // namespace

TEST(References, ParameterReferenceMustExist) {
    auto json                                       = minimal_document();
    json["workflows"][0]["steps"][0]["parameters"] = nlohmann::ordered_json::parse(R"([{"reference":"$components.parameters.page"}])");

    auto error = dangling(json);
    EXPECT_EQ(error.kind, ErrorKind::DANGLING_REFERENCE);
    EXPECT_EQ(error.reference, "$components.parameters.page");
    EXPECT_EQ(error.expected_kind, model::ReferenceKind::PARAMETER);
    EXPECT_EQ(error.path.str(), "workflows[0].steps[0].parameters[0].reference");

    json["components"] = nlohmann::ordered_json::parse(R"({"parameters":{"page":{"name":"page","in":"query","value":1}}})");
    auto document      = parse_document(json);
    ASSERT_TRUE(document.components.has_value());
    EXPECT_EQ(document.components->parameters.at("page").name, "page");
}

TEST(References, SectionMustMatchKind) {
    auto json                                      = minimal_document();
    json["components"]                             = nlohmann::ordered_json::parse(R"({"successActions":{"done":{"name":"done","type":"end"}}})");
    json["workflows"][0]["steps"][0]["onFailure"] = nlohmann::ordered_json::parse(R"([{"reference":"$components.successActions.done"}])");

    auto error = dangling(json);
    EXPECT_EQ(error.expected_kind, model::ReferenceKind::FAILURE_ACTION);
    EXPECT_EQ(error.path.str(), "workflows[0].steps[0].onFailure[0].reference");

    json["workflows"][0]["steps"][0].erase("onFailure");
    json["workflows"][0]["steps"][0]["onSuccess"] = nlohmann::ordered_json::parse(R"([{"reference":"$components.successActions.done"}])");
    EXPECT_NO_THROW((void)parse_document(json));
}

TEST(References, WorkflowLevelReferences) {
    auto json                          = minimal_document();
    json["workflows"][0]["parameters"] = nlohmann::ordered_json::parse(R"([{"reference":"$components.parameters.tenant","value":"acme"}])");
    json["workflows"][0]["failureActions"] = nlohmann::ordered_json::parse(R"([{"reference":"$components.failureActions.stop"}])");

    EXPECT_EQ(dangling(json).path.str(), "workflows[0].parameters[0].reference");

    json["components"] = nlohmann::ordered_json::parse(R"({"parameters":{"tenant":{"name":"X-Tenant","in":"header","value":"default"}}})");
    EXPECT_EQ(dangling(json).path.str(), "workflows[0].failureActions[0].reference");

    json["components"]["failureActions"] = nlohmann::ordered_json::parse(R"({"stop":{"name":"stop","type":"end"}})");
    EXPECT_NO_THROW((void)parse_document(json));
}

TEST(References, DependsOnMustNameAWorkflow) {
    auto json                         = minimal_document();
    json["workflows"][0]["dependsOn"] = { "setup" };

    auto error = dangling(json);
    EXPECT_EQ(error.expected_kind, model::ReferenceKind::WORKFLOW);
    EXPECT_EQ(error.path.str(), "workflows[0].dependsOn[0]");

    json["workflows"].push_back(nlohmann::ordered_json::parse(R"({"workflowId":"setup","steps":[{"stepId":"s","operationId":"init"}]})"));
    EXPECT_NO_THROW((void)parse_document(json));
}

TEST(References, SourceQualifiedWorkflowNames) {
    auto json                                       = minimal_document();
    json["workflows"][0]["steps"][0].erase("operationId");
    json["workflows"][0]["steps"][0]["workflowId"] = "$sourceDescriptions.api.checkout";
    EXPECT_NO_THROW((void)parse_document(json));

    json["workflows"][0]["steps"][0]["workflowId"] = "$sourceDescriptions.other.checkout";
    EXPECT_EQ(dangling(json).path.str(), "workflows[0].steps[0].workflowId");

    json["workflows"][0]["steps"][0]["workflowId"] = "missing";
    EXPECT_EQ(dangling(json).reference, "missing");
}

TEST(References, GotoStepMustBeInTheSameWorkflow) {
    auto json                                      = minimal_document();
    json["workflows"][0]["steps"][0]["onSuccess"] = nlohmann::ordered_json::parse(R"([{"name":"next","type":"goto","stepId":"second"}])");

    auto error = dangling(json);
    EXPECT_EQ(error.expected_kind, model::ReferenceKind::STEP);
    EXPECT_EQ(error.path.str(), "workflows[0].steps[0].onSuccess[0].stepId");

    json["workflows"][0]["steps"].push_back(nlohmann::ordered_json::parse(R"({"stepId":"second","operationId":"other"})"));
    EXPECT_NO_THROW((void)parse_document(json));
}

TEST(References, ComponentActionsTargetWorkflows) {
    auto json          = minimal_document();
    json["components"] = nlohmann::ordered_json::parse(R"({"failureActions":{"recover":{"name":"recover","type":"goto","workflowId":"nowhere"}}})");

    EXPECT_EQ(dangling(json).path.str(), "components.failureActions.recover.workflowId");

    json["components"]["failureActions"]["recover"]["workflowId"] = "main";
    EXPECT_NO_THROW((void)parse_document(json));
}

TEST(References, ResolverLeavesModelUntouched) {
    auto json                                       = minimal_document();
    json["components"]                              = nlohmann::ordered_json::parse(R"({"parameters":{"page":{"name":"page","in":"query","value":1}}})");
    json["workflows"][0]["steps"][0]["parameters"] = nlohmann::ordered_json::parse(R"([{"reference":"$components.parameters.page","value":2}])");

    auto document   = parse_document(json);
    auto const copy = document;
    EXPECT_NO_THROW(parse::resolve_references(document));
    EXPECT_EQ(document, copy);

    auto const &reusable = std::get<model::ReusableObject>(document.workflows[0].steps[0].parameters[0]);
    EXPECT_EQ(reusable.value, model::Value{ model::any_value_t(2) });
}
