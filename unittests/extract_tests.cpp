#include <gtest/gtest.h>

#include <parse/extract.hpp>
#include <parse/resolver.hpp>
#include <tree/json_node.hpp>
#include <tree/yaml_node.hpp>

#include "test_util.hpp"

using namespace arazzo;

TEST(Extract, RequiredStringMissingCarriesPath) {
    auto json = nlohmann::ordered_json::parse(R"({"version":"1.0"})");
    auto info = tree::JsonNode{ json, Path{} / "info" };

    auto missing = fixtures::capture<MissingField>([&] {
        (void)parse::required_string(info, "title");
    });
    EXPECT_EQ(missing.kind, ErrorKind::MISSING_FIELD);
    EXPECT_EQ(missing.key, "title");
    EXPECT_EQ(missing.path.str(), "info.title");
    EXPECT_EQ(parse::required_string(info, "version"), "1.0");
}

TEST(Extract, WrongScalarTypeIsTypeMismatch) {
    auto json = nlohmann::ordered_json::parse(R"({"title":7,"retryAfter":"soon","ok":"yes"})");
    auto node = tree::JsonNode{ json };

    auto mismatch = fixtures::capture<TypeMismatch>([&] {
        (void)parse::required_string(node, "title");
    });
    EXPECT_EQ(mismatch.path.str(), "title");
    EXPECT_EQ(mismatch.expected, NodeKind::STRING);
    EXPECT_EQ(mismatch.actual, NodeKind::NUMBER);

    EXPECT_THROW((void)parse::optional_number(node, "retryAfter"), TypeMismatch);
    EXPECT_THROW((void)parse::optional_bool(node, "ok"), TypeMismatch);
}

TEST(Extract, OptionalFieldsAbsent) {
    auto json = nlohmann::ordered_json::parse(R"({})");
    auto node = tree::JsonNode{ json };

    EXPECT_FALSE(parse::optional_string(node, "summary").has_value());
    EXPECT_FALSE(parse::optional_number(node, "retryAfter").has_value());
    EXPECT_FALSE(parse::optional_integer(node, "retryLimit").has_value());
    EXPECT_FALSE(parse::optional_bool(node, "flag").has_value());
    EXPECT_TRUE(parse::optional_string_list(node, "dependsOn").empty());
}

TEST(Extract, RequiredTextRejectsEmpty) {
    auto json = nlohmann::ordered_json::parse(R"({"name":""})");
    auto invalid = fixtures::capture<InvalidValue>([&] {
        (void)parse::required_text(tree::JsonNode{ json }, "name");
    });
    EXPECT_EQ(invalid.path.str(), "name");
}

TEST(Extract, EnumLiterals) {
    auto json = nlohmann::ordered_json::parse(R"({"in":"header","type":"soap"})");
    auto node = tree::JsonNode{ json };

    EXPECT_EQ(parse::optional_enum<model::ParameterLocation>(node, "in"), model::ParameterLocation::HEADER);
    EXPECT_THROW((void)parse::optional_enum<model::SourceType>(node, "type"), InvalidValue);
    EXPECT_THROW((void)parse::required_enum<model::ActionType>(node, "action"), MissingField);
}

TEST(Extract, ExtensionsAreOrderedAndFiltered) {
    auto yaml = YAML::Load(R"(
name: petStore
x-zeta: 1
bogus: 2
x-alpha:
  nested: [a, b]
)");
    auto extensions = parse::extensions(tree::YamlNode{ yaml }, { "name" });

    ASSERT_EQ(extensions.size(), 2u);
    EXPECT_EQ(extensions.begin()->first, "x-zeta");
    EXPECT_EQ(extensions.at("x-zeta"), 1);
    EXPECT_EQ(extensions.at("x-alpha"), nlohmann::ordered_json::parse(R"({"nested":["a","b"]})"));
    EXPECT_EQ(extensions.find("bogus"), extensions.end());
}

TEST(Extract, RequiredListMustNotBeEmpty) {
    auto json = nlohmann::ordered_json::parse(R"({"steps":[]})");
    auto node = tree::JsonNode{ json };
    auto builder = [](tree::JsonNode const &item) {
        return parse::required_string(item, "stepId");
    };

    auto invalid = fixtures::capture<InvalidValue>([&] {
        (void)parse::required_list(node, "steps", builder);
    });
    EXPECT_EQ(invalid.path.str(), "steps");

    EXPECT_THROW((void)parse::required_list(node, "workflows", builder), MissingField);
    EXPECT_TRUE(parse::optional_list(node, "workflows", builder).empty());
}

TEST(Resolver, ValueExpressionOrLiteral) {
    auto json = nlohmann::ordered_json::parse(R"({"expr":"$inputs.id","text":"available","number":42})");
    auto node = tree::JsonNode{ json };

    EXPECT_EQ(parse::resolve_value(*node.find("expr")), model::Value{ model::Expression{ "$inputs.id" } });
    EXPECT_EQ(parse::resolve_value(*node.find("text")), model::Value{ model::any_value_t("available") });
    EXPECT_EQ(parse::resolve_value(*node.find("number")), model::Value{ model::any_value_t(42) });
}

TEST(Resolver, PayloadByNodeKind) {
    auto json = nlohmann::ordered_json::parse(R"({
        "structured": {"petId": 1, "tags": ["a"]},
        "expression": "$inputs.body",
        "scalar": "plain text",
        "number": 12.5
    })");
    auto node = tree::JsonNode{ json };

    auto structured = parse::resolve_payload(*node.find("structured"));
    ASSERT_TRUE(std::holds_alternative<model::StructuredPayload>(structured));
    EXPECT_EQ(std::get<model::StructuredPayload>(structured).value, json["structured"]);

    auto expression = parse::resolve_payload(*node.find("expression"));
    ASSERT_TRUE(std::holds_alternative<model::Expression>(expression));
    EXPECT_EQ(std::get<model::Expression>(expression).text, "$inputs.body");

    auto scalar = parse::resolve_payload(*node.find("scalar"));
    ASSERT_TRUE(std::holds_alternative<model::ScalarPayload>(scalar));
    EXPECT_EQ(std::get<model::ScalarPayload>(scalar).value, "plain text");

    auto number = parse::resolve_payload(*node.find("number"));
    ASSERT_TRUE(std::holds_alternative<model::ScalarPayload>(number));
    EXPECT_EQ(std::get<model::ScalarPayload>(number).value, 12.5);
}

TEST(Resolver, ExclusiveCandidates) {
    std::vector<parse::Candidate> const candidates{
        { "operationId", { { "operationId", parse::FieldShape::TEXT } } },
        { "workflowId", { { "workflowId", parse::FieldShape::TEXT } } },
    };

    auto single = nlohmann::ordered_json::parse(R"({"workflowId":"wf"})");
    EXPECT_EQ(parse::resolve_exclusive(tree::JsonNode{ single }, candidates), 1u);

    auto both      = nlohmann::ordered_json::parse(R"({"operationId":"op","workflowId":"wf"})");
    auto ambiguous = fixtures::capture<AmbiguousOrInvalidUnion>([&] {
        (void)parse::resolve_exclusive(tree::JsonNode{ both }, candidates);
    });
    EXPECT_EQ(ambiguous.candidates, (std::vector<std::string>{ "operationId", "workflowId" }));

    auto none = nlohmann::ordered_json::parse(R"({"operationPath":"x"})");
    EXPECT_THROW((void)parse::resolve_exclusive(tree::JsonNode{ none }, candidates), AmbiguousOrInvalidUnion);
    EXPECT_FALSE(parse::resolve_exclusive(tree::JsonNode{ none }, candidates, false).has_value());
}

TEST(Resolver, ReusableDetection) {
    auto json = nlohmann::ordered_json::parse(R"([{"reference":"$components.parameters.page"},{"name":"page"},"text"])");
    auto list = tree::JsonNode{ json }.elements();

    EXPECT_TRUE(parse::is_reusable(list[0]));
    EXPECT_FALSE(parse::is_reusable(list[1]));
    EXPECT_FALSE(parse::is_reusable(list[2]));
}
