#include <gtest/gtest.h>

#include <model/exceptions.hpp>
#include <tree/json_node.hpp>
#include <tree/yaml_node.hpp>

#include "test_util.hpp"

#include <cmath>
#include <string>

using namespace arazzo;

TEST(Tree, PathRendering) {
    auto path = Path{} / "workflows" / 0 / "steps" / 1 / "stepId";
    EXPECT_EQ(path.str(), "workflows[0].steps[1].stepId");
    EXPECT_EQ(Path{}.str(), "");
    EXPECT_TRUE(Path{}.empty());
    EXPECT_FALSE(path.empty());
}

TEST(Tree, JsonKinds) {
    auto json = nlohmann::ordered_json::parse(R"({"m":{},"s":[],"t":"x","n":1.5,"b":false,"z":null})");
    auto root = tree::JsonNode{ json };

    EXPECT_EQ(root.kind(), NodeKind::MAP);
    EXPECT_EQ(root.find("m")->kind(), NodeKind::MAP);
    EXPECT_EQ(root.find("s")->kind(), NodeKind::SEQUENCE);
    EXPECT_EQ(root.find("t")->kind(), NodeKind::STRING);
    EXPECT_EQ(root.find("n")->kind(), NodeKind::NUMBER);
    EXPECT_EQ(root.find("b")->kind(), NodeKind::BOOLEAN);
    EXPECT_EQ(root.find("z")->kind(), NodeKind::NULL_VALUE);
    EXPECT_FALSE(root.find("missing").has_value());
}

TEST(Tree, JsonScalarsAreStrict) {
    auto json = nlohmann::ordered_json::parse(R"({"n":42,"t":"42"})");
    auto root = tree::JsonNode{ json };

    EXPECT_FALSE(root.find("n")->as_string().has_value());
    EXPECT_EQ(root.find("n")->as_integer(), 42);
    EXPECT_EQ(root.find("t")->as_string(), "42");
    EXPECT_FALSE(root.find("t")->as_integer().has_value());
}

TEST(Tree, JsonEntriesKeepOrderAndPaths) {
    auto json    = nlohmann::ordered_json::parse(R"({"z":1,"a":2,"m":3})");
    auto entries = tree::JsonNode{ json, Path{} / "outputs" }.entries();

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].first, "z");
    EXPECT_EQ(entries[1].first, "a");
    EXPECT_EQ(entries[2].first, "m");
    EXPECT_EQ(entries[1].second.path().str(), "outputs.a");
}

TEST(Tree, WrongKindAccessIsShapeMismatch) {
    auto json     = nlohmann::ordered_json::parse(R"({"steps":[1,2]})");
    auto steps    = *tree::JsonNode{ json }.find("steps");
    auto mismatch = fixtures::capture<ShapeMismatch>([&] {
        (void)steps.find("stepId");
    });

    EXPECT_EQ(mismatch.kind, ErrorKind::SHAPE_MISMATCH);
    EXPECT_EQ(mismatch.path.str(), "steps");
    EXPECT_EQ(mismatch.expected, NodeKind::MAP);
    EXPECT_EQ(mismatch.actual, NodeKind::SEQUENCE);

    EXPECT_THROW((void)steps.elements()[0].elements(), ShapeMismatch);
    EXPECT_EQ(steps.elements()[1].path().str(), "steps[1]");
}

TEST(Tree, YamlCoreSchemaTyping) {
    auto yaml = YAML::Load(R"(
int: 12
hex: 0x1F
octal: 0o17
float: 1.5
exp: 1e3
inf: -.inf
yes: true
no: False
tilde: ~
word: null
empty:
text: hello
quoted: "12"
single: 'true'
tagged: !!str 7
)");
    auto root = tree::YamlNode{ yaml };

    EXPECT_EQ(root.find("int")->kind(), NodeKind::NUMBER);
    EXPECT_EQ(root.find("int")->as_integer(), 12);
    EXPECT_EQ(root.find("hex")->as_integer(), 31);
    EXPECT_EQ(root.find("octal")->as_integer(), 15);
    EXPECT_EQ(root.find("float")->as_number(), 1.5);
    EXPECT_EQ(root.find("exp")->as_number(), 1000.0);
    EXPECT_EQ(root.find("inf")->kind(), NodeKind::NUMBER);
    EXPECT_EQ(root.find("yes")->as_bool(), true);
    EXPECT_EQ(root.find("no")->as_bool(), false);
    EXPECT_EQ(root.find("tilde")->kind(), NodeKind::NULL_VALUE);
    EXPECT_EQ(root.find("word")->kind(), NodeKind::NULL_VALUE);
    EXPECT_EQ(root.find("empty")->kind(), NodeKind::NULL_VALUE);
    EXPECT_EQ(root.find("text")->kind(), NodeKind::STRING);
    EXPECT_EQ(root.find("quoted")->kind(), NodeKind::STRING);
    EXPECT_EQ(root.find("single")->kind(), NodeKind::STRING);
    EXPECT_EQ(root.find("tagged")->kind(), NodeKind::STRING);
    EXPECT_FALSE(root.find("quoted")->as_integer().has_value());
}

TEST(Tree, YamlScalarsReadAsText) {
    auto yaml = YAML::Load("version: 1.0\ncount: 3\n");
    auto root = tree::YamlNode{ yaml };

    EXPECT_EQ(root.find("version")->as_string(), "1.0");
    EXPECT_EQ(root.find("count")->as_string(), "3");
}

TEST(Tree, YamlToValue) {
    auto yaml  = YAML::Load("b: [x, true, 2, 2.5, ~]\na: {nested: '1'}\n");
    auto value = tree::YamlNode{ yaml }.to_value();

    auto expected = nlohmann::ordered_json::parse(R"({"b":["x",true,2,2.5,null],"a":{"nested":"1"}})");
    EXPECT_EQ(value, expected);
    EXPECT_EQ(value.begin().key(), "b");
}

TEST(Tree, YamlOutOfRangeNumbers) {
    auto yaml = YAML::Load(
        "x-big: 1e400\n"
        "x-neg-big: -1e400\n"
        "x-tiny: 1e-400\n"
        "x-long: 1" + std::string(400, '0') + "\n"
        "x-u64: 18446744073709551615\n"
        "x-n: -9223372036854775809\n");
    auto root = tree::YamlNode{ yaml };

    auto big = root.find("x-big")->to_value();
    ASSERT_TRUE(big.is_number_float());
    EXPECT_TRUE(std::isinf(big.get<double>()));
    EXPECT_GT(big.get<double>(), 0.0);
    EXPECT_TRUE(std::isinf(*root.find("x-big")->as_number()));

    auto neg_big = root.find("x-neg-big")->to_value();
    EXPECT_TRUE(std::isinf(neg_big.get<double>()));
    EXPECT_LT(neg_big.get<double>(), 0.0);

    EXPECT_EQ(root.find("x-tiny")->to_value().get<double>(), 0.0);

    auto long_value = root.find("x-long")->to_value();
    ASSERT_TRUE(long_value.is_number_float());
    EXPECT_TRUE(std::isinf(long_value.get<double>()));
    EXPECT_TRUE(std::isinf(*root.find("x-long")->as_number()));

    auto u64 = root.find("x-u64")->to_value();
    ASSERT_TRUE(u64.is_number_unsigned());
    EXPECT_EQ(u64.get<std::uint64_t>(), 18446744073709551615ULL);

    auto below_min = root.find("x-n")->to_value();
    ASSERT_TRUE(below_min.is_number_float());
    EXPECT_LT(below_min.get<double>(), 0.0);
    EXPECT_EQ(below_min, nlohmann::ordered_json::parse("-9223372036854775809"));
}

TEST(Tree, YamlPathsAndShapeMismatch) {
    auto yaml  = YAML::Load("workflows:\n- steps: oops\n");
    auto root  = tree::YamlNode{ yaml };
    auto steps = *root.find("workflows")->elements()[0].find("steps");

    EXPECT_EQ(steps.path().str(), "workflows[0].steps");
    auto mismatch = fixtures::capture<ShapeMismatch>([&] {
        (void)steps.elements();
    });
    EXPECT_EQ(mismatch.path.str(), "workflows[0].steps");
    EXPECT_EQ(mismatch.expected, NodeKind::SEQUENCE);
    EXPECT_EQ(mismatch.actual, NodeKind::STRING);
}

TEST(Tree, ToYamlKeepsStringsAsStrings) {
    auto value = nlohmann::ordered_json::parse(R"({"text":"123","flag":"true","none":"null","number":123,"real":0.5})");
    auto node  = tree::to_yaml(value);
    auto root  = tree::YamlNode{ node };

    EXPECT_EQ(root.find("text")->kind(), NodeKind::STRING);
    EXPECT_EQ(root.find("flag")->kind(), NodeKind::STRING);
    EXPECT_EQ(root.find("none")->kind(), NodeKind::STRING);
    EXPECT_EQ(root.find("number")->kind(), NodeKind::NUMBER);
    EXPECT_EQ(root.to_value(), value);
}

TEST(Tree, YamlComplexKeysAreRejected) {
    auto yaml = YAML::Load("? [a, b]\n: value\n");
    EXPECT_THROW((void)tree::YamlNode{ yaml }.entries(), ShapeMismatch);
}
