#include <model/exceptions.hpp>
#include <tree/yaml_node.hpp>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>

namespace arazzo::tree {

namespace {

enum class ScalarType {
    NULL_VALUE,
    BOOLEAN,
    INTEGER,
    FLOAT,
    STRING,
};

std::string const STR_TAG   = "tag:yaml.org,2002:str";
std::string const INT_TAG   = "tag:yaml.org,2002:int";
std::string const FLOAT_TAG = "tag:yaml.org,2002:float";
std::string const BOOL_TAG  = "tag:yaml.org,2002:bool";
std::string const NULL_TAG  = "tag:yaml.org,2002:null";

bool is_null_text(std::string const &text) {
    return text.empty() or text == "~" or text == "null" or text == "Null" or text == "NULL";
}

bool is_true_text(std::string const &text) {
    return text == "true" or text == "True" or text == "TRUE";
}

bool is_false_text(std::string const &text) {
    return text == "false" or text == "False" or text == "FALSE";
}

bool is_int_text(std::string const &text) {
    static std::regex const pattern{ R"([-+]?[0-9]+|0o[0-7]+|0x[0-9a-fA-F]+)" };
    return std::regex_match(text, pattern);
}

bool is_float_text(std::string const &text) {
    static std::regex const pattern{
        R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?|[-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))"
    };
    return std::regex_match(text, pattern);
}

ScalarType classify(YAML::Node const &node) {
    if(node.IsNull() or not node.IsDefined())
        return ScalarType::NULL_VALUE;

    auto const &tag  = node.Tag();
    auto const &text = node.Scalar();

    if(tag == "!" or tag == STR_TAG)
        return ScalarType::STRING;
    if(tag == NULL_TAG)
        return ScalarType::NULL_VALUE;
    if(tag == BOOL_TAG)
        return ScalarType::BOOLEAN;
    if(tag == INT_TAG)
        return ScalarType::INTEGER;
    if(tag == FLOAT_TAG)
        return ScalarType::FLOAT;

    if(is_null_text(text))
        return ScalarType::NULL_VALUE;
    if(is_true_text(text) or is_false_text(text))
        return ScalarType::BOOLEAN;
    if(is_int_text(text))
        return ScalarType::INTEGER;
    if(is_float_text(text))
        return ScalarType::FLOAT;
    return ScalarType::STRING;
}

std::optional<std::int64_t> parse_integer(std::string const &text) {
    try {
        if(text.starts_with("0x"))
            return std::stoll(text.substr(2), nullptr, 16);
        if(text.starts_with("0o"))
            return std::stoll(text.substr(2), nullptr, 8);
        return std::stoll(text);
    } catch(std::out_of_range const &) {
        return std::nullopt;
    } catch(std::invalid_argument const &) {
        return std::nullopt;
    }
}

double parse_float(std::string const &text) {
    if(text.find("inf") != std::string::npos or text.find("Inf") != std::string::npos or text.find("INF") != std::string::npos)
        return text.starts_with('-') ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    if(text.find("nan") != std::string::npos or text.find("NaN") != std::string::npos or text.find("NAN") != std::string::npos)
        return std::numeric_limits<double>::quiet_NaN();
    try {
        return std::stod(text);
    } catch(std::out_of_range const &) {
        // overflow saturates to infinity and underflow to zero
        return std::strtod(text.c_str(), nullptr);
    }
}

model::any_value_t integer_value(std::string const &text) {
    if(auto value = parse_integer(text); value)
        return *value;

    // beyond int64: only non-negative decimals still fit, stoull wraps negatives
    auto const is_decimal = not text.starts_with("0x") and not text.starts_with("0o");
    if(is_decimal and not text.starts_with('-')) {
        try {
            return static_cast<std::uint64_t>(std::stoull(text));
        } catch(std::out_of_range const &) {
            return parse_float(text);
        }
    }
    return parse_float(text);
}

} // namespace

YamlNode::YamlNode(YAML::Node const &node, Path const &path)
    : node_{ node }
    , path_{ path } { }

NodeKind YamlNode::kind() const {
    switch(node_.Type()) {
    case YAML::NodeType::Map:
        return NodeKind::MAP;
    case YAML::NodeType::Sequence:
        return NodeKind::SEQUENCE;
    case YAML::NodeType::Scalar:
        switch(classify(node_)) {
        case ScalarType::NULL_VALUE:
            return NodeKind::NULL_VALUE;
        case ScalarType::BOOLEAN:
            return NodeKind::BOOLEAN;
        case ScalarType::INTEGER:
        case ScalarType::FLOAT:
            return NodeKind::NUMBER;
        case ScalarType::STRING:
            return NodeKind::STRING;
        }
        return NodeKind::STRING;
    default:
        return NodeKind::NULL_VALUE;
    }
}

std::optional<YamlNode> YamlNode::find(std::string const &key) const {
    if(not node_.IsMap())
        throw ShapeMismatch(path_, NodeKind::MAP, kind());

    YAML::Node const &map = node_;
    auto value            = map[key];
    if(not value.IsDefined())
        return std::nullopt;
    return YamlNode{ value, path_ / key };
}

std::vector<std::pair<std::string, YamlNode>> YamlNode::entries() const {
    if(not node_.IsMap())
        throw ShapeMismatch(path_, NodeKind::MAP, kind());

    std::vector<std::pair<std::string, YamlNode>> result;
    result.reserve(node_.size());
    for(auto const &entry : node_) {
        if(not entry.first.IsScalar()) {
            auto key = YamlNode{ entry.first, path_ };
            throw ShapeMismatch(path_, NodeKind::STRING, key.kind());
        }
        auto key = entry.first.Scalar();
        result.emplace_back(key, YamlNode{ entry.second, path_ / key });
    }
    return result;
}

std::vector<YamlNode> YamlNode::elements() const {
    if(not node_.IsSequence())
        throw ShapeMismatch(path_, NodeKind::SEQUENCE, kind());

    std::vector<YamlNode> result;
    result.reserve(node_.size());
    for(std::size_t i = 0; i < node_.size(); ++i)
        result.emplace_back(node_[i], path_ / i);
    return result;
}

std::optional<std::string> YamlNode::as_string() const {
    if(not node_.IsScalar())
        return std::nullopt;
    return node_.Scalar();
}

std::optional<bool> YamlNode::as_bool() const {
    if(not node_.IsScalar() or classify(node_) != ScalarType::BOOLEAN)
        return std::nullopt;
    return is_true_text(node_.Scalar());
}

std::optional<std::int64_t> YamlNode::as_integer() const {
    if(not node_.IsScalar() or classify(node_) != ScalarType::INTEGER)
        return std::nullopt;
    return parse_integer(node_.Scalar());
}

std::optional<double> YamlNode::as_number() const {
    if(not node_.IsScalar())
        return std::nullopt;

    switch(classify(node_)) {
    case ScalarType::INTEGER:
        if(auto value = parse_integer(node_.Scalar()); value)
            return static_cast<double>(*value);
        return parse_float(node_.Scalar());
    case ScalarType::FLOAT:
        return parse_float(node_.Scalar());
    default:
        return std::nullopt;
    }
}

model::any_value_t YamlNode::to_value() const {
    switch(kind()) {
    case NodeKind::MAP: {
        auto object = model::any_value_t::object();
        for(auto const &[key, value] : entries())
            object[key] = value.to_value();
        return object;
    }
    case NodeKind::SEQUENCE: {
        auto array = model::any_value_t::array();
        for(auto const &element : elements())
            array.push_back(element.to_value());
        return array;
    }
    case NodeKind::STRING:
        return node_.Scalar();
    case NodeKind::BOOLEAN:
        return is_true_text(node_.Scalar());
    case NodeKind::NUMBER:
        if(classify(node_) == ScalarType::INTEGER)
            return integer_value(node_.Scalar());
        return parse_float(node_.Scalar());
    case NodeKind::NULL_VALUE:
        return nullptr;
    }
    return nullptr;
}

YAML::Node to_yaml(model::any_value_t const &value) {
    switch(value.type()) {
    case nlohmann::json::value_t::object: {
        YAML::Node map{ YAML::NodeType::Map };
        for(auto const &item : value.items())
            map[item.key()] = to_yaml(item.value());
        return map;
    }
    case nlohmann::json::value_t::array: {
        YAML::Node seq{ YAML::NodeType::Sequence };
        for(auto const &element : value)
            seq.push_back(to_yaml(element));
        return seq;
    }
    case nlohmann::json::value_t::string: {
        YAML::Node scalar{ value.get<std::string>() };
        scalar.SetTag("!");
        return scalar;
    }
    case nlohmann::json::value_t::boolean:
        return YAML::Node{ value.get<bool>() };
    case nlohmann::json::value_t::number_integer:
        return YAML::Node{ value.get<std::int64_t>() };
    case nlohmann::json::value_t::number_unsigned:
        return YAML::Node{ value.get<std::uint64_t>() };
    case nlohmann::json::value_t::number_float:
        return YAML::Node{ value.get<double>() };
    default:
        return YAML::Node{ YAML::NodeType::Null };
    }
}

} // namespace arazzo::tree
