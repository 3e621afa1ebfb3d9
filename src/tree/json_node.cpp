#include <model/exceptions.hpp>
#include <tree/json_node.hpp>

#include <limits>

namespace arazzo::tree {

JsonNode::JsonNode(nlohmann::ordered_json const &value, Path const &path)
    : value_{ &value }
    , path_{ path } { }

NodeKind JsonNode::kind() const {
    switch(value_->type()) {
    case nlohmann::json::value_t::object:
        return NodeKind::MAP;
    case nlohmann::json::value_t::array:
        return NodeKind::SEQUENCE;
    case nlohmann::json::value_t::string:
        return NodeKind::STRING;
    case nlohmann::json::value_t::boolean:
        return NodeKind::BOOLEAN;
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
        return NodeKind::NUMBER;
    default:
        return NodeKind::NULL_VALUE;
    }
}

std::optional<JsonNode> JsonNode::find(std::string const &key) const {
    if(not value_->is_object())
        throw ShapeMismatch(path_, NodeKind::MAP, kind());

    auto it = value_->find(key);
    if(it == value_->end())
        return std::nullopt;
    return JsonNode{ *it, path_ / key };
}

std::vector<std::pair<std::string, JsonNode>> JsonNode::entries() const {
    if(not value_->is_object())
        throw ShapeMismatch(path_, NodeKind::MAP, kind());

    std::vector<std::pair<std::string, JsonNode>> result;
    result.reserve(value_->size());
    for(auto const &item : value_->items())
        result.emplace_back(item.key(), JsonNode{ item.value(), path_ / item.key() });
    return result;
}

std::vector<JsonNode> JsonNode::elements() const {
    if(not value_->is_array())
        throw ShapeMismatch(path_, NodeKind::SEQUENCE, kind());

    std::vector<JsonNode> result;
    result.reserve(value_->size());
    for(std::size_t i = 0; i < value_->size(); ++i)
        result.emplace_back((*value_)[i], path_ / i);
    return result;
}

std::optional<std::string> JsonNode::as_string() const {
    if(not value_->is_string())
        return std::nullopt;
    return value_->get<std::string>();
}

std::optional<bool> JsonNode::as_bool() const {
    if(not value_->is_boolean())
        return std::nullopt;
    return value_->get<bool>();
}

std::optional<std::int64_t> JsonNode::as_integer() const {
    if(value_->is_number_unsigned()) {
        auto value = value_->get<std::uint64_t>();
        if(value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return std::nullopt;
        return static_cast<std::int64_t>(value);
    }
    if(value_->is_number_integer())
        return value_->get<std::int64_t>();
    return std::nullopt;
}

std::optional<double> JsonNode::as_number() const {
    if(not value_->is_number())
        return std::nullopt;
    return value_->get<double>();
}

model::any_value_t JsonNode::to_value() const {
    return *value_;
}

} // namespace arazzo::tree
