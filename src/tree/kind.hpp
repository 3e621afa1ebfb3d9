#pragma once

#include <string_view>

namespace arazzo {

enum class NodeKind {
    MAP,
    SEQUENCE,
    STRING,
    NUMBER,
    BOOLEAN,
    NULL_VALUE,
};

constexpr std::string_view to_string(NodeKind kind) {
    switch(kind) {
    case NodeKind::MAP:
        return "map";
    case NodeKind::SEQUENCE:
        return "sequence";
    case NodeKind::STRING:
        return "string";
    case NodeKind::NUMBER:
        return "number";
    case NodeKind::BOOLEAN:
        return "bool";
    case NodeKind::NULL_VALUE:
        return "null";
    }
    return "unknown";
}

} // namespace arazzo
