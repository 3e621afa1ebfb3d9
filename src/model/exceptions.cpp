#include <model/exceptions.hpp>
#include <model/literals.hpp>

#include <fmt/format.h>

namespace arazzo {

namespace {

std::string where(Path const &path) {
    if(path.empty())
        return "<root>";
    return path.str();
}

} // namespace

std::string_view to_string(ErrorKind kind) {
    switch(kind) {
    case ErrorKind::SHAPE_MISMATCH:
        return "ShapeMismatch";
    case ErrorKind::MISSING_FIELD:
        return "MissingField";
    case ErrorKind::TYPE_MISMATCH:
        return "TypeMismatch";
    case ErrorKind::AMBIGUOUS_OR_INVALID_UNION:
        return "AmbiguousOrInvalidUnion";
    case ErrorKind::DUPLICATE_IDENTIFIER:
        return "DuplicateIdentifier";
    case ErrorKind::DANGLING_REFERENCE:
        return "DanglingReference";
    case ErrorKind::UNSUPPORTED_VERSION:
        return "UnsupportedVersion";
    case ErrorKind::INVALID_VALUE:
        return "InvalidValue";
    }
    return "Unknown";
}

DocumentException::DocumentException(ErrorKind kind, Path const &path, std::string const &message)
    : std::runtime_error{ message }
    , kind{ kind }
    , path{ path } { }

ShapeMismatch::ShapeMismatch(Path const &path, NodeKind expected, NodeKind actual)
    : DocumentException{ ErrorKind::SHAPE_MISMATCH, path,
        fmt::format("{}: expected {}, got {}", where(path), to_string(expected), to_string(actual)) }
    , expected{ expected }
    , actual{ actual } { }

MissingField::MissingField(Path const &path, std::string const &key)
    : DocumentException{ ErrorKind::MISSING_FIELD, path,
        fmt::format("{}: required field '{}' is missing", where(path), key) }
    , key{ key } { }

TypeMismatch::TypeMismatch(Path const &path, std::string const &key, NodeKind expected, NodeKind actual)
    : DocumentException{ ErrorKind::TYPE_MISMATCH, path,
        fmt::format("{}: field '{}' must be a {}, got {}", where(path), key, to_string(expected), to_string(actual)) }
    , key{ key }
    , expected{ expected }
    , actual{ actual } { }

AmbiguousOrInvalidUnion::AmbiguousOrInvalidUnion(Path const &path, std::vector<std::string> const &candidates, std::string const &detail)
    : DocumentException{ ErrorKind::AMBIGUOUS_OR_INVALID_UNION, path,
        fmt::format("{}: {} (candidates: {})", where(path), detail, fmt::join(candidates, ", ")) }
    , candidates{ candidates } { }

DuplicateIdentifier::DuplicateIdentifier(Path const &path, std::string const &name)
    : DocumentException{ ErrorKind::DUPLICATE_IDENTIFIER, path,
        fmt::format("{}: identifier '{}' is already used", where(path), name) }
    , name{ name } { }

DanglingReference::DanglingReference(Path const &path, std::string const &reference, model::ReferenceKind expected_kind)
    : DocumentException{ ErrorKind::DANGLING_REFERENCE, path,
        fmt::format("{}: '{}' does not resolve to a {}", where(path), reference, model::to_string(expected_kind)) }
    , reference{ reference }
    , expected_kind{ expected_kind } { }

UnsupportedVersion::UnsupportedVersion(Path const &path, std::string const &found, std::vector<std::string> const &supported)
    : DocumentException{ ErrorKind::UNSUPPORTED_VERSION, path,
        fmt::format("unsupported arazzo version '{}' (supported: {})", found, fmt::join(supported, ", ")) }
    , found{ found }
    , supported{ supported } { }

InvalidValue::InvalidValue(Path const &path, std::string const &key, std::string const &reason)
    : DocumentException{ ErrorKind::INVALID_VALUE, path,
        fmt::format("{}: invalid '{}': {}", where(path), key, reason) }
    , key{ key }
    , reason{ reason } { }

} // namespace arazzo
