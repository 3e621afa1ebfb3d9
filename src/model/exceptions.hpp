#pragma once

#include <model/descriptors.hpp>
#include <tree/kind.hpp>
#include <tree/path.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace arazzo {

enum class ErrorKind {
    SHAPE_MISMATCH,
    MISSING_FIELD,
    TYPE_MISMATCH,
    AMBIGUOUS_OR_INVALID_UNION,
    DUPLICATE_IDENTIFIER,
    DANGLING_REFERENCE,
    UNSUPPORTED_VERSION,
    INVALID_VALUE,
};

std::string_view to_string(ErrorKind kind);

/**
 * @brief Base of every document build failure.
 *
 * Carries the kind of failure and the location of the offending node.
 * Builders throw on the first problem they find; nothing is accumulated.
 */
struct DocumentException : public std::runtime_error {
    DocumentException(ErrorKind kind, Path const &path, std::string const &message);

    ErrorKind kind;
    Path path;
};

struct ShapeMismatch : public DocumentException {
    ShapeMismatch(Path const &path, NodeKind expected, NodeKind actual);

    NodeKind expected;
    NodeKind actual;
};

struct MissingField : public DocumentException {
    MissingField(Path const &path, std::string const &key);

    std::string key;
};

struct TypeMismatch : public DocumentException {
    TypeMismatch(Path const &path, std::string const &key, NodeKind expected, NodeKind actual);

    std::string key;
    NodeKind expected;
    NodeKind actual;
};

struct AmbiguousOrInvalidUnion : public DocumentException {
    AmbiguousOrInvalidUnion(Path const &path, std::vector<std::string> const &candidates, std::string const &detail);

    std::vector<std::string> candidates;
};

struct DuplicateIdentifier : public DocumentException {
    DuplicateIdentifier(Path const &path, std::string const &name);

    std::string name;
};

struct DanglingReference : public DocumentException {
    DanglingReference(Path const &path, std::string const &reference, model::ReferenceKind expected_kind);

    std::string reference;
    model::ReferenceKind expected_kind;
};

struct UnsupportedVersion : public DocumentException {
    UnsupportedVersion(Path const &path, std::string const &found, std::vector<std::string> const &supported);

    std::string found;
    std::vector<std::string> supported;
};

// a value is present and well typed but violates a constraint of the format
struct InvalidValue : public DocumentException {
    InvalidValue(Path const &path, std::string const &key, std::string const &reason);

    std::string key;
    std::string reason;
};

} // namespace arazzo
