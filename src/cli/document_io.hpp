#pragma once

#include <model/descriptors.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace arazzo::cli {

enum class Format {
    AUTO,
    JSON,
    YAML,
};

std::string to_string(Format format);

// throws std::invalid_argument for anything but auto, json or yaml
Format format_from_string(std::string const &text);

/**
 * @brief Settles the format of a file.
 *
 * An explicit format wins; AUTO picks JSON for `.json` and YAML otherwise
 * (YAML being a superset of JSON).
 */
Format resolve_format(std::filesystem::path const &path, Format requested);

/**
 * @brief Reads, parses and builds the document stored at `path`.
 *
 * I/O and syntax errors surface as std::runtime_error (or the parser's own
 * exception types); document errors as DocumentException.
 */
model::Description load_document(std::filesystem::path const &path, Format format);

// text of the re-emitted document, `format` must not be AUTO
std::string render_document(model::Description const &description, Format format);

void save_document(std::string const &text, std::filesystem::path const &path);

} // namespace arazzo::cli
