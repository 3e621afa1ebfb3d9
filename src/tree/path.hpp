#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace arazzo {

/**
 * @brief Location of a node inside a document tree.
 *
 * A sequence of map keys and sequence indices starting at the document root.
 * Rendered as `workflows[0].steps[1].stepId`; the root renders as an empty string.
 */
class Path {
public:
    using segment_t = std::variant<std::string, std::size_t>;

    Path() = default;

    Path operator/(std::string const &key) const;
    Path operator/(std::size_t index) const;

    std::vector<segment_t> const &segments() const {
        return segments_;
    }

    bool empty() const {
        return segments_.empty();
    }

    std::string str() const;

    bool operator==(Path const &) const = default;

private:
    std::vector<segment_t> segments_;
};

} // namespace arazzo
