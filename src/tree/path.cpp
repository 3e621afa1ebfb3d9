#include <tree/path.hpp>

#include <fmt/format.h>

namespace arazzo {

Path Path::operator/(std::string const &key) const {
    auto copy = *this;
    copy.segments_.emplace_back(key);
    return copy;
}

Path Path::operator/(std::size_t index) const {
    auto copy = *this;
    copy.segments_.emplace_back(index);
    return copy;
}

std::string Path::str() const {
    std::string out;
    for(auto const &segment : segments_) {
        if(auto const *key = std::get_if<std::string>(&segment)) {
            if(not out.empty())
                out += '.';
            out += *key;
        } else {
            out += fmt::format("[{}]", std::get<std::size_t>(segment));
        }
    }
    return out;
}

} // namespace arazzo
