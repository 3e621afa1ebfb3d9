#pragma once

#include <reporting/events.hpp>

#include <cstdint>
#include <string>

namespace arazzo {

struct DefaultReportRenderer {
    uint16_t verbose;
    DefaultReportRenderer(uint16_t verbose);

    void operator()(SimpleEvent const &ev) const;
    void operator()(SuccessEvent const &ev) const;
    void operator()(FailureEvent const &ev) const;
    void operator()(OutputEvent const &ev) const;

    std::string operator()(ErrorKind kind) const;
};

} // namespace arazzo
