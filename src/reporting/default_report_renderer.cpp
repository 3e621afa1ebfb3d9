#include <reporting/default_report_renderer.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

namespace arazzo {

DefaultReportRenderer::DefaultReportRenderer(uint16_t verbose)
    : verbose{ verbose } { }

void DefaultReportRenderer::operator()(SimpleEvent const &ev) const {
    if(verbose < 1)
        return;
    fmt::print(fg(fmt::color::ghost_white), "? | ");
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "{} ", ev.label);
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}\n", ev.message);
}

void DefaultReportRenderer::operator()(SuccessEvent const &ev) const {
    if(verbose < 1)
        return;
    fmt::print(fg(fmt::color::ghost_white), "+ | ");
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "VALID ");
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}", ev.document);
    fmt::print(" '{}' (arazzo {}): {} workflow(s), {} step(s)\n", ev.title, ev.version, ev.workflows, ev.steps);
}

std::string DefaultReportRenderer::operator()(ErrorKind kind) const {
    switch(kind) {
    case ErrorKind::SHAPE_MISMATCH:
    case ErrorKind::TYPE_MISMATCH:
        return fmt::format(fg(fmt::color::indian_red) | fmt::emphasis::bold, "{}", to_string(kind));
    case ErrorKind::MISSING_FIELD:
    case ErrorKind::INVALID_VALUE:
        return fmt::format(fg(fmt::color::orange_red) | fmt::emphasis::bold, "{}", to_string(kind));
    default:
        return fmt::format(fg(fmt::color::red) | fmt::emphasis::bold, "{}", to_string(kind));
    }
}

void DefaultReportRenderer::operator()(FailureEvent const &ev) const {
    if(verbose < 1)
        return;

    auto where = ev.path.empty() ? std::string{ "<root>" } : ev.path;
    auto path  = fmt::format(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}", where);

    fmt::print(fg(fmt::color::ghost_white), "- | ");
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "INVALID ");
    fmt::print("'{}': {} [{}]: {}\n",
        fmt::format(fg(fmt::color::pale_violet_red) | fmt::emphasis::bold, "{}", ev.document),
        this->operator()(ev.kind), path, ev.message);
}

void DefaultReportRenderer::operator()(OutputEvent const &ev) const {
    if(verbose < 2)
        return;

    fmt::print(fg(fmt::color::ghost_white), "? | ");
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "OUTPUT ");
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{} ({})\n", ev.destination, ev.format);
    fmt::print("---\n{}\n---\n", fmt::format(fg(fmt::color::blue_violet) | fmt::emphasis::italic, "{}", ev.text));
}

} // namespace arazzo
