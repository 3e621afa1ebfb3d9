#pragma once

#include <model/exceptions.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <variant>

namespace arazzo {

struct MetaEvent {
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();
};

struct SimpleEvent : public MetaEvent {
    SimpleEvent(std::string const &label, std::string const &message)
        : MetaEvent{}
        , label{ label }
        , message{ message } {
    }
    std::string label;
    std::string message;
};

struct SuccessEvent : public MetaEvent {
    SuccessEvent(
        std::string const &document,
        std::string const &title,
        std::string const &version,
        std::size_t workflows,
        std::size_t steps)
        : MetaEvent{}
        , document{ document }
        , title{ title }
        , version{ version }
        , workflows{ workflows }
        , steps{ steps } { }
    std::string document;
    std::string title;
    std::string version;
    std::size_t workflows;
    std::size_t steps;
};

struct FailureEvent : public MetaEvent {
    FailureEvent(
        std::string const &document,
        ErrorKind kind,
        std::string const &path,
        std::string const &message)
        : MetaEvent{}
        , document{ document }
        , kind{ kind }
        , path{ path }
        , message{ message } { }
    std::string document;
    ErrorKind kind;
    std::string path;
    std::string message;
};

// the re-emitted document, only rendered at high verbosity
struct OutputEvent : public MetaEvent {
    OutputEvent(
        std::string const &destination,
        std::string const &format,
        std::string const &text)
        : MetaEvent{}
        , destination{ destination }
        , format{ format }
        , text{ text } { }
    std::string destination;
    std::string format;
    std::string text;
};

using AnyEvent = std::variant<SimpleEvent, SuccessEvent, FailureEvent, OutputEvent>;

} // namespace arazzo
