#pragma once

#include <cli/document_io.hpp>
#include <model/exceptions.hpp>
#include <reporting/events.hpp>

#include <di.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace arazzo::cli {

struct LintOptions {
    std::filesystem::path path;
    Format format = Format::AUTO;
    std::optional<std::filesystem::path> output;
    Format to = Format::AUTO; // AUTO: same as the input
};

/**
 * @brief Builds one document and reports the outcome.
 *
 * Document errors are reported as a FailureEvent; the exit status is the
 * report engine's. I/O and syntax errors propagate to the caller.
 */
template <typename ReportEngineType>
class Linter {
    using reporting_t = ReportEngineType;
    using services_t  = di::Deps<reporting_t>;

    services_t services_;
    LintOptions options_;

public:
    Linter(services_t services, LintOptions const &options)
        : services_{ services }
        , options_{ options } { }

    int run() {
        auto const &reporting = services_.template get<reporting_t>();
        auto const document   = options_.path.string();
        auto const input      = resolve_format(options_.path, options_.format);

        reporting.get().record(SimpleEvent{ "LOAD " + to_string(input), document });

        try {
            auto description = load_document(options_.path, input);
            reporting.get().record(SuccessEvent{
                document, description.info.title, description.arazzo, description.workflows.size(), count_steps(description) });

            if(options_.output)
                write(description, options_.to == Format::AUTO ? input : options_.to);

        } catch(DocumentException const &e) {
            reporting.get().record(FailureEvent{ document, e.kind, e.path.str(), e.what() });
        }

        return reporting.get().status();
    }

private:
    void write(model::Description const &description, Format format) {
        auto const &reporting = services_.template get<reporting_t>();
        auto const text       = render_document(description, format);
        auto const &output    = *options_.output;

        save_document(text, output);
        reporting.get().record(OutputEvent{ output.string(), to_string(format), text });
    }

    static std::size_t count_steps(model::Description const &description) {
        std::size_t steps = 0;
        for(auto const &workflow : description.workflows)
            steps += workflow.steps.size();
        return steps;
    }
};

} // namespace arazzo::cli
