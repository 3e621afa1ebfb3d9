#pragma once

#include <reporting/events.hpp>

#include <di.hpp>

#include <cstddef>
#include <cstdlib>
#include <utility>
#include <variant>
#include <vector>

namespace arazzo {

struct ReportTally {
    std::size_t documents = 0;
    std::size_t failures  = 0;
    std::size_t outputs   = 0;
};

/**
 * @brief Keeps the tally of reported outcomes and feeds the renderer.
 *
 * With sync output every event is rendered as it is recorded. Otherwise
 * events are held back, in recording order, until flush().
 */
template <typename RendererType>
class ReportEngine {
    using services_t = di::Deps<RendererType>;

    services_t services_;
    bool sync_output_;
    ReportTally tally_;
    std::vector<AnyEvent> pending_;

public:
    ReportEngine(services_t services, bool sync_output)
        : services_{ services }
        , sync_output_{ sync_output } {
    }

    template <typename EventType>
    void record(EventType &&ev) {
        count(ev);
        if(sync_output_)
            services_.template get<RendererType>().get()(ev);
        else
            pending_.emplace_back(std::forward<EventType>(ev));
    }

    void flush() {
        auto const &renderer = services_.template get<RendererType>().get();
        for(auto const &ev : std::exchange(pending_, {}))
            std::visit(renderer, ev);
    }

    ReportTally const &tally() const {
        return tally_;
    }

    // failing as soon as one recorded document failed
    int status() const {
        return tally_.failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

private:
    void count(SimpleEvent const &) { }

    void count(SuccessEvent const &) {
        ++tally_.documents;
    }

    void count(FailureEvent const &) {
        ++tally_.documents;
        ++tally_.failures;
    }

    void count(OutputEvent const &) {
        ++tally_.outputs;
    }
};

} // namespace arazzo
