#pragma once

#include <di.hpp>

#include <reporting/events.hpp>

#include <cstddef>
#include <type_traits>

template <typename RendererType>
class ReportEngine {
    using services_t = di::Deps<RendererType>;

    services_t services_;
    bool output_enabled_;
    std::size_t successes_ = 0;
    std::size_t failures_  = 0;

public:
    struct Tally {
        std::size_t successes;
        std::size_t failures;
    };

    ReportEngine(services_t services, bool output_enabled)
        : services_{ services }
        , output_enabled_{ output_enabled } {
    }

    template <typename EventType>
    void record(EventType &&ev) {
        using event_t = std::decay_t<EventType>;
        if constexpr(std::is_same_v<event_t, SuccessEvent>)
            ++successes_;
        else if constexpr(std::is_same_v<event_t, FailureEvent>)
            ++failures_;

        if(output_enabled_)
            services_.template get<RendererType>().get()(ev);
    }

    // step outcomes recorded since the engine was created
    Tally tally() const {
        return { successes_, failures_ };
    }
};
