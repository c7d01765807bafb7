#pragma once

#include <extraction/extractor.hpp>
#include <flow/endpoints.hpp>
#include <flow/exceptions.hpp>
#include <flow/graph.hpp>
#include <flow/instructions.hpp>
#include <flow/resolver.hpp>
#include <flow/session_state.hpp>
#include <flow/step/execute.hpp>
#include <flow/substitution.hpp>
#include <reporting/events.hpp>
#include <web/concepts.hpp>

#include <di.hpp>
#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <inja/inja.hpp>

#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <vector>

// everything a session needs besides the graph, owned by the session
struct SessionContext {
    std::string base_url;
    EndpointMap discovered;
    EndpointMap defaults; // absolute
    InputMap inputs;
};

/**
 * @brief Drives one walkthrough over a validated step graph
 *
 * run() executes eligible automatic steps until no more progress is
 * possible and surfaces eligible manual steps. External signals (complete,
 * retry, restart, set_input) are validated and rejected with SessionError
 * without touching the state. InvariantError escapes and ends the session.
 */
template <HttpFetcher FetcherType, typename ReportEngineType>
class Session {
    using fetcher_t      = FetcherType;
    using reporting_t    = ReportEngineType;
    using services_t     = di::Deps<fetcher_t, reporting_t>;
    using execute_step_t = step::Execute<fetcher_t, reporting_t, FieldExtractor>;

    services_t services_;
    std::reference_wrapper<const StepGraph> graph_;
    SessionContext context_;
    SessionState state_;
    DependencyResolver resolver_;
    execute_step_t executor_;
    std::set<std::string, std::less<>> announced_;

public:
    struct Outcome {
        enum class Type {
            DONE,
            WAITING,
            FAILED,
        };

        Type type;
        std::vector<std::string> waiting; // eligible manual steps
        std::vector<std::string> failed;
    };

    Session(services_t services, StepGraph const &graph, SessionContext context)
        : services_{ services }
        , graph_{ std::cref(graph) }
        , context_{ std::move(context) }
        , state_{ graph }
        , resolver_{ graph }
        , executor_{ services, context_.base_url } {
    }

    /**
     * @brief One scheduling pass
     *
     * Repeats until a round executes nothing. Failed steps are never
     * re-attempted here; that takes an explicit retry.
     */
    Outcome run() {
        auto const &graph = graph_.get();

        for(auto progressed = true; progressed;) {
            progressed = false;

            for(auto const &id : resolver_.eligible_steps(state_)) {
                auto const &step = graph.step(id);

                if(step.manual()) {
                    announce(step);
                    continue;
                }
                if(state_.status(id) != StepStatus::PENDING)
                    continue;

                progressed = true;
                try {
                    auto const request = render(step, state_, context_.discovered, context_.defaults, context_.inputs);
                    auto const &result = executor_.perform(step, request, state_);
                    if(result.status == StepStatus::COMPLETED)
                        show_instructions(step);
                } catch(SubstitutionError const &e) {
                    executor_.reject(step, e, state_);
                }
            }
        }

        return outcome();
    }

    Outcome outcome() const {
        Outcome result{ Outcome::Type::WAITING, {}, {} };
        auto completed = std::size_t{ 0 };

        for(auto const &step : graph_.get().steps()) {
            auto const status = state_.status(step.id());
            if(status == StepStatus::COMPLETED)
                ++completed;
            else if(status == StepStatus::FAILED)
                result.failed.push_back(step.id());
            else if(step.manual() and resolver_.is_eligible(step.id(), state_))
                result.waiting.push_back(step.id());
        }

        if(completed == graph_.get().steps().size())
            result.type = Outcome::Type::DONE;
        else if(not result.failed.empty())
            result.type = Outcome::Type::FAILED;
        return result;
    }

    // external completion signal for a manual step
    void complete(std::string const &id, FieldMap fields) {
        state_.complete_manual(id, std::move(fields));

        auto const &step = graph_.get().step(id);
        report(SuccessEvent{ id, step.definition.title, inja::json(state_.result(id)->fields) });
    }

    // clears a failed step so the next pass attempts it again
    void retry(std::string const &id) {
        if(state_.status(id) != StepStatus::FAILED)
            throw SessionError{ fmt::format("step '{}' is {}; only failed steps can be retried", id, to_string(state_.status(id))) };

        state_.reset(id);
        report(SimpleEvent{ "RETRY", id });
    }

    // clears a finished step and everything downstream of it
    std::vector<std::string> restart(std::string const &id) {
        auto const status = state_.status(id);
        if(status != StepStatus::COMPLETED and status != StepStatus::FAILED)
            throw SessionError{ fmt::format("step '{}' is {}; there is nothing to restart", id, to_string(status)) };

        auto const cleared = state_.reset(id);
        for(auto const &target : cleared)
            announced_.erase(target);

        report(SimpleEvent{ "RESET", fmt::format("{}", fmt::join(cleared, ", ")) });
        return cleared;
    }

    void set_input(std::string const &name, std::string value) {
        auto const &inputs = graph_.get().inputs();
        auto const declared = std::any_of(std::begin(inputs), std::end(inputs),
            [&name](descriptor::Input const &input) { return input.name == name; });
        if(not declared)
            throw SessionError{ fmt::format("no input named '{}' is declared", name) };

        context_.inputs[name] = std::move(value);
    }

    std::vector<StatusEvent::Row> status_rows() const {
        std::vector<StatusEvent::Row> rows;

        for(auto const &step : graph_.get().steps()) {
            StatusEvent::Row row{ step.id(), step.definition.title, "", step.manual(), {} };

            auto const status = state_.status(step.id());
            if(status != StepStatus::PENDING) {
                row.state = std::string{ to_string(status) };
            } else if(resolver_.is_eligible(step.id(), state_)) {
                row.state = "candidate";
            } else {
                row.state = "blocked";
                std::copy_if(std::begin(step.dependencies), std::end(step.dependencies), std::back_inserter(row.waiting_on),
                    [this](std::string const &dependency) { return not state_.is_completed(dependency); });
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    StepDetailEvent detail(std::string const &id) const {
        auto const &step = graph_.get().step(id);

        StepDetailEvent ev;
        ev.step             = id;
        ev.title            = step.definition.title;
        ev.state            = std::string{ to_string(state_.status(id)) };
        ev.fields           = inja::json::object();
        ev.request_template = step.template_text.value_or("");

        if(auto const *result = state_.result(id)) {
            ev.http_status = result->http_status;
            ev.http_reason = result->http_reason;
            ev.response    = result->raw_response;
            ev.fields      = inja::json(result->fields);
            if(result->error)
                ev.error = result->error->message;
        }
        return ev;
    }

    SessionState const &state() const {
        return state_;
    }

    StepGraph const &graph() const {
        return graph_.get();
    }

    SessionContext const &context() const {
        return context_;
    }

private:
    void announce(StepGraph::Step const &step) {
        if(state_.status(step.id()) != StepStatus::PENDING or announced_.contains(step.id()))
            return;

        announced_.insert(step.id());
        report(ManualStepEvent{ step.id(), step.definition.title, step.definition.description, instructions_for(step) });
    }

    void show_instructions(StepGraph::Step const &step) {
        if(auto text = instructions_for(step); not text.empty())
            report(SimpleEvent{ "NEXT", text });
    }

    std::string instructions_for(StepGraph::Step const &step) {
        if(step.definition.instructions.empty())
            return "";

        try {
            return render_instructions(step.definition.instructions, state_, context_.inputs);
        } catch(inja::InjaError const &e) {
            report(SimpleEvent{ "INSTRUCTIONS", fmt::format("{}: {}", step.id(), e.message) });
            return "";
        }
    }

    void report(auto &&ev) {
        auto const &reporting = services_.template get<reporting_t>();
        reporting.get().record(std::move(ev));
    }
};
