#pragma once

#include <flow/exceptions.hpp>
#include <flow/graph.hpp>
#include <flow/session_state.hpp>
#include <flow/substitution.hpp>
#include <reporting/events.hpp>
#include <util/strings.hpp>
#include <web/concepts.hpp>

#include <di.hpp>
#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <inja/inja.hpp>

#include <exception>
#include <string>
#include <vector>

namespace step {

/**
 * @brief Runs one automatic step: send the rendered request, extract fields, record the result
 *
 * The only place where automatic steps reach a terminal status. Transport
 * and http failures become failed results, not exceptions.
 */
template <HttpFetcher FetcherType, typename ReportEngineType, typename ExtractorType>
class Execute {
    using fetcher_t   = FetcherType;
    using reporting_t = ReportEngineType;
    using services_t  = di::Deps<fetcher_t, reporting_t>;

    services_t services_;
    std::string base_url_;
    ExtractorType extractor_;

public:
    Execute(services_t services, std::string base_url)
        : services_{ services }
        , base_url_{ std::move(base_url) } {
    }

    Execute(Execute &&)      = default;
    Execute(Execute const &) = default;

    StepResult const &perform(StepGraph::Step const &step, RenderedRequest const &request, SessionState &state) {
        state.begin(step.id());
        report(RequestEvent{ step.id(), request });

        HttpResponse response;
        try {
            auto const &fetcher = services_.template get<fetcher_t>();
            response            = fetcher.get().fetch(request);
        } catch(std::exception const &e) {
            // any fetch failure belongs to the step; a running step must never be left behind
            StepResult result;
            result.status = StepStatus::FAILED;
            result.error  = StepError{ StepError::Type::TRANSPORT, e.what() };
            return fail(step, std::move(result), FailureEvent::Data::Type::TRANSPORT, state);
        }

        report(ResponseEvent{ step.id(), response });
        auto body = inja::json::parse(response.body, nullptr, false);

        if(not response.ok()) {
            StepResult result;
            result.status       = StepStatus::FAILED;
            result.http_status  = response.status;
            result.http_reason  = response.reason;
            result.raw_response = response.body;
            result.error        = StepError{ StepError::Type::HTTP, http_error_message(response, body), response.status };
            return fail(step, std::move(result), FailureEvent::Data::Type::HTTP_STATUS, state);
        }

        auto [fields, missing] = extractor_.extract(body, step.definition.extract);
        if(not missing.empty())
            report(SimpleEvent{ "PARTIAL", fmt::format("{}: response carried no {}", step.id(), fmt::join(missing, ", ")) });

        make_absolute(step, fields);

        StepResult result;
        result.status       = StepStatus::COMPLETED;
        result.http_status  = response.status;
        result.http_reason  = response.reason;
        result.raw_response = response.body;
        result.fields       = std::move(fields);
        state.record(step.id(), std::move(result));

        auto const &recorded = *state.result(step.id());
        report(SuccessEvent{ step.id(), step.definition.title, inja::json(recorded.fields) });
        return recorded;
    }

    // the request could not be rendered; the step fails without touching the network
    StepResult const &reject(StepGraph::Step const &step, SubstitutionError const &error, SessionState &state) {
        state.begin(step.id());

        StepResult result;
        result.status = StepStatus::FAILED;
        result.error  = StepError{ StepError::Type::SUBSTITUTION, error.what() };
        return fail(step, std::move(result), FailureEvent::Data::Type::SUBSTITUTION, state);
    }

private:
    StepResult const &fail(StepGraph::Step const &step, StepResult result, FailureEvent::Data::Type type, SessionState &state) {
        auto const issues = std::vector<FailureEvent::Data>{
            { type, step.id(), result.error->message }
        };
        auto const response = result.raw_response;

        state.record(step.id(), std::move(result));
        report(FailureEvent{ step.id(), issues, response });
        return *state.result(step.id());
    }

    // oauth servers explain 4xx answers in the error/error_description members
    static std::string http_error_message(HttpResponse const &response, inja::json const &body) {
        auto message = fmt::format("HTTP {} {}", response.status, response.reason);
        if(body.is_object() and body.contains("error") and body["error"].is_string()) {
            message += fmt::format(": {}", body["error"].template get<std::string>());
            if(body.contains("error_description") and body["error_description"].is_string())
                message += fmt::format(" ({})", body["error_description"].template get<std::string>());
        }
        return message;
    }

    void make_absolute(StepGraph::Step const &step, FieldMap &fields) const {
        if(base_url_.empty())
            return;

        for(auto const &name : step.definition.absolute_urls) {
            auto const it = fields.find(name);
            if(it == std::end(fields) or not it->second.is_string())
                continue;

            auto const value = it->second.template get<std::string>();
            if(value.starts_with('/'))
                it->second = util::join_url(base_url_, value);
        }
    }

    void report(auto &&ev) {
        auto const &reporting = services_.template get<reporting_t>();
        reporting.get().record(std::move(ev));
    }
};

} // namespace step
