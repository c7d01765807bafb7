#include <reporting/default_report_renderer.hpp>

#include <fmt/color.h>
#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace {

std::string format_headers(std::vector<Header> const &headers) {
    std::vector<std::string> lines;
    std::transform(std::begin(headers), std::end(headers), std::back_inserter(lines),
        [](Header const &header) { return fmt::format("{}: {}", header.first, header.second); });
    return fmt::format("{}", fmt::join(lines, "\n"));
}

// manual fields are typed by the user and need not be valid utf-8
std::string pretty(inja::json const &value) {
    return value.dump(4, ' ', false, inja::json::error_handler_t::replace);
}

std::string pretty_body(std::string const &body) {
    auto const parsed = inja::json::parse(body, nullptr, false);
    if(parsed.is_discarded())
        return body;
    return pretty(parsed);
}

fmt::text_style state_style(std::string const &state) {
    if(state == "completed")
        return fg(fmt::color::pale_green) | fmt::emphasis::bold;
    if(state == "failed")
        return fg(fmt::color::red) | fmt::emphasis::bold;
    if(state == "candidate")
        return fg(fmt::color::sky_blue) | fmt::emphasis::bold;
    return fg(fmt::color::dim_gray);
}

} // namespace

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
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "SUCCESS ");
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}: {}\n", ev.step, ev.title);

    if(verbose < 2 or ev.fields.empty())
        return;
    fmt::print("Extracted fields:\n---\n{}\n---\n",
        fmt::format(fg(fmt::color::blue_violet) | fmt::emphasis::italic, "{}", pretty(ev.fields)));
}

std::string DefaultReportRenderer::operator()(FailureEvent::Data::Type type) const {
    switch(type) {
    case FailureEvent::Data::Type::SUBSTITUTION:
        return fmt::format(fg(fmt::color::indian_red) | fmt::emphasis::bold, "SUBSTITUTION");
    case FailureEvent::Data::Type::TRANSPORT:
        return fmt::format(fg(fmt::color::indian_red) | fmt::emphasis::bold, "TRANSPORT");
    case FailureEvent::Data::Type::HTTP_STATUS:
        return fmt::format(fg(fmt::color::indian_red) | fmt::emphasis::bold, "HTTP");
    }
    return "";
}

std::string DefaultReportRenderer::operator()(FailureEvent::Data const &failure) const {
    auto path   = fmt::format(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}", failure.path);
    auto detail = [&failure]() -> std::string {
        if(not failure.detail.empty())
            return fmt::format("\n\nExtra detail:\n---\n{}\n---\n", failure.detail);
        return "";
    }();
    return fmt::format("  {} {} [{}]: {}{}",
        fmt::format(fg(fmt::color::red) | fmt::emphasis::bold, "-"),
        this->operator()(failure.type), path, failure.message, detail);
}

void DefaultReportRenderer::operator()(FailureEvent const &ev) const {
    if(verbose < 1)
        return;

    std::vector<std::string> issues;
    std::transform(std::begin(ev.issues), std::end(ev.issues),
        std::back_inserter(issues),
        [this](FailureEvent::Data const &issue) -> std::string {
            return this->operator()(issue);
        });

    std::string flat_issues = fmt::format("{}", fmt::join(issues, "\n"));
    auto all_issues         = fmt::format(fg(fmt::color::dark_red) | fmt::emphasis::bold, "{}", flat_issues);

    fmt::print(fg(fmt::color::ghost_white), "- | ");
    fmt::print(fg(fmt::color::red) | fmt::emphasis::bold, "FAIL ");
    fmt::print("'{}':\n{}\n", fmt::format(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}", ev.step), all_issues);

    // the response is only shown when the server actually said something
    if(not ev.response.empty())
        fmt::print("\nLive response:\n---\n{}\n---\n",
            fmt::format(fg(fmt::color::medium_violet_red) | fmt::emphasis::italic, "{}", pretty_body(ev.response)));
}

void DefaultReportRenderer::operator()(RequestEvent const &ev) const {
    if(verbose < 2)
        return;

    fmt::print(fg(fmt::color::ghost_white), "? | ");
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "REQUEST ");
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}: {} {}\n", ev.step, ev.request.method, ev.request.url);

    fmt::print("Headers:\n---\n{}\n---\nBody:\n---\n{}\n---\n",
        fmt::format(fg(fmt::color::blue_violet) | fmt::emphasis::italic, "{}", format_headers(ev.request.headers)),
        fmt::format(fg(fmt::color::sky_blue) | fmt::emphasis::italic, "{}", ev.request.body));
}

void DefaultReportRenderer::operator()(ResponseEvent const &ev) const {
    if(verbose < 2)
        return;

    fmt::print(fg(fmt::color::ghost_white), "? | ");
    fmt::print(fg(fmt::color::pale_green) | fmt::emphasis::bold, "RESPONSE ");
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}: {} {}\n", ev.step, ev.response.status, ev.response.reason);

    fmt::print("Response:\n---\n{}\n---\n",
        fmt::format(fg(fmt::color::sky_blue) | fmt::emphasis::italic, "{}", pretty_body(ev.response.body)));
}

void DefaultReportRenderer::operator()(ManualStepEvent const &ev) const {
    if(verbose < 1)
        return;

    fmt::print(fg(fmt::color::ghost_white), "! | ");
    fmt::print(fg(fmt::color::gold) | fmt::emphasis::bold, "MANUAL ");
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}: {}\n", ev.step, ev.title);

    if(not ev.description.empty())
        fmt::print("{}\n", ev.description);
    if(not ev.instructions.empty())
        fmt::print("{}\n", fmt::format(fg(fmt::color::gold), "{}", ev.instructions));
    fmt::print("Complete it with: complete {} [field=value ...]\n", ev.step);
}

void DefaultReportRenderer::operator()(StatusEvent const &ev) const {
    std::size_t width = 0;
    for(auto const &row : ev.rows)
        width = std::max(width, row.step.size());

    for(auto const &row : ev.rows) {
        auto const waiting = [&row]() -> std::string {
            if(row.waiting_on.empty())
                return "";
            return fmt::format(" (waiting on {})", fmt::join(row.waiting_on, ", "));
        }();

        fmt::print("  {:<{}}  {}  {}{}{}\n",
            row.step, width,
            fmt::format(state_style(row.state), "{:<9}", row.state),
            row.title,
            row.manual ? fmt::format(fg(fmt::color::gold), " [manual]") : "",
            waiting);
    }
}

void DefaultReportRenderer::operator()(StepDetailEvent const &ev) const {
    fmt::print(fg(fmt::color::sky_blue) | fmt::emphasis::bold, "{}: {}\n", ev.step, ev.title);
    fmt::print("State: {}\n", fmt::format(state_style(ev.state), "{}", ev.state));

    if(ev.http_status)
        fmt::print("HTTP status: {} {}\n", *ev.http_status, ev.http_reason);
    if(not ev.error.empty())
        fmt::print("Error: {}\n", fmt::format(fg(fmt::color::red), "{}", ev.error));
    if(not ev.fields.empty())
        fmt::print("Fields:\n---\n{}\n---\n", pretty(ev.fields));
    if(not ev.response.empty())
        fmt::print("Response:\n---\n{}\n---\n", pretty_body(ev.response));
    if(verbose >= 2 and not ev.request_template.empty())
        fmt::print("Template:\n---\n{}\n---\n", ev.request_template);
}
