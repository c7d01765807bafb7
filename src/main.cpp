// commas are legal inside completions and inputs, so vector options split on ';'
#define CXXOPTS_VECTOR_DELIMITER ';'

#include <console.hpp>
#include <flow/endpoints.hpp>
#include <flow/graph.hpp>
#include <flow/impl/yaml_file_loader.hpp>
#include <flow/manual_completion.hpp>
#include <flow/session.hpp>
#include <reporting/default_report_renderer.hpp>
#include <reporting/report_engine.hpp>
#include <util/strings.hpp>
#include <web/discovery.hpp>
#include <web/fetcher.hpp>

#include <cxxopts.hpp>
#include <di.hpp>
#include <fmt/compile.h>
#include <fmt/format.h>

#include <chrono>
#include <iostream>

using rep_renderer_t = DefaultReportRenderer;
using reporting_t    = ReportEngine<rep_renderer_t>;
using fetcher_t      = OnDemandFetcher;
using discovery_t    = Discovery<fetcher_t, reporting_t>;
using session_t      = Session<fetcher_t, reporting_t>;
using console_t      = Console<session_t, reporting_t>;

void usage(std::string msg) {
    fmt::print("{}\nThe first positional argument must be a path to the flow document\n", msg);
    exit(EXIT_SUCCESS);
}

auto parse_options(int argc, char **argv) {
    // clang-format off
    cxxopts::Options options("oxflow", "Step by step OAuth2 / OIDC token exchange walkthrough");
    options.add_options()
      ("c,config", "Path to the flow document", cxxopts::value<std::string>())
      ("s,server", "Authorization server base url", cxxopts::value<std::string>()->default_value(""))
      ("skip-discovery", "Do not fetch the openid configuration; use default endpoints only")
      ("i,input", "Session input as name=value (repeatable)", cxxopts::value<std::vector<std::string>>())
      ("t,timeout", "Request timeout in seconds, overrides the document", cxxopts::value<uint32_t>())
      ("m,complete", "Manual step completion as step[:name=value,...] (repeatable)", cxxopts::value<std::vector<std::string>>())
      ("b,batch", "Run once without the interactive console")
      ("v,verbose", "Level of output verbosity", cxxopts::value<uint16_t>()->default_value("1"))
      ("h,help", "Print help message and exit")
    ;
    options.parse_positional({"config"});
    options.positional_help("<config.yaml>");
    // clang-format on

    auto result = options.parse(argc, argv);
    if(result["help"].as<bool>())
        usage(options.help());
    if(result.count("config") == 0)
        usage(options.help());

    return result;
}

InputMap collect_inputs(StepGraph const &graph, std::vector<std::string> const &assignments) {
    InputMap inputs;
    for(auto const &input : graph.inputs()) {
        if(input.default_value)
            inputs[input.name] = *input.default_value;
    }

    for(auto const &assignment : assignments) {
        auto const pair = util::split_assignment(assignment);
        if(not pair)
            throw std::invalid_argument{ fmt::format("input '{}' is not of the form name=value", assignment) };
        inputs[pair->first] = pair->second;
    }
    return inputs;
}

int main(int argc, char **argv) try {
    auto result  = parse_options(argc, argv);
    auto path    = result["config"].as<std::string>();
    auto server  = result["server"].as<std::string>();
    auto verbose = result["verbose"].as<uint16_t>();
    auto batch   = result["batch"].as<bool>();

    auto const graph    = StepGraph{ impl::YamlFileLoader{ path } };
    auto const settings = graph.settings();
    auto const timeout  = result.count("timeout") ? result["timeout"].as<uint32_t>() : settings.timeout_seconds;

    rep_renderer_t renderer{ verbose };
    auto reporting_deps = di::Deps<rep_renderer_t>{ renderer };
    reporting_t reporting{ reporting_deps, true };

    di::Deps<reporting_t> base_deps{ reporting };

    fetcher_t fetcher{ std::chrono::seconds{ timeout }, settings.user_agent, settings.verify_tls };
    auto web_deps = di::combine(base_deps, di::Deps<fetcher_t>{ fetcher });

    SessionContext context;
    context.base_url = server;
    context.defaults = resolve_default_endpoints(graph.default_endpoints(), server);
    context.inputs   = collect_inputs(graph, result.count("input") ? result["input"].as<std::vector<std::string>>() : std::vector<std::string>{});

    if(result["skip-discovery"].as<bool>() or server.empty()) {
        reporting.record(SimpleEvent{ "DISCOVERY", "skipped, using default endpoints" });
    } else {
        discovery_t discovery{ web_deps };
        context.discovered = discovery.discover(server, context.defaults).endpoints;
    }

    std::vector<ManualCompletion> completions;
    if(result.count("complete")) {
        for(auto const &text : result["complete"].as<std::vector<std::string>>())
            completions.push_back(parse_completion(text));
    }

    session_t session{ web_deps, graph, std::move(context) };

    auto console_deps = di::combine(base_deps, di::Deps<session_t>{ session });
    console_t console{ console_deps, std::cin, std::cout };

    if(batch)
        return console.run_batch(completions);
    return console.run_interactive(completions);
} catch(std::exception const &e) {
    fmt::print("{}\n", e.what());
    return EXIT_FAILURE;
}
