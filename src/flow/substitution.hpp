#pragma once

#include <flow/endpoints.hpp>
#include <flow/graph.hpp>
#include <flow/session_state.hpp>
#include <web/http.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

// a request with every endpoint and placeholder token resolved
using RenderedRequest = HttpRequest;

/**
 * @brief Renders a step's request template against the current session state
 *
 * 1. every {name} endpoint token is looked up in discovered, then defaults,
 *    unless a rule of the step binds that exact token;
 * 2. every rule of the step is resolved (step.<id>.<field> from completed
 *    results, input.<name> from inputs);
 * 3. any <placeholder> token that no rule binds is rejected;
 * 4. rule tokens are replaced verbatim in a single left-to-right pass, so
 *    inserted values are never substituted again.
 *
 * Pure: identical arguments always give an identical request.
 *
 * @throws SubstitutionError
 * @throws InvariantError for a step without a request template
 */
RenderedRequest render(StepGraph::Step const &step,
    SessionState const &state,
    EndpointMap const &discovered,
    EndpointMap const &defaults,
    InputMap const &inputs = {});

// placeholder-looking tokens, e.g. <backend-client-id>, in order of appearance
std::vector<std::string> find_placeholders(std::string_view text);

// replaces every occurrence of each token (longest match first) in one pass
std::string substitute_tokens(std::string_view text, std::vector<std::pair<std::string, std::string>> const &bindings);
