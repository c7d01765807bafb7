#include <flow/exceptions.hpp>
#include <flow/resolver.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <algorithm>

DependencyResolver::DependencyResolver(StepGraph const &graph)
    : graph_{ std::cref(graph) } { }

std::vector<std::string> DependencyResolver::eligible_steps(SessionState const &state) const {
    check_consistency(state);

    std::vector<std::string> eligible;
    for(auto const &step : graph_.get().steps()) {
        if(is_eligible(step.id(), state))
            eligible.push_back(step.id());
    }
    return eligible;
}

bool DependencyResolver::is_eligible(std::string const &id, SessionState const &state) const {
    if(state.is_completed(id))
        return false;

    auto const &dependencies = graph_.get().step(id).dependencies;
    return std::all_of(std::begin(dependencies), std::end(dependencies),
        [&state](std::string const &dependency) { return state.is_completed(dependency); });
}

void DependencyResolver::check_consistency(SessionState const &state) const {
    for(auto const &[id, result] : state.results()) {
        if(result.status != StepStatus::COMPLETED and result.status != StepStatus::RUNNING)
            continue;

        for(auto const &dependency : graph_.get().step(id).dependencies) {
            if(not state.is_completed(dependency))
                throw InvariantError{ fmt::format("step '{}' is {} but its dependency '{}' is {}",
                    id, to_string(result.status), dependency, to_string(state.status(dependency))) };
        }
    }
}
