#pragma once

#include <flow/graph.hpp>
#include <flow/session_state.hpp>

#include <functional>
#include <string>
#include <vector>

/**
 * @brief Reports which steps may run given the current session state
 *
 * A step is eligible when every dependency is completed and the step itself
 * is not. Manual steps are reported too; running them is never the
 * resolver's business.
 */
class DependencyResolver {
    std::reference_wrapper<const StepGraph> graph_;

public:
    explicit DependencyResolver(StepGraph const &graph);

    /**
     * @brief Eligible steps in declared order
     *
     * @throws InvariantError when a completed step has an incomplete dependency
     */
    std::vector<std::string> eligible_steps(SessionState const &state) const;

    bool is_eligible(std::string const &id, SessionState const &state) const;

    // throws InvariantError
    void check_consistency(SessionState const &state) const;
};
