#pragma once

#include <flow/graph.hpp>

#include <inja/inja.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class StepStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
};

std::string_view to_string(StepStatus status);

struct StepError {
    enum class Type {
        SUBSTITUTION,
        TRANSPORT,
        HTTP,
    };

    Type type;
    std::string message;
    std::optional<unsigned> http_status = std::nullopt;
};

// field name -> scalar json value (strings, numbers, booleans)
using FieldMap = std::map<std::string, inja::json>;

// the text inserted into a template for a field value
std::string to_substitution_text(inja::json const &value);

struct StepResult {
    StepStatus status = StepStatus::PENDING;
    std::optional<unsigned> http_status;
    std::string http_reason;
    std::string raw_response;
    FieldMap fields;
    std::optional<StepError> error;
    bool manual = false; // injected by an external completion signal
};

/**
 * @brief Per-session step results
 *
 * Writers: the step executor (begin/record) and the manual completion
 * handler (complete_manual). Explicit re-entry goes through reset. Every
 * write checks the dependency invariant against the graph; a violation by
 * the executor is an InvariantError, a rejected external signal is a
 * SessionError and leaves the state untouched.
 */
class SessionState {
    std::reference_wrapper<const StepGraph> graph_;
    std::map<std::string, StepResult, std::less<>> results_;

public:
    explicit SessionState(StepGraph const &graph);

    StepStatus status(std::string_view id) const;
    bool is_completed(std::string_view id) const;

    // nullptr when the step has no result yet
    StepResult const *result(std::string_view id) const;

    // nullptr unless the step completed and produced the field
    inja::json const *field(std::string_view id, std::string_view name) const;

    std::map<std::string, StepResult, std::less<>> const &results() const {
        return results_;
    }

    StepGraph const &graph() const {
        return graph_.get();
    }

    // executor: pending -> running
    void begin(std::string const &id);

    // executor: running -> completed|failed
    void record(std::string const &id, StepResult result);

    // manual completion handler: pending -> completed, with user supplied fields
    void complete_manual(std::string const &id, FieldMap fields);

    /**
     * @brief Clears the step's result and those of every transitive dependent
     *
     * @return the ids whose results were cleared, in declared order
     */
    std::vector<std::string> reset(std::string const &id);

private:
    bool dependencies_completed(StepGraph::Step const &step) const;
};
