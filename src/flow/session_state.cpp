#include <flow/exceptions.hpp>
#include <flow/session_state.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <algorithm>

std::string_view to_string(StepStatus status) {
    switch(status) {
    case StepStatus::PENDING:
        return "pending";
    case StepStatus::RUNNING:
        return "running";
    case StepStatus::COMPLETED:
        return "completed";
    case StepStatus::FAILED:
        return "failed";
    }
    return "unknown";
}

std::string to_substitution_text(inja::json const &value) {
    if(value.is_string())
        return value.get<std::string>();
    return value.dump();
}

SessionState::SessionState(StepGraph const &graph)
    : graph_{ std::cref(graph) } { }

StepStatus SessionState::status(std::string_view id) const {
    auto const it = results_.find(id);
    if(it == std::end(results_))
        return StepStatus::PENDING;
    return it->second.status;
}

bool SessionState::is_completed(std::string_view id) const {
    return status(id) == StepStatus::COMPLETED;
}

StepResult const *SessionState::result(std::string_view id) const {
    auto const it = results_.find(id);
    if(it == std::end(results_))
        return nullptr;
    return &it->second;
}

inja::json const *SessionState::field(std::string_view id, std::string_view name) const {
    auto const *res = result(id);
    if(res == nullptr or res->status != StepStatus::COMPLETED)
        return nullptr;

    auto const it = res->fields.find(std::string{ name });
    if(it == std::end(res->fields))
        return nullptr;
    return &it->second;
}

bool SessionState::dependencies_completed(StepGraph::Step const &step) const {
    return std::all_of(std::begin(step.dependencies), std::end(step.dependencies),
        [this](std::string const &dependency) { return is_completed(dependency); });
}

void SessionState::begin(std::string const &id) {
    auto const &step = graph_.get().step(id);

    if(step.manual())
        throw InvariantError{ fmt::format("manual step '{}' can not be executed", id) };
    if(status(id) != StepStatus::PENDING)
        throw InvariantError{ fmt::format("step '{}' already has a result ({})", id, to_string(status(id))) };
    if(not dependencies_completed(step))
        throw InvariantError{ fmt::format("step '{}' started before all of its dependencies completed", id) };

    results_[id].status = StepStatus::RUNNING;
}

void SessionState::record(std::string const &id, StepResult result) {
    if(status(id) != StepStatus::RUNNING)
        throw InvariantError{ fmt::format("result for step '{}' recorded while it is {}", id, to_string(status(id))) };
    if(result.status != StepStatus::COMPLETED and result.status != StepStatus::FAILED)
        throw InvariantError{ fmt::format("result for step '{}' must be completed or failed, got {}", id, to_string(result.status)) };

    results_[id] = std::move(result);
}

void SessionState::complete_manual(std::string const &id, FieldMap fields) {
    auto const &step = graph_.get().step(id);

    if(not step.manual())
        throw SessionError{ fmt::format("step '{}' is not a manual step", id) };
    if(status(id) == StepStatus::COMPLETED)
        throw SessionError{ fmt::format("step '{}' is already completed; restart it first", id) };
    if(not dependencies_completed(step))
        throw SessionError{ fmt::format("step '{}' is not eligible yet: its dependencies have not all completed", id) };

    StepResult result;
    result.status = StepStatus::COMPLETED;
    result.fields = std::move(fields);
    result.manual = true;
    results_[id]  = std::move(result);
}

std::vector<std::string> SessionState::reset(std::string const &id) {
    auto targets = graph_.get().dependents_closure(id);
    targets.insert(std::begin(targets), id);

    for(auto const &target : targets) {
        if(status(target) == StepStatus::RUNNING)
            throw InvariantError{ fmt::format("step '{}' can not be reset while running", target) };
    }

    std::vector<std::string> cleared;
    for(auto const &target : targets) {
        if(results_.erase(target) > 0)
            cleared.push_back(target);
    }
    return cleared;
}
