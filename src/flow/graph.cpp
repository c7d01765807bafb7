#include <flow/exceptions.hpp>
#include <flow/graph.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <deque>
#include <set>
#include <stdexcept>

namespace {

ConfigError unknown_step(std::string const &id, std::string_view context) {
    return ConfigError{ ConfigError::Kind::UNKNOWN_STEP_REFERENCE, fmt::format("{} references undeclared step '{}'", context, id) };
}

} // namespace

StepGraph::StepGraph(descriptor::Document document)
    : settings_{ document.settings }
    , inputs_{ document.inputs }
    , default_endpoints_{ document.endpoints } {
    if(document.steps.empty())
        throw ConfigError{ ConfigError::Kind::INVALID_DOCUMENT, "flow document declares no steps" };

    add_steps(document.steps);
    add_dependencies(document.dependencies);
    add_templates(document.templates);
    add_rules(document.substitution_rules);

    for(auto const &step : steps_) {
        if(not step.manual() and not step.command)
            throw ConfigError{ ConfigError::Kind::MALFORMED_TEMPLATE, fmt::format("automatic step '{}' has no request template", step.id()) };
    }

    sort_topologically();
}

bool StepGraph::contains(std::string_view id) const {
    return index_.find(id) != std::end(index_);
}

StepGraph::Step const &StepGraph::step(std::string_view id) const {
    auto const it = index_.find(id);
    if(it == std::end(index_))
        throw SessionError{ fmt::format("no step with id '{}'", id) };
    return steps_[it->second];
}

std::vector<std::string> StepGraph::dependents_closure(std::string_view id) const {
    std::set<std::string, std::less<>> reached;
    std::deque<std::string> pending{ std::string{ id } };

    while(not pending.empty()) {
        auto const current = pending.front();
        pending.pop_front();
        for(auto const &dependent : step(current).dependents) {
            if(reached.insert(dependent).second)
                pending.push_back(dependent);
        }
    }

    std::vector<std::string> result;
    for(auto const &s : steps_) {
        if(reached.contains(s.id()))
            result.push_back(s.id());
    }
    return result;
}

StepGraph::Step &StepGraph::mutable_step(std::string const &id, std::string_view context) {
    auto const it = index_.find(id);
    if(it == std::end(index_))
        throw unknown_step(id, context);
    return steps_[it->second];
}

void StepGraph::add_steps(std::vector<descriptor::Step> const &steps) {
    for(auto const &definition : steps) {
        if(definition.id.empty() or definition.id.find('.') != std::string::npos)
            throw ConfigError{ ConfigError::Kind::INVALID_DOCUMENT, fmt::format("step id '{}' must be non-empty and contain no '.'", definition.id) };
        if(contains(definition.id))
            throw ConfigError{ ConfigError::Kind::DUPLICATE_STEP, fmt::format("step '{}' is declared more than once", definition.id) };

        index_.emplace(definition.id, steps_.size());
        steps_.push_back(Step{ .definition = definition });
    }
}

void StepGraph::add_dependencies(std::vector<std::pair<std::string, std::vector<std::string>>> const &dependencies) {
    for(auto const &[id, prerequisites] : dependencies) {
        auto &step = mutable_step(id, "dependencies");

        for(auto const &prerequisite : prerequisites) {
            if(not contains(prerequisite))
                throw unknown_step(prerequisite, fmt::format("dependencies of '{}'", id));
            if(prerequisite == id)
                throw ConfigError{ ConfigError::Kind::CYCLIC_DEPENDENCY, fmt::format("step '{}' depends on itself", id) };
            if(std::find(std::begin(step.dependencies), std::end(step.dependencies), prerequisite) == std::end(step.dependencies))
                step.dependencies.push_back(prerequisite);
        }
    }

    // dependents in declared order, independent of how the mapping was written
    for(auto const &step : steps_) {
        for(auto const &prerequisite : step.dependencies)
            steps_[index_.find(prerequisite)->second].dependents.push_back(step.id());
    }
}

void StepGraph::add_templates(std::vector<std::pair<std::string, std::string>> const &templates) {
    for(auto const &[id, text] : templates) {
        auto &step = mutable_step(id, "curl_templates");
        if(step.command)
            throw ConfigError{ ConfigError::Kind::MALFORMED_TEMPLATE, fmt::format("step '{}' has more than one template", id) };

        try {
            step.command = parse_curl(text);
        } catch(std::invalid_argument const &e) {
            throw ConfigError{ ConfigError::Kind::MALFORMED_TEMPLATE, fmt::format("template of step '{}': {}", id, e.what()) };
        }
        step.template_text = text;
    }
}

void StepGraph::add_rules(std::vector<std::pair<std::string, descriptor::Rules>> const &rules) {
    for(auto const &[id, step_rules] : rules) {
        auto &step = mutable_step(id, "substitution_rules");

        for(auto const &[token, text] : step_rules) {
            if(token.empty())
                throw ConfigError{ ConfigError::Kind::MALFORMED_REFERENCE, fmt::format("step '{}' has a rule with an empty token", id) };

            ref::Reference reference;
            try {
                reference = ref::parse(text);
            } catch(std::invalid_argument const &e) {
                throw ConfigError{ ConfigError::Kind::MALFORMED_REFERENCE, fmt::format("rule '{}' of step '{}': {}", token, id, e.what()) };
            }

            if(auto const *field = std::get_if<ref::StepField>(&reference); field and not contains(field->step))
                throw unknown_step(field->step, fmt::format("rule '{}' of step '{}'", token, id));

            if(auto const *input = std::get_if<ref::Input>(&reference)) {
                auto const declared = std::any_of(std::begin(inputs_), std::end(inputs_),
                    [input](descriptor::Input const &candidate) { return candidate.name == input->name; });
                if(not declared)
                    throw ConfigError{ ConfigError::Kind::UNKNOWN_INPUT_REFERENCE,
                        fmt::format("rule '{}' of step '{}' references undeclared input '{}'", token, id, input->name) };
            }

            auto const existing = std::find_if(std::begin(step.rules), std::end(step.rules),
                [&token](Rule const &rule) { return rule.token == token; });
            if(existing == std::end(step.rules)) {
                step.rules.push_back(Rule{ token, std::move(reference) });
            } else if(ref::to_string(existing->reference) != ref::to_string(reference)) {
                throw ConfigError{ ConfigError::Kind::MALFORMED_REFERENCE,
                    fmt::format("token '{}' of step '{}' is bound to both '{}' and '{}'", token, id, ref::to_string(existing->reference), text) };
            }
        }
    }
}

// Kahn's algorithm; whatever is left over sits on or behind a cycle
void StepGraph::sort_topologically() {
    std::vector<std::size_t> in_degree(steps_.size());
    for(std::size_t i = 0; i < steps_.size(); ++i)
        in_degree[i] = steps_[i].dependencies.size();

    std::size_t sorted = 0;
    std::deque<std::size_t> ready;
    for(std::size_t i = 0; i < steps_.size(); ++i) {
        if(in_degree[i] == 0)
            ready.push_back(i);
    }

    while(not ready.empty()) {
        auto const current = ready.front();
        ready.pop_front();
        ++sorted;

        for(auto const &dependent : steps_[current].dependents) {
            auto const idx = index_.find(dependent)->second;
            if(--in_degree[idx] == 0)
                ready.push_back(idx);
        }
    }

    if(sorted == steps_.size())
        return;

    // every leftover step has at least one leftover prerequisite, so walking
    // leftover prerequisites from any leftover step must eventually revisit one
    auto const leftover = [&in_degree](std::size_t idx) { return in_degree[idx] > 0; };

    std::size_t current = 0;
    while(not leftover(current))
        ++current;

    std::vector<std::size_t> path;
    std::vector<std::size_t> position(steps_.size(), steps_.size());
    while(position[current] == steps_.size()) {
        position[current] = path.size();
        path.push_back(current);

        for(auto const &prerequisite : steps_[current].dependencies) {
            auto const idx = index_.find(prerequisite)->second;
            if(leftover(idx)) {
                current = idx;
                break;
            }
        }
    }

    // path holds dependents before their prerequisites; print in execution direction
    std::vector<std::string> cycle;
    for(auto i = position[current]; i < path.size(); ++i)
        cycle.push_back(steps_[path[i]].id());
    std::reverse(std::begin(cycle), std::end(cycle));
    std::rotate(std::begin(cycle), std::prev(std::end(cycle)), std::end(cycle));
    cycle.push_back(cycle.front());

    throw ConfigError{ ConfigError::Kind::CYCLIC_DEPENDENCY, fmt::format("dependency cycle: {}", fmt::join(cycle, " -> ")) };
}
