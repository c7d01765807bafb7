#pragma once

#include <flow/curl_template.hpp>
#include <flow/descriptors.hpp>
#include <flow/endpoints.hpp>
#include <flow/reference.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief The validated, immutable step graph
 *
 * Built once from a flow document. Construction either yields a graph in
 * which every reference resolves and the dependencies form a DAG, or throws
 * ConfigError; nothing is executed.
 */
class StepGraph {
public:
    struct Rule {
        std::string token;
        ref::Reference reference;
    };

    struct Step {
        descriptor::Step definition;
        std::vector<std::string> dependencies; // declared order, no duplicates
        std::vector<std::string> dependents;   // direct only, declared step order
        std::optional<std::string> template_text;
        std::optional<CurlCommand> command;
        std::vector<Rule> rules;

        std::string const &id() const {
            return definition.id;
        }
        bool manual() const {
            return definition.manual;
        }
    };

    template <typename LoaderType>
    explicit StepGraph(LoaderType const &loader)
        : StepGraph{ loader.load() } { }

    explicit StepGraph(descriptor::Document document);

    // declared order
    std::vector<Step> const &steps() const {
        return steps_;
    }

    bool contains(std::string_view id) const;

    // throws SessionError for unknown ids
    Step const &step(std::string_view id) const;

    // every step that transitively depends on id, in declared order
    std::vector<std::string> dependents_closure(std::string_view id) const;

    descriptor::Settings const &settings() const {
        return settings_;
    }

    std::vector<descriptor::Input> const &inputs() const {
        return inputs_;
    }

    EndpointMap const &default_endpoints() const {
        return default_endpoints_;
    }

private:
    void add_steps(std::vector<descriptor::Step> const &steps);
    void add_dependencies(std::vector<std::pair<std::string, std::vector<std::string>>> const &dependencies);
    void add_templates(std::vector<std::pair<std::string, std::string>> const &templates);
    void add_rules(std::vector<std::pair<std::string, descriptor::Rules>> const &rules);
    void sort_topologically();

    Step &mutable_step(std::string const &id, std::string_view context);

    std::vector<Step> steps_;
    std::map<std::string, std::size_t, std::less<>> index_;
    descriptor::Settings settings_;
    std::vector<descriptor::Input> inputs_;
    EndpointMap default_endpoints_;
};
