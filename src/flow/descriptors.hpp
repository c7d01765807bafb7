#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// raw contents of a flow document, before any validation
namespace descriptor {

struct Settings {
    uint32_t timeout_seconds = 10;
    std::string user_agent   = "oxflow";
    bool verify_tls          = true;
};

struct Input {
    std::string name, description;
    std::optional<std::string> default_value;
    bool secret = false;
};

struct Step {
    std::string id, title, description;
    bool manual = false;
    std::optional<std::vector<std::string>> extract; // all top-level scalars when absent
    std::vector<std::string> absolute_urls;
    std::string instructions;
};

// placeholder token -> reference text, in declared order
using Rules = std::vector<std::pair<std::string, std::string>>;

struct Document {
    Settings settings;
    std::vector<Input> inputs;
    std::map<std::string, std::string> endpoints;
    std::vector<Step> steps;
    std::vector<std::pair<std::string, std::vector<std::string>>> dependencies;
    std::vector<std::pair<std::string, std::string>> templates;
    std::vector<std::pair<std::string, Rules>> substitution_rules;
};

} // namespace descriptor
