#pragma once

#include <flow/descriptors.hpp>

#include <yaml-cpp/yaml.h>

#include <set>
#include <string>
#include <vector>

namespace YAML {

template <>
struct convert<descriptor::Settings> {
    static bool decode(const Node &node, descriptor::Settings &rhs) {
        if(not node.IsMap())
            return false;

        if(node["timeout_seconds"])
            rhs.timeout_seconds = node["timeout_seconds"].as<uint32_t>();
        if(node["user_agent"])
            rhs.user_agent = node["user_agent"].as<std::string>();
        if(node["verify_tls"])
            rhs.verify_tls = node["verify_tls"].as<bool>();
        return true;
    }
};

template <>
struct convert<descriptor::Input> {
    static bool decode(const Node &node, descriptor::Input &rhs) {
        if(not node.IsMap() or not node["name"])
            return false;

        rhs.name = node["name"].as<std::string>();
        if(node["description"])
            rhs.description = node["description"].as<std::string>();
        if(node["default"])
            rhs.default_value = node["default"].as<std::string>();
        if(node["secret"])
            rhs.secret = node["secret"].as<bool>();
        return true;
    }
};

template <>
struct convert<descriptor::Step> {
    static bool decode(const Node &node, descriptor::Step &rhs) {
        if(not node.IsMap() or not node["id"])
            return false;

        rhs.id = node["id"].as<std::string>();
        rhs.title = node["title"] ? node["title"].as<std::string>() : "Step " + rhs.id;
        if(node["description"])
            rhs.description = node["description"].as<std::string>();
        if(node["manual"])
            rhs.manual = node["manual"].as<bool>();
        if(node["extract"])
            rhs.extract = node["extract"].as<std::vector<std::string>>();
        if(node["absolute_urls"])
            rhs.absolute_urls = node["absolute_urls"].as<std::vector<std::string>>();
        if(node["instructions"])
            rhs.instructions = node["instructions"].as<std::string>();
        return true;
    }
};

// rules are either flat (token: reference) or grouped by request part
// (url/headers/data/auth: { token: reference }); groups are flattened.
template <>
struct convert<descriptor::Rules> {
    static bool decode(const Node &node, descriptor::Rules &rhs) {
        if(node.IsNull())
            return true;
        if(not node.IsMap())
            return false;

        static std::set<std::string> const sections = { "url", "headers", "data", "auth" };
        for(auto const &entry : node) {
            auto const key = entry.first.as<std::string>();
            if(entry.second.IsMap() and sections.contains(key)) {
                for(auto const &rule : entry.second)
                    rhs.emplace_back(rule.first.as<std::string>(), rule.second.as<std::string>());
            } else if(entry.second.IsScalar()) {
                rhs.emplace_back(key, entry.second.as<std::string>());
            } else {
                return false;
            }
        }
        return true;
    }
};

template <>
struct convert<descriptor::Document> {
    static bool decode(const Node &node, descriptor::Document &rhs) {
        if(not node.IsMap() or not node["steps"] or not node["steps"].IsSequence())
            return false;

        if(node["settings"])
            rhs.settings = node["settings"].as<descriptor::Settings>();
        if(node["inputs"])
            rhs.inputs = node["inputs"].as<std::vector<descriptor::Input>>();

        // older documents call these endpoint_defaults
        for(auto const *key : { "endpoints", "endpoint_defaults" }) {
            if(not node[key])
                continue;
            for(auto const &entry : node[key])
                rhs.endpoints[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }

        rhs.steps = node["steps"].as<std::vector<descriptor::Step>>();

        if(auto const deps = node["dependencies"]; deps and not deps.IsNull()) {
            for(auto const &entry : deps) {
                auto prerequisites = entry.second.IsNull() ? std::vector<std::string>{} : entry.second.as<std::vector<std::string>>();
                rhs.dependencies.emplace_back(entry.first.as<std::string>(), std::move(prerequisites));
            }
        }

        if(auto const templates = node["curl_templates"]; templates and not templates.IsNull()) {
            for(auto const &entry : templates) {
                if(entry.second.IsNull())
                    continue;
                rhs.templates.emplace_back(entry.first.as<std::string>(), entry.second.as<std::string>());
            }
        }

        if(auto const rules = node["substitution_rules"]; rules and not rules.IsNull()) {
            for(auto const &entry : rules)
                rhs.substitution_rules.emplace_back(entry.first.as<std::string>(), entry.second.as<descriptor::Rules>());
        }

        return true;
    }
};

} // namespace YAML
