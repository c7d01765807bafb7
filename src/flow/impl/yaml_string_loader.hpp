#pragma once

#include <flow/descriptors.hpp>
#include <flow/exceptions.hpp>
#include <flow/impl/yaml_conversion.hpp>

#include <yaml-cpp/yaml.h>

#include <string>

namespace impl {

// loads a flow document held in memory; used by tests and embedders
class YamlStringLoader {
    std::string text_;

public:
    YamlStringLoader(std::string text)
        : text_{ std::move(text) } { }

    descriptor::Document load() const {
        try {
            return YAML::Load(text_).as<descriptor::Document>();
        } catch(YAML::Exception const &e) {
            throw ConfigError{ ConfigError::Kind::INVALID_DOCUMENT, e.what() };
        }
    }
};

} // namespace impl
