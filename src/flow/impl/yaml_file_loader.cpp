#include <flow/exceptions.hpp>
#include <flow/impl/yaml_conversion.hpp>
#include <flow/impl/yaml_file_loader.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace impl {

YamlFileLoader::YamlFileLoader(std::filesystem::path const &path)
    : path_{ path } { }

descriptor::Document YamlFileLoader::load() const {
    if(not std::filesystem::is_regular_file(path_))
        throw ConfigError{ ConfigError::Kind::INVALID_DOCUMENT, fmt::format("flow document '{}' does not exist", path_.string()) };

    try {
        YAML::Node doc = YAML::LoadFile(path_.string());
        return doc.as<descriptor::Document>();
    } catch(YAML::Exception const &e) {
        throw ConfigError{ ConfigError::Kind::INVALID_DOCUMENT, fmt::format("{}: {}", path_.string(), e.what()) };
    }
}

std::filesystem::path YamlFileLoader::path() const {
    return path_;
}

} // namespace impl
