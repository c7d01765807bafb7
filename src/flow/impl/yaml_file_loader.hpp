#pragma once

#include <flow/descriptors.hpp>

#include <filesystem>

namespace impl {

class YamlFileLoader {
    std::filesystem::path path_;

public:
    YamlFileLoader(std::filesystem::path const &path);
    descriptor::Document load() const;
    std::filesystem::path path() const;
};

} // namespace impl
