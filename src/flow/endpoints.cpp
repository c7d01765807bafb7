#include <flow/endpoints.hpp>
#include <util/strings.hpp>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <stdexcept>

EndpointMap resolve_default_endpoints(EndpointMap const &defaults, std::string const &base_url) {
    EndpointMap resolved;
    for(auto const &[name, value] : defaults) {
        if(not value.starts_with("/")) {
            resolved.emplace(name, value);
            continue;
        }
        if(base_url.empty())
            throw std::invalid_argument{ fmt::format("default endpoint '{}' is relative ('{}') but no server url was given", name, value) };
        resolved.emplace(name, util::join_url(base_url, value));
    }
    return resolved;
}
