#include <util/strings.hpp>
#include <web/discovery.hpp>

#include <fmt/ranges.h>

#include <array>
#include <string_view>

namespace {

constexpr auto required_keys = std::array<std::string_view, 4>{
    "issuer", "registration_endpoint", "authorization_endpoint", "token_endpoint"
};

bool is_endpoint_key(std::string const &key) {
    return key.ends_with("_endpoint") or key == "issuer" or key == "jwks_uri";
}

} // namespace

std::string discovery_url(std::string const &base_url) {
    return util::join_url(base_url, "/.well-known/openid-configuration");
}

DiscoveryResult parse_discovery_document(std::string const &body) {
    auto document = inja::json::parse(body, nullptr, false);
    if(document.is_discarded() or not document.is_object())
        throw DiscoveryError{ "discovery document is not a json object" };

    std::vector<std::string_view> missing;
    for(auto const key : required_keys) {
        auto const it = document.find(std::string{ key });
        if(it == document.end() or not it->is_string() or it->template get<std::string>().empty())
            missing.push_back(key);
    }
    if(not missing.empty())
        throw DiscoveryError{ fmt::format("discovery document lacks {}", fmt::join(missing, ", ")) };

    DiscoveryResult result;
    for(auto const &item : document.items()) {
        if(is_endpoint_key(item.key()) and item.value().is_string())
            result.endpoints.emplace(item.key(), item.value().template get<std::string>());
    }
    result.issuer   = document["issuer"].get<std::string>();
    result.document = std::move(document);
    return result;
}

std::vector<std::string> undiscovered(EndpointMap const &discovered, EndpointMap const &defaults) {
    std::vector<std::string> names;
    for(auto const &[name, url] : defaults) {
        if(auto const it = discovered.find(name); it == std::end(discovered) or it->second.empty())
            names.push_back(name);
    }
    return names;
}
