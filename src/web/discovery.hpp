#pragma once

#include <flow/endpoints.hpp>
#include <reporting/events.hpp>
#include <web/concepts.hpp>
#include <web/http.hpp>

#include <di.hpp>
#include <fmt/compile.h>
#include <fmt/format.h>
#include <inja/inja.hpp>

#include <stdexcept>
#include <string>
#include <vector>

// the server's openid configuration could not be fetched or lacks required keys
struct DiscoveryError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct DiscoveryResult {
    std::string issuer;
    EndpointMap endpoints; // every string *_endpoint member plus issuer and jwks_uri
    inja::json document;
};

// <base>/.well-known/openid-configuration
std::string discovery_url(std::string const &base_url);

/**
 * @brief Reads an openid configuration document
 *
 * @param body raw response body
 * @return DiscoveryResult
 * @throws DiscoveryError when the body is not a json object or a required key is missing
 */
DiscoveryResult parse_discovery_document(std::string const &body);

// names of configured defaults the server did not advertise, in name order
std::vector<std::string> undiscovered(EndpointMap const &discovered, EndpointMap const &defaults);

template <HttpFetcher FetcherType, typename ReportEngineType>
class Discovery {
    using fetcher_t   = FetcherType;
    using reporting_t = ReportEngineType;
    using services_t  = di::Deps<fetcher_t, reporting_t>;

    services_t services_;

public:
    Discovery(services_t services)
        : services_{ services } { }

    // throws DiscoveryError
    DiscoveryResult discover(std::string const &base_url, EndpointMap const &defaults) {
        auto const url = discovery_url(base_url);
        report(SimpleEvent{ "DISCOVERY", url });

        HttpResponse response;
        try {
            auto const &fetcher = services_.template get<fetcher_t>();
            response            = fetcher.get().fetch(HttpRequest{ "GET", url, {}, "" });
        } catch(TransportError const &e) {
            throw DiscoveryError{ fmt::format("discovery at {} failed: {}", url, e.what()) };
        }

        if(not response.ok())
            throw DiscoveryError{ fmt::format("discovery at {} answered HTTP {} {}", url, response.status, response.reason) };

        auto result = parse_discovery_document(response.body);
        report(SimpleEvent{ "DISCOVERED", fmt::format("{} endpoints from issuer {}", result.endpoints.size(), result.issuer) });

        for(auto const &name : undiscovered(result.endpoints, defaults))
            report(SimpleEvent{ "DEFAULT", fmt::format("{} not advertised, using {}", name, defaults.at(name)) });

        return result;
    }

private:
    void report(auto &&ev) {
        auto const &reporting = services_.template get<reporting_t>();
        reporting.get().record(std::move(ev));
    }
};
