#pragma once

#include <map>
#include <string>

// endpoint name (e.g. token_endpoint) -> absolute url
using EndpointMap = std::map<std::string, std::string>;

// session input name (e.g. api_key) -> value
using InputMap = std::map<std::string, std::string>;

/**
 * @brief Makes configured default endpoints absolute
 *
 * Defaults starting with '/' are joined to the server base url; anything
 * else is taken to be absolute already.
 *
 * @throws std::invalid_argument when a relative default meets an empty base url
 */
EndpointMap resolve_default_endpoints(EndpointMap const &defaults, std::string const &base_url);
