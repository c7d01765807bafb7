#pragma once

#include <string>

namespace util {

// taken from https://github.com/boostorg/beast/issues/787 as a workaround of not having boost.url
struct ParsedURI {
    std::string protocol;
    std::string domain; // only domain must be present
    std::string port;   // defaults to the protocol's well-known port
    std::string resource;
    std::string query; // everything after '?', possibly nothing
};

/**
 * @brief Splits an absolute http(s) url into its parts
 *
 * @param url
 * @return ParsedURI
 * @throws std::invalid_argument if the url has no scheme or no host
 */
ParsedURI parse_uri(std::string const &url);

}; // namespace util
