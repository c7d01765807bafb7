#include <util/parse_uri.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace util {

namespace {

std::string lowercase(std::string value) {
    std::transform(std::begin(value), std::end(value), std::begin(value),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string default_port(std::string const &protocol) {
    if(protocol == "https")
        return "443";
    return "80";
}

} // namespace

ParsedURI parse_uri(std::string const &url) {
    ParsedURI result;

    auto const scheme_end = url.find("://");
    if(scheme_end == std::string::npos or scheme_end == 0)
        throw std::invalid_argument{ "url has no scheme: '" + url + "'" };

    result.protocol = lowercase(url.substr(0, scheme_end));

    auto rest = url.substr(scheme_end + 3);
    if(auto const fragment = rest.find('#'); fragment != std::string::npos)
        rest.erase(fragment);

    auto const authority_end = rest.find_first_of("/?");
    auto authority           = rest.substr(0, authority_end);
    auto tail                = authority_end == std::string::npos ? std::string{} : rest.substr(authority_end);

    // credentials in the authority are not supported, drop them
    if(auto const at = authority.rfind('@'); at != std::string::npos)
        authority.erase(0, at + 1);

    if(not authority.empty() and authority.front() == '[') {
        auto const close = authority.find(']');
        if(close == std::string::npos)
            throw std::invalid_argument{ "malformed ipv6 host in url: '" + url + "'" };
        result.domain = authority.substr(1, close - 1);
        if(close + 1 < authority.size() and authority[close + 1] == ':')
            result.port = authority.substr(close + 2);
    } else if(auto const colon = authority.rfind(':'); colon != std::string::npos) {
        result.domain = authority.substr(0, colon);
        result.port   = authority.substr(colon + 1);
    } else {
        result.domain = authority;
    }

    if(result.domain.empty())
        throw std::invalid_argument{ "url has no host: '" + url + "'" };
    if(result.port.empty())
        result.port = default_port(result.protocol);

    if(auto const question = tail.find('?'); question != std::string::npos) {
        result.query = tail.substr(question + 1);
        tail.erase(question);
    }

    result.resource = tail.empty() ? "/" : tail;
    return result;
}

}; // namespace util
