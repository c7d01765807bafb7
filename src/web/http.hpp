#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string url;
    std::vector<Header> headers;
    std::string body;

    bool operator==(HttpRequest const &) const = default;
};

struct HttpResponse {
    unsigned status = 0;
    std::string reason;
    std::vector<Header> headers;
    std::string body;

    [[nodiscard]] bool ok() const {
        return status >= 200 and status < 300;
    }
};

// the request never produced an http response: resolve, connect, tls, timeout
struct TransportError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};
