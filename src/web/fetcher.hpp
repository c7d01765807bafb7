#pragma once

#include <web/http.hpp>

#include <chrono>
#include <string>

/**
 * @brief A synchronous http/https client issuing one request per connection
 *
 * Every phase after name resolution (connect, tls handshake, write, read) is
 * bounded by the timeout. Anything that prevents an http response from being
 * read is reported as TransportError; non-2xx responses are returned as is.
 */
class OnDemandFetcher {
    std::chrono::seconds timeout_;
    std::string user_agent_;
    bool verify_tls_;

public:
    OnDemandFetcher(std::chrono::seconds timeout, std::string user_agent, bool verify_tls = true);

    /**
     * @brief Sends the request and blocks until the full response is read
     *
     * @param request
     * @return HttpResponse
     * @throws TransportError
     */
    HttpResponse fetch(HttpRequest const &request) const;

private:
    HttpResponse fetch_plain(HttpRequest const &request) const;
    HttpResponse fetch_tls(HttpRequest const &request) const;
};
