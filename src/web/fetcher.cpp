#include <util/parse_uri.hpp>
#include <web/fetcher.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <fmt/compile.h>
#include <fmt/format.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

namespace {

void throw_on_error(beast::error_code const &ec, std::string_view what) {
    if(ec == beast::error::timeout or ec == net::error::operation_aborted)
        throw TransportError{ fmt::format("{} timed out", what) };
    if(ec)
        throw TransportError{ fmt::format("{} failed: {}", what, ec.message()) };
}

// starts one async operation and drives the context until it completes.
// the stream deadline (expires_after) turns a stalled operation into error::timeout.
template <typename Initiate>
void run_one(net::io_context &ioc, std::string_view what, Initiate &&initiate) {
    beast::error_code ec;
    initiate([&ec](beast::error_code e, auto &&...) { ec = e; });
    ioc.restart();
    ioc.run();
    throw_on_error(ec, what);
}

tcp::resolver::results_type resolve(net::io_context &ioc, util::ParsedURI const &uri, std::chrono::seconds timeout) {
    tcp::resolver resolver{ ioc };
    std::optional<beast::error_code> outcome;
    tcp::resolver::results_type results;

    resolver.async_resolve(uri.domain, uri.port,
        [&outcome, &results](beast::error_code ec, tcp::resolver::results_type r) {
            outcome = ec;
            results = std::move(r);
        });

    ioc.restart();
    ioc.run_for(timeout);
    if(not outcome) {
        resolver.cancel();
        ioc.restart();
        ioc.run();
        throw TransportError{ fmt::format("resolving '{}' timed out", uri.domain) };
    }

    throw_on_error(*outcome, fmt::format("resolving '{}'", uri.domain));
    return results;
}

http::verb to_verb(std::string const &method) {
    auto const verb = http::string_to_verb(method);
    if(verb == http::verb::unknown)
        throw TransportError{ fmt::format("unsupported http method '{}'", method) };
    return verb;
}

http::request<http::string_body> make_request(HttpRequest const &request, util::ParsedURI const &uri, std::string const &user_agent) {
    auto target = uri.resource;
    if(not uri.query.empty())
        target += '?' + uri.query;

    auto const default_port = uri.protocol == "https" ? "443" : "80";
    auto const host         = uri.port == default_port ? uri.domain : uri.domain + ':' + uri.port;

    http::request<http::string_body> req{ to_verb(request.method), target, 11 };
    req.set(http::field::host, host);
    req.set(http::field::user_agent, user_agent);
    req.set(http::field::accept, "application/json");
    for(auto const &[name, value] : request.headers)
        req.set(name, value);

    if(not request.body.empty() or req.method() == http::verb::post or req.method() == http::verb::put) {
        req.body() = request.body;
        req.prepare_payload();
    }
    return req;
}

HttpResponse to_response(http::response<http::string_body> &&res) {
    HttpResponse response;
    response.status = res.result_int();
    response.reason = std::string{ res.reason() };
    for(auto const &field : res)
        response.headers.emplace_back(std::string{ field.name_string() }, std::string{ field.value() });
    response.body = std::move(res.body());
    return response;
}

util::ParsedURI parse_target(std::string const &url) {
    try {
        return util::parse_uri(url);
    } catch(std::invalid_argument const &e) {
        throw TransportError{ e.what() };
    }
}

} // namespace

OnDemandFetcher::OnDemandFetcher(std::chrono::seconds timeout, std::string user_agent, bool verify_tls)
    : timeout_{ timeout }
    , user_agent_{ std::move(user_agent) }
    , verify_tls_{ verify_tls } { }

HttpResponse OnDemandFetcher::fetch(HttpRequest const &request) const {
    try {
        auto const uri = parse_target(request.url);
        if(uri.protocol == "https")
            return fetch_tls(request);
        if(uri.protocol == "http")
            return fetch_plain(request);
        throw TransportError{ fmt::format("unsupported url scheme '{}'", uri.protocol) };
    } catch(TransportError const &) {
        throw;
    } catch(std::exception const &e) {
        throw TransportError{ fmt::format("{} {}: {}", request.method, request.url, e.what()) };
    }
}

HttpResponse OnDemandFetcher::fetch_plain(HttpRequest const &request) const {
    auto const uri = parse_target(request.url);
    auto req       = make_request(request, uri, user_agent_);

    net::io_context ioc;
    auto const results = resolve(ioc, uri, timeout_);

    beast::tcp_stream stream{ ioc };
    stream.expires_after(timeout_);
    run_one(ioc, "connect", [&](auto handler) { stream.async_connect(results, std::move(handler)); });

    stream.expires_after(timeout_);
    run_one(ioc, "write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(timeout_);
    run_one(ioc, "read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if(ec and ec != beast::errc::not_connected)
        throw TransportError{ fmt::format("shutdown failed: {}", ec.message()) };

    return to_response(std::move(res));
}

// basically taken from the sync ssl example, with deadlines on every phase
HttpResponse OnDemandFetcher::fetch_tls(HttpRequest const &request) const {
    auto const uri = parse_target(request.url);
    auto req       = make_request(request, uri, user_agent_);

    net::io_context ioc;
    ssl::context ctx(ssl::context::tlsv12_client);
    if(verify_tls_) {
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);
    } else {
        ctx.set_verify_mode(ssl::verify_none);
    }

    auto const results = resolve(ioc, uri, timeout_);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    if(!SSL_set_tlsext_host_name(stream.native_handle(), uri.domain.data())) {
        beast::error_code ec{ static_cast<int>(::ERR_get_error()), net::error::get_ssl_category() };
        throw TransportError{ fmt::format("tls setup failed: {}", ec.message()) };
    }
    if(verify_tls_)
        stream.set_verify_callback(ssl::host_name_verification(uri.domain));

    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_one(ioc, "connect", [&](auto handler) { beast::get_lowest_layer(stream).async_connect(results, std::move(handler)); });

    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_one(ioc, "tls handshake", [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });

    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_one(ioc, "write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_one(ioc, "read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

    // servers commonly drop the connection without close_notify once the response is sent
    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(timeout_);
    stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
    ioc.restart();
    ioc.run();
    if(ec == net::error::eof or ec == ssl::error::stream_truncated or ec == beast::error::timeout)
        ec = {};
    if(ec)
        throw TransportError{ fmt::format("tls shutdown failed: {}", ec.message()) };

    return to_response(std::move(res));
}
