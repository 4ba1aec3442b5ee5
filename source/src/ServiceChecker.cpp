#include "ServiceChecker.hpp"

#include <format>

namespace {

    ServiceStatus check_failed(std::string detail) {
        return ServiceStatus{ false, FailureKind::ServiceCheckFailed, std::move(detail) };
    }
}

boost::urls::url ServiceChecker::build_url(const std::string& address, uint16_t port) {
    boost::urls::url url;

    url.set_scheme("http");

    // v6 literals need brackets, everything else is a host name or v4
    boost::system::error_code ec;
    auto v6 = net::ip::make_address_v6(address, ec);

    if (!ec) url.set_host_ipv6(boost::urls::ipv6_address(v6.to_bytes()));
    else url.set_host(address);

    url.set_port_number(port);
    url.set_path("/");

    return url;
}

boost::asio::awaitable<ServiceStatus> ServiceChecker::check(const std::string& address, const ServiceCheckSpec& spec) {
    auto url = build_url(address, spec.port);
    auto text = std::string(url.buffer());

    auto status = co_await finish_within(fetch(std::move(url), spec.match_hint, _timeout), _timeout);

    if (!status) co_return check_failed(std::format("{} timed out after {}ms", text, _timeout.count()));

    co_return std::move(*status);
}

boost::asio::awaitable<ServiceStatus> ServiceChecker::fetch(boost::urls::url url, std::string match_hint, std::chrono::milliseconds timeout) {
    auto executor = co_await net::this_coro::executor;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    boost::system::error_code ec;

    tcp::resolver resolver(executor);
    boost::beast::tcp_stream stream(executor);

    // host() keeps the brackets off a v6 literal
    auto host = url.host_type() == boost::urls::host_type::ipv6
        ? url.host_ipv6_address().to_string()
        : std::string(url.host());

    auto results = co_await resolver.async_resolve(host, std::to_string(url.port_number()), net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return check_failed(ec.message());

    // bounds the rest of a fetch the caller may already have given up on
    stream.expires_at(deadline);

    co_await stream.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return check_failed(ec.message());

    http::request<http::empty_body> req { http::verb::get, url.encoded_target(), 11 };
    req.set(http::field::host, url.encoded_host_and_port());
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.set(http::field::connection, "close");

    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, ec));
    if (ec) co_return check_failed(ec.message());

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(BODY_LIMIT);

    co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));

    if (ec) co_return check_failed(ec.message());

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    const auto& res = parser.get();
    bool present = res.body().find(match_hint) != std::string::npos;

    co_return ServiceStatus{
        present,
        std::nullopt,
        present ? std::format("HTTP {}, found \"{}\"", res.result_int(), match_hint)
                : std::format("HTTP {}, \"{}\" not in response", res.result_int(), match_hint)
    };
}
