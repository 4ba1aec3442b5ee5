#pragma once

#include <string>
#include <memory>

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/json.hpp>

namespace http = boost::beast::http;

class StatusAggregator;
class CopyActionHandler;
struct FleetSnapshot;

// json view of the fleet for whatever surface renders it
//   GET  /api/status
//   POST /api/targets/<address>/copy

class HttpServer {
public:
    HttpServer(boost::asio::any_io_executor exec, unsigned short port, StatusAggregator& aggregator, CopyActionHandler& copy_handler);

    void run(); // start accepting connections asynchronously
    void stop();

    unsigned short port() const { return _port; }

    static boost::json::object snapshot_to_json(const FleetSnapshot& snap);

private:
    // connection handler coroutine
    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> handle_connection(boost::asio::ip::tcp::socket socket);

    // request handling
    boost::asio::awaitable<void> handle_request(const http::request<http::string_body>& req,
                                                http::response<http::string_body>& res);

    boost::asio::awaitable<void> handle_api(const http::request<http::string_body>& req,
                                            http::response<http::string_body>& res);
    void fetch_status(http::response<http::string_body>& res);
    boost::asio::awaitable<void> handle_copy(http::response<http::string_body>& res, std::string address);

    void write_json(http::response<http::string_body>& res, http::status status, const boost::json::value& body);

private:
    boost::asio::any_io_executor _exec;
    unsigned short _port;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> _acceptor;

    StatusAggregator& _aggregator;
    CopyActionHandler& _copy_handler;
};
