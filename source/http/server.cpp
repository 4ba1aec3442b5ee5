#include "server.hpp"
#include "StatusAggregator.hpp"
#include "CopyActionHandler.hpp"
#include "FleetSnapshot.hpp"
#include "Utils.hpp"

#include <print>
#include <ranges>
#include <vector>

#include <boost/url.hpp>

using tcp = boost::asio::ip::tcp;
using namespace boost::asio;

HttpServer::HttpServer(boost::asio::any_io_executor exec, unsigned short port, StatusAggregator& aggregator, CopyActionHandler& copy_handler)
    : _exec(exec), _port(port), _aggregator(aggregator), _copy_handler(copy_handler) {}

// -------------------- serialization --------------------

boost::json::object HttpServer::snapshot_to_json(const FleetSnapshot& snap) {
    boost::json::array arr; arr.reserve(snap.statuses.size());

    for (const auto& status: snap.statuses) {
        boost::json::object obj;

        obj["name"] = status.target.display_name;
        obj["address"] = status.target.address;
        obj["online"] = status.online();
        obj["copied"] = status.copy_feedback_active;

        if (status.last_checked_at) obj["last_checked"] = format_clock_time(*status.last_checked_at);
        else obj["last_checked"] = nullptr;

        if (status.troubleshooting) obj["troubleshooting"] = *status.troubleshooting;
        else obj["troubleshooting"] = nullptr;

        if (status.last_result.failure_reason) obj["failure"] = std::string(to_string(*status.last_result.failure_reason));

        if (status.last_result.service_status) {
            const auto& svc = *status.last_result.service_status;
            boost::json::object service;

            service["present"] = svc.present;
            service["detail"] = svc.detail;
            if (svc.failure_reason) service["failure"] = std::string(to_string(*svc.failure_reason));

            obj["service"] = std::move(service);
        }

        arr.push_back(std::move(obj));
    }

    boost::json::object out;
    out["online"] = snap.online_count;
    out["total"] = snap.total_count;
    out["cycle"] = snap.cycle;
    out["targets"] = std::move(arr);

    return out;
}

// -------------------- request handling --------------------

void HttpServer::write_json(http::response<http::string_body>& res, http::status status, const boost::json::value& body) {
    res.result(status);
    res.set(http::field::content_type, "application/json");
    res.body() = boost::json::serialize(body);
    res.prepare_payload();
}

awaitable<void> HttpServer::handle_request(const http::request<http::string_body>& req,
                                           http::response<http::string_body>& res) {
    std::string_view target = req.target();

    if (target.starts_with("/api/"))
        co_return co_await handle_api(req, res);

    write_json(res, http::status::not_found, boost::json::object{ {"status", "error"}, {"message", "Not found"} });
}

awaitable<void> HttpServer::handle_api(const http::request<http::string_body>& req,
                                       http::response<http::string_body>& res) {

    auto path = boost::urls::parse_origin_form(req.target());
    if (!path) {
        write_json(res, http::status::bad_request, boost::json::object{ {"status", "error"}, {"message", "Bad request target"} });
        co_return;
    }

    // decoded segments so v6 addresses survive percent encoding
    std::vector<std::string> args;
    for (auto seg: path->segments()) args.push_back(seg);

    if (req.method() == http::verb::get) {
        if (args.size() == 2 && args[1] == "status") {
            fetch_status(res);
            co_return;
        }
    }

    if (req.method() == http::verb::post) {
        if (args.size() == 4 && args[1] == "targets" && args[3] == "copy") co_return co_await handle_copy(res, args[2]);
    }

    write_json(res, http::status::not_found, boost::json::object{ {"status", "error"}, {"message", "Unknown API endpoint"} });
}

void HttpServer::fetch_status(http::response<http::string_body>& res) {
    auto snap = _aggregator.snapshot();
    write_json(res, http::status::ok, snapshot_to_json(*snap));
}

awaitable<void> HttpServer::handle_copy(http::response<http::string_body>& res, std::string address) {
    auto result = co_await _copy_handler.copy_address(std::move(address));

    boost::json::object obj;
    obj["status"]  = result.ok() ? "ok" : "error";
    obj["address"] = result.address;
    obj["message"] = result.message;

    http::status status = http::status::ok;
    switch (result.status) {
        case CopyStatus::Ok:            status = http::status::ok; break;
        case CopyStatus::UnknownTarget: status = http::status::not_found; break;
        case CopyStatus::SinkFailed:    status = http::status::internal_server_error; break;
    }

    write_json(res, status, obj);
}

// -------------------- async accept loop --------------------

awaitable<void> HttpServer::accept_loop() {
    for (;;) {
        boost::system::error_code ec;
        tcp::socket socket = co_await _acceptor->async_accept(redirect_error(use_awaitable, ec));

        if (ec == error::operation_aborted || !_acceptor->is_open()) co_return;
        if (ec) continue;

        co_spawn(_exec, handle_connection(std::move(socket)), detached);
    }
}

awaitable<void> HttpServer::handle_connection(tcp::socket socket) {
    try {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;

        co_await http::async_read(socket, buffer, req, use_awaitable);

        http::response<http::string_body> res{ http::status::ok, req.version() };
        res.keep_alive(false);
        co_await handle_request(req, res);

        co_await http::async_write(socket, res, use_awaitable);

        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_send, ec);
    }
    catch (const std::exception& e) {
        std::println(stderr, "Connection error: {}", e.what());
    }
}

// -------------------- entry point --------------------

void HttpServer::run() {
    _acceptor = std::make_unique<tcp::acceptor>(_exec, tcp::endpoint(ip::make_address_v4("127.0.0.1"), _port));
    _port = _acceptor->local_endpoint().port();

    std::println("Running at http://localhost:{}", _port);

    co_spawn(_exec, accept_loop(), detached);
}

void HttpServer::stop() {
    boost::system::error_code ec;
    if (_acceptor) _acceptor->close(ec);
}
