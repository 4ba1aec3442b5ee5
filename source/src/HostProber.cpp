#include "HostProber.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>

using namespace boost::asio::experimental::awaitable_operators;

boost::asio::awaitable<ProbeResult> HostProber::probe(const Target& target, std::chrono::milliseconds timeout) {
    if (!target.service_check) co_return co_await reachability(target, timeout);

    // independent signals, the service check runs even when ping fails
    auto [result, status] = co_await (reachability(target, timeout) && service(target));

    result.service_status = std::move(status);
    co_return result;
}

boost::asio::awaitable<ProbeResult> HostProber::reachability(const Target& target, std::chrono::milliseconds timeout) {
    try {
        // the ping utility blocks, keep it off the io thread
        auto output = co_await boost::asio::co_spawn(
            _ping_pool,
            [this, address = target.address, timeout]() -> boost::asio::awaitable<PingOutput> {
                co_return _transport.ping(address, timeout);
            },
            boost::asio::use_awaitable
        );

        co_return evaluate_ping(output);
    }
    catch (const std::exception& e) {
        co_return ProbeResult{ false, FailureKind::Unknown, e.what(), std::nullopt };
    }
}

boost::asio::awaitable<ServiceStatus> HostProber::service(const Target& target) {
    try {
        co_return co_await _checker.check(target.address, *target.service_check);
    }
    catch (const std::exception& e) {
        co_return ServiceStatus{ false, FailureKind::ServiceCheckFailed, e.what() };
    }
}
