#pragma once

#include "ProbeExecutor.hpp"
#include "PingTransport.hpp"
#include "ServiceChecker.hpp"

#include <boost/asio.hpp>

// ping and service check of one target, started together and joined
// before the result is handed back

class HostProber : public ProbeExecutor {
public:
    HostProber(boost::asio::thread_pool& ping_pool, PingTransport& transport, ServiceChecker checker = ServiceChecker{}):
        _ping_pool(ping_pool),
        _transport(transport),
        _checker(checker)
    {}

    boost::asio::awaitable<ProbeResult> probe(const Target& target, std::chrono::milliseconds timeout) override;

private:
    [[nodiscard]] boost::asio::awaitable<ProbeResult> reachability(const Target& target, std::chrono::milliseconds timeout);
    [[nodiscard]] boost::asio::awaitable<ServiceStatus> service(const Target& target);

    boost::asio::thread_pool& _ping_pool;
    PingTransport& _transport;
    ServiceChecker _checker;
};
