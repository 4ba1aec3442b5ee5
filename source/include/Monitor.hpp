#pragma once

#include "Config.hpp"
#include "Target.hpp"
#include "PingTransport.hpp"
#include "HostProber.hpp"
#include "StatusAggregator.hpp"
#include "PollingScheduler.hpp"
#include "CopyActionHandler.hpp"
#include "Clipboard.hpp"
#include "server.hpp"

#include <memory>

#include <boost/asio.hpp>

// wires the engine together on one io_context and runs it until a signal

class Monitor {
public:
    explicit Monitor(MonitorConfig config);

    void run();
    void shutdown();

    const TargetRegistry& registry() const { return _registry; }
    StatusAggregator& aggregator() { return _aggregator; }
    CopyActionHandler& copy_handler() { return _copy_handler; }

private:
    void on_snapshot(const FleetSnapshot& snap);

    MonitorConfig _config;

    boost::asio::io_context _ioc;
    boost::asio::thread_pool _ping_pool; // blocking ping processes
    boost::asio::thread_pool _clipboard_pool{1};
    boost::asio::signal_set _signals;

    TargetRegistry _registry;

    SystemPing _ping;
    HostProber _prober;
    StatusAggregator _aggregator;
    PollingScheduler _scheduler;

    CommandClipboard _clipboard;
    CopyActionHandler _copy_handler;

    HttpServer _server;

    bool _all_up = false;
};
