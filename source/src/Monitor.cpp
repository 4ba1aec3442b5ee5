#include "Monitor.hpp"

#include <print>
#include <algorithm>

Monitor::Monitor(MonitorConfig config):
    _config(std::move(config)),
    _ping_pool(std::max<size_t>(1, _config.targets.size())),
    _signals(_ioc, SIGINT, SIGTERM),
    _registry(_config.targets),
    _ping(_config.ping_command),
    _prober(_ping_pool, _ping, ServiceChecker{ _config.service_timeout }),
    _aggregator(_registry),
    _scheduler(_ioc.get_executor(), _registry, _prober, _aggregator, SchedulerOptions{ _config.period, _config.probe_timeout }),
    _clipboard(_config.clipboard_command.empty() ? CommandClipboard::default_command() : _config.clipboard_command),
    _copy_handler(_ioc.get_executor(), _clipboard_pool, _registry, _aggregator, _clipboard, _config.copy_feedback),
    _server(_ioc.get_executor(), _config.api_port, _aggregator, _copy_handler)
    {
        if (_registry.empty()) throw std::runtime_error("No targets configured");
    }

void Monitor::run() {
    std::println("monitoring {} target(s) every {}s", _registry.size(),
        std::chrono::duration_cast<std::chrono::seconds>(_config.period).count());

    for (const auto& target: _registry.targets()) {
        if (target.service_check) std::println("  {} ({}), service on :{} matching \"{}\"", target.display_name, target.address, target.service_check->port, target.service_check->match_hint);
        else std::println("  {} ({})", target.display_name, target.address);
    }

    _signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        std::println("signal {} received, shutting down", signo);
        shutdown();
    });

    _server.run();
    _scheduler.start([this](std::shared_ptr<const FleetSnapshot> snap) { on_snapshot(*snap); });

    _ioc.run();

    _ping_pool.join();
    _clipboard_pool.join();
    std::println("stopped after {} cycle(s)", _scheduler.cycles_completed());
}

void Monitor::shutdown() {
    // runs on the io thread, nothing here may block
    _scheduler.request_stop();
    _copy_handler.shutdown();
    _server.stop();

    boost::system::error_code ec;
    _signals.cancel(ec);
}

void Monitor::on_snapshot(const FleetSnapshot& snap) {
    bool all_up = snap.online_count == snap.total_count;

    if (all_up != _all_up || snap.cycle == 1) {
        std::println("fleet {}: {}/{} online", all_up ? "healthy" : "degraded", snap.online_count, snap.total_count);
    }

    _all_up = all_up;
}
