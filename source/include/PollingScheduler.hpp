#pragma once

#include "Target.hpp"
#include "ProbeExecutor.hpp"
#include "StatusAggregator.hpp"

#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <unordered_map>
#include <condition_variable>

#include <boost/asio.hpp>

struct SchedulerOptions {
    std::chrono::milliseconds period{10000};
    std::chrono::milliseconds probe_timeout{1000};
};

// strand owned
//
// first cycle runs right away, then one per period; a tick that lands while
// a cycle is still running is skipped, cycles never overlap

class PollingScheduler {
public:
    PollingScheduler(boost::asio::any_io_executor exec, const TargetRegistry& registry, ProbeExecutor& prober, StatusAggregator& aggregator, SchedulerOptions options = {}):
        _strand(boost::asio::make_strand(exec)),
        _timer(_strand),
        _registry(registry),
        _prober(prober),
        _aggregator(aggregator),
        _options(options)
    {
        if (_options.period <= std::chrono::milliseconds::zero()) throw std::invalid_argument("Polling period must be positive");
    }

    ~PollingScheduler();

    PollingScheduler(const PollingScheduler&) = delete;
    PollingScheduler& operator=(const PollingScheduler&) = delete;

    void start(SnapshotCallback on_snapshot = {});

    // no new cycle starts after this; an in-flight cycle finishes and is
    // published. Returns at once.
    void request_stop();

    // request_stop, then from outside the strand block until the loop
    // exited. The executor must be running on another thread for that.
    void stop();

    bool running() const { return _running.load(std::memory_order_acquire); }
    uint64_t cycles_completed() const { return _cycles.load(); }
    uint64_t ticks_skipped() const { return _skipped.load(); }

private:
    [[nodiscard]] boost::asio::awaitable<void> poll_loop();
    [[nodiscard]] boost::asio::awaitable<std::unordered_map<std::string, ProbeResult>> run_cycle();
    [[nodiscard]] boost::asio::awaitable<ProbeResult> probe_one(const Target& target);

    void on_loop_exit();
    void log_cycle(const FleetSnapshot& snap, std::chrono::steady_clock::duration took) const;

    boost::asio::strand<boost::asio::any_io_executor> _strand;
    boost::asio::steady_timer _timer;

    const TargetRegistry& _registry;
    ProbeExecutor& _prober;
    StatusAggregator& _aggregator;
    SchedulerOptions _options;

    SnapshotCallback _on_snapshot;

    std::atomic<bool> _stopped{false}, _running{false};
    std::atomic<uint64_t> _cycles{0}, _skipped{0};

    std::mutex _done_mutex;
    std::condition_variable _done_cv;
};
