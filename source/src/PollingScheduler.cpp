#include "PollingScheduler.hpp"

#include <print>
#include <vector>
#include <future>
#include <stdexcept>

PollingScheduler::~PollingScheduler() {
    stop();
}

void PollingScheduler::start(SnapshotCallback on_snapshot) {
    if (_running.exchange(true)) return;

    _stopped = false;
    _on_snapshot = std::move(on_snapshot);

    boost::asio::co_spawn(_strand, poll_loop(), [this](std::exception_ptr ep) {
        if (ep) {
            try { std::rethrow_exception(ep); }
            catch (const std::exception& e) { std::println(stderr, "poll loop ended: {}", e.what()); }
        }
        on_loop_exit();
    });
}

void PollingScheduler::on_loop_exit() {
    // notify under the lock, the waiter may destroy us as soon as it wakes
    std::scoped_lock lock(_done_mutex);
    _running = false;
    _done_cv.notify_all();
}

void PollingScheduler::request_stop() {
    _stopped = true;

    if (!running()) return;

    if (_strand.running_in_this_thread()) _timer.cancel();
    else boost::asio::post(_strand, [this] { _timer.cancel(); });
}

void PollingScheduler::stop() {
    bool was_running = running();
    request_stop();

    if (!was_running || _strand.running_in_this_thread()) return;

    // the cancel queued above has to run before we may go away
    std::promise<void> drained;
    auto done = drained.get_future();
    boost::asio::post(_strand, [&drained] { drained.set_value(); });
    done.wait();

    std::unique_lock lock(_done_mutex);
    _done_cv.wait(lock, [this] { return !_running.load(); });
}

boost::asio::awaitable<void> PollingScheduler::poll_loop() {
    using clock = std::chrono::steady_clock;

    auto next_tick = clock::now();

    while (!_stopped) {
        auto started = clock::now();

        auto results = co_await run_cycle();
        auto snap = _aggregator.merge(results, std::chrono::system_clock::now());

        ++_cycles;
        log_cycle(*snap, clock::now() - started);

        if (_on_snapshot) _on_snapshot(snap);

        next_tick += _options.period;

        // ticks that fell inside the cycle are dropped, not queued
        auto now = clock::now();
        if (next_tick <= now) {
            auto missed = (now - next_tick) / _options.period + 1;
            _skipped += static_cast<uint64_t>(missed);
            next_tick += missed * _options.period;

            std::println("cycle overran the {}ms period, skipped {} tick(s)", _options.period.count(), missed);
        }

        if (_stopped) break;

        boost::system::error_code ec;
        _timer.expires_at(next_tick);
        co_await _timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

boost::asio::awaitable<std::unordered_map<std::string, ProbeResult>> PollingScheduler::run_cycle() {
    const auto& targets = _registry.targets();

    std::vector<ProbeResult> results(targets.size());
    size_t pending = targets.size();

    // parked until the last probe reports in
    boost::asio::steady_timer barrier(_strand, boost::asio::steady_timer::time_point::max());

    for (size_t i = 0; i < targets.size(); ++i) {
        boost::asio::co_spawn(_strand, probe_one(targets[i]), [&, i](std::exception_ptr ep, ProbeResult result) {
            if (ep) result = ProbeResult{ false, FailureKind::Unknown, "probe aborted", std::nullopt };

            results[i] = std::move(result);
            if (--pending == 0) barrier.cancel();
        });
    }

    if (pending > 0) {
        boost::system::error_code ec;
        co_await barrier.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    std::unordered_map<std::string, ProbeResult> out;
    out.reserve(targets.size());

    for (size_t i = 0; i < targets.size(); ++i) out.emplace(targets[i].address, std::move(results[i]));

    co_return out;
}

boost::asio::awaitable<ProbeResult> PollingScheduler::probe_one(const Target& target) {
    // one bad target never takes the cycle down with it
    try {
        co_return co_await _prober.probe(target, _options.probe_timeout);
    }
    catch (const std::exception& e) {
        co_return ProbeResult{ false, FailureKind::Unknown, e.what(), std::nullopt };
    }
}

void PollingScheduler::log_cycle(const FleetSnapshot& snap, std::chrono::steady_clock::duration took) const {
    std::println("cycle {}: {}/{} online in {}ms", snap.cycle, snap.online_count, snap.total_count,
        std::chrono::duration_cast<std::chrono::milliseconds>(took).count());

    for (const auto& status: snap.statuses) {
        if (status.online()) continue;

        std::println("  {} ({}) offline: {}", status.target.display_name, status.target.address,
            to_string(status.last_result.failure_reason.value_or(FailureKind::Unknown)));
    }
}
