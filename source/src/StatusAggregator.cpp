#include "StatusAggregator.hpp"

#include <format>
#include <stdexcept>

StatusAggregator::StatusAggregator(const TargetRegistry& registry): _registry(registry), _entries(registry.size()) {
    std::scoped_lock lock(_mutex);
    _latest = rebuild();
}

size_t StatusAggregator::index_or_throw(const std::string& address) const {
    auto index = _registry.index_of(address);
    if (!index) throw std::out_of_range(std::format("Unknown target: {}", address));
    return *index;
}

std::shared_ptr<const FleetSnapshot> StatusAggregator::merge(const std::unordered_map<std::string, ProbeResult>& results, std::chrono::system_clock::time_point checked_at) {
    // resolve everything first so a bad key leaves the state untouched
    std::vector<std::pair<size_t, const ProbeResult*>> updates;
    updates.reserve(results.size());

    for (const auto& [address, result]: results) updates.emplace_back(index_or_throw(address), &result);

    // held through delivery so subscribers see publishes in build order
    std::scoped_lock publish(_publish_mutex);

    std::shared_ptr<const FleetSnapshot> snap;
    {
        std::scoped_lock lock(_mutex);

        for (auto [index, result]: updates) {
            auto& poll = _entries[index].poll;

            // a late batch must not move the clock backwards
            if (poll && checked_at < poll->last_checked_at) continue;

            poll = PollFields{ *result, checked_at };
        }

        ++_cycles;
        snap = _latest = rebuild();
    }

    notify(snap);
    return snap;
}

void StatusAggregator::record_copy_feedback(const std::string& address) {
    set_copy_feedback(address, true);
}

void StatusAggregator::clear_copy_feedback(const std::string& address) {
    set_copy_feedback(address, false);
}

void StatusAggregator::set_copy_feedback(const std::string& address, bool active) {
    auto index = index_or_throw(address);

    std::scoped_lock publish(_publish_mutex);

    std::shared_ptr<const FleetSnapshot> snap;
    {
        std::scoped_lock lock(_mutex);

        if (_entries[index].copy_feedback_active == active) return;

        _entries[index].copy_feedback_active = active;
        snap = _latest = rebuild();
    }

    notify(snap);
}

std::optional<bool> StatusAggregator::copy_feedback_active(const std::string& address) const {
    auto index = _registry.index_of(address);
    if (!index) return std::nullopt;

    std::scoped_lock lock(_mutex);
    return _entries[*index].copy_feedback_active;
}

std::shared_ptr<const FleetSnapshot> StatusAggregator::snapshot() const {
    std::scoped_lock lock(_mutex);
    return _latest;
}

void StatusAggregator::subscribe(SnapshotCallback callback) {
    std::scoped_lock lock(_subscriber_mutex);
    _subscribers.push_back(std::move(callback));
}

std::shared_ptr<const FleetSnapshot> StatusAggregator::rebuild() {
    auto snap = std::make_shared<FleetSnapshot>();

    snap->statuses.reserve(_entries.size());
    snap->total_count = static_cast<uint32_t>(_entries.size());
    snap->cycle = _cycles;
    snap->published_at = std::chrono::system_clock::now();

    for (size_t i = 0; i < _entries.size(); ++i) {
        const auto& entry = _entries[i];

        TargetStatus ts{ _registry.at(i) };
        ts.copy_feedback_active = entry.copy_feedback_active;

        if (entry.poll) {
            ts.last_result = entry.poll->last_result;
            ts.last_checked_at = entry.poll->last_checked_at;

            if (!ts.last_result.reachable) {
                ts.troubleshooting = std::string(troubleshooting_message(ts.last_result.failure_reason.value_or(FailureKind::Unknown)));
            }
        }

        if (ts.online()) ++snap->online_count;

        snap->statuses.push_back(std::move(ts));
    }

    return snap;
}

void StatusAggregator::notify(const std::shared_ptr<const FleetSnapshot>& snapshot) {
    std::vector<SnapshotCallback> subscribers;
    {
        std::scoped_lock lock(_subscriber_mutex);
        subscribers = _subscribers;
    }

    for (const auto& callback: subscribers) callback(snapshot);
}
