#pragma once

#include "Target.hpp"
#include "FleetSnapshot.hpp"

#include <mutex>
#include <memory>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_map>

using SnapshotCallback = std::function<void(std::shared_ptr<const FleetSnapshot>)>;

// owns the per-target state; poll merges and copy feedback write disjoint
// fields of the same entries under one lock, readers get immutable copies

class StatusAggregator {
public:
    explicit StatusAggregator(const TargetRegistry& registry);

    std::shared_ptr<const FleetSnapshot> merge(const std::unordered_map<std::string, ProbeResult>& results, std::chrono::system_clock::time_point checked_at);

    void record_copy_feedback(const std::string& address);
    void clear_copy_feedback(const std::string& address);

    // latest published snapshot, never null
    std::shared_ptr<const FleetSnapshot> snapshot() const;

    // callbacks run on the publishing thread, one publish at a time and in
    // the order the snapshots were built
    void subscribe(SnapshotCallback callback);

    std::optional<bool> copy_feedback_active(const std::string& address) const;

private:
    struct PollFields {
        ProbeResult last_result;
        std::chrono::system_clock::time_point last_checked_at;
    };

    struct Entry {
        std::optional<PollFields> poll;
        bool copy_feedback_active = false;
    };

    size_t index_or_throw(const std::string& address) const;
    void set_copy_feedback(const std::string& address, bool active);

    // called with _mutex held
    std::shared_ptr<const FleetSnapshot> rebuild();

    // called with _publish_mutex held and _mutex released: subscribers may
    // read back into the aggregator but must not publish from the callback
    void notify(const std::shared_ptr<const FleetSnapshot>& snapshot);

    const TargetRegistry& _registry;

    std::mutex _publish_mutex; // orders build plus delivery, taken before _mutex
    mutable std::mutex _mutex;
    std::vector<Entry> _entries; // parallel to the registry
    std::shared_ptr<const FleetSnapshot> _latest;
    uint64_t _cycles{};

    std::mutex _subscriber_mutex;
    std::vector<SnapshotCallback> _subscribers;
};
