#pragma once

#include "Target.hpp"
#include "ProbeResult.hpp"

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

struct TargetStatus {
    Target target;

    // written by poll cycles
    ProbeResult last_result{};
    std::optional<std::chrono::system_clock::time_point> last_checked_at = std::nullopt;

    // written by the copy action, never by a poll
    bool copy_feedback_active = false;

    // set by the aggregator for offline targets only
    std::optional<std::string> troubleshooting = std::nullopt;

    bool online() const { return last_result.reachable; }
    bool checked() const { return last_checked_at.has_value(); }
};

struct FleetSnapshot {
    std::vector<TargetStatus> statuses; // registry order

    uint32_t online_count{}, total_count{};

    uint64_t cycle{}; // merges so far

    std::chrono::system_clock::time_point published_at{};
};
