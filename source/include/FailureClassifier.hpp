#pragma once

#include "ProbeResult.hpp"
#include "Utils.hpp"

#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

// what the ping utility left behind, independent of how it was run
using PingOutput = ProcessOutput;

struct PingReport {
    std::optional<uint32_t> transmitted = std::nullopt;
    std::optional<double> loss_percent = std::nullopt;
};

// scans "N packets transmitted" and "X% packet loss" out of the summary block
PingReport parse_ping_report(std::string_view text);

// precedence: unreachable, tool unavailable, invalid address, unknown
FailureKind classify_failure(std::string_view error_text, std::string_view output_text);

// reachable iff the tool ran cleanly, sent exactly one packet and got it back
ProbeResult evaluate_ping(const PingOutput& output);
