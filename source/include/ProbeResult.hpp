#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <string_view>

enum class FailureKind: uint8_t {
    HostUnreachable = 0,
    ProbeToolUnavailable,
    InvalidAddress,
    ServiceCheckFailed,
    Unknown
};

struct ServiceStatus {
    bool present = false;
    std::optional<FailureKind> failure_reason = std::nullopt;

    std::string detail{}; // error text or response summary
};

struct ProbeResult {
    bool reachable = false;
    std::optional<FailureKind> failure_reason = std::nullopt;

    std::string raw_detail{};

    std::optional<ServiceStatus> service_status = std::nullopt;
};

std::string_view to_string(FailureKind kind);

// human readable advice shown next to an offline target
std::string_view troubleshooting_message(FailureKind kind);
